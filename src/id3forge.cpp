//
//  id3forge.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "id3forge.hpp"
#include "id3forge_version.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

#include "frame_id.hpp"

using json = nlohmann::json;

namespace id3forge {

std::string version_string() { return ID3FORGE_VERSION_DISPLAY; }

std::string_view ordinal_suffix(uint32_t n) {
    if (n == 1) return "st";
    if (n == 2) return "nd";
    if (n == 3) return "rd";
    return "th";
}

std::string lookup_failure_message(std::string_view frame_id, uint32_t requested,
                                   uint32_t match_count, std::string_view verb) {
    std::ostringstream oss;
    if (match_count == 0) {
        oss << "No frame found with id \"" << frame_id << "\"";
        return oss.str();
    }
    if (match_count == 1) {
        oss << "There is only 1 frame with id \"" << frame_id << "\"";
    } else {
        oss << "There are only " << match_count << " frames with id \"" << frame_id << "\"";
    }
    oss << ". You tried to " << verb << " the " << requested << ordinal_suffix(requested);
    return oss.str();
}

namespace {

json frame_flags_json(const FrameFlags &f) {
    json j;
    j["tag_alter_preservation"] = f.tag_alter_preservation;
    j["file_alter_preservation"] = f.file_alter_preservation;
    j["read_only"] = f.read_only;
    j["compression"] = f.compression;
    j["encryption"] = f.encryption;
    j["grouping_identity"] = f.grouping_identity;
    return j;
}

}  // namespace

std::string tag_to_json(const TagFile &tag, int indent) {
    const TagHeader &h = tag.header();
    json j;
    j["version"] = {h.major_version(), h.revision()};
    j["flags"] = {{"experimental", h.flags.has_experimental_indicator},
                  {"extended_header", h.flags.has_extended_header},
                  {"unsynchronization", h.flags.has_unsynchronization}};
    j["size"] = h.size;

    json frames = json::array();
    for (const auto &f : tag.frames()) {
        json c;
        c["id"] = f.id;
        if (auto desc = frame_description(f.id)) {
            c["description"] = std::string(*desc);
        }
        c["encoding"] = std::string(encoding_name(f.encoding));
        c["size"] = f.size;
        c["flags"] = frame_flags_json(f.flags);
        c["data"] = f.data;
        frames.push_back(c);
    }
    j["frames"] = frames;
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace id3forge
