//
//  tag_file.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tag_file.hpp"

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "byte_stream.hpp"
#include "frame_id.hpp"
#include "int_codec.hpp"

namespace id3forge {

namespace fs = std::filesystem;

void TagFile::discard_temp(const std::string &temp) {
    std::error_code ec;
    if (!fs::remove(temp, ec) && ec) {
        ID3F_LOG(log_, "warn", "could not remove " << temp << ": " << ec.message());
    }
}

TagFile::TagFile(Logger &log, TagOptions options) : log_(log), options_(options) {}

TagStatus TagFile::open(const std::string &path) {
    auto f = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!f->is_open()) {
        const int err = errno;
        ID3F_LOG(log_, "error", "open failed for " << path << " errno=" << err << " ("
                                                   << std::generic_category().message(err)
                                                   << ")");
        return tag_failure(TagError::OpenFailed, "could not open " + path + ": " +
                                                     std::generic_category().message(err));
    }
    source_ = std::move(f);
    path_ = path;
    return load();
}

TagStatus TagFile::open(std::unique_ptr<std::istream> source) {
    source_ = std::move(source);
    path_.clear();
    return load();
}

TagStatus TagFile::load() {
    frames_.clear();
    TagStatus status;
    auto header = parse_tag_header(*source_, log_, status);
    if (!header) {
        return status;
    }
    header_ = std::move(*header);

    const FrameSizeConvention convention = frame_size_convention();
    ID3F_LOG(log_, "debug", "frame sizes read as "
                                << (convention == FrameSizeConvention::Syncsafe ? "syncsafe"
                                                                                : "big-endian"));
    // No frame count in the format: stop at the first bytes that are not a frame ID
    // (padding or audio).
    while (next_is_frame(*source_)) {
        auto frame = parse_frame(*source_, convention, log_, status);
        if (!frame) {
            frames_.clear();
            return status;
        }
        frames_.push_back(std::move(*frame));
    }
    audio_offset_ = source_->tellg();
    ID3F_LOG(log_, "debug", "parsed " << frames_.size() << " frames, audio starts at "
                                      << static_cast<long long>(audio_offset_));
    return tag_ok();
}

FrameLookup TagFile::lookup(std::string_view id, uint32_t occurrence) const {
    FrameLookup result;
    for (size_t i = 0; i < frames_.size(); ++i) {
        if (frames_[i].id != id) {
            continue;
        }
        if (result.match_count == occurrence) {
            result.found = true;
            result.position = i;
            return result;
        }
        ++result.match_count;
    }
    return result;
}

TagStatus TagFile::add(std::string id, std::string data) {
    if (!is_valid_frame_id(id)) {
        ID3F_LOG(log_, "error", "refusing to add frame with invalid id \"" << id << "\"");
        return tag_failure(TagError::BadFrameId, "invalid frame id \"" + id + "\"");
    }
    ID3F_LOG(log_, "debug", "adding frame " << id);
    frames_.push_back(Frame::from_user_input(std::move(id), std::move(data)));
    return tag_ok();
}

FrameLookup TagFile::edit(std::string_view id, uint32_t occurrence, std::string data) {
    FrameLookup hit = lookup(id, occurrence);
    if (hit.found) {
        frames_[hit.position].edit_data(std::move(data));
    }
    return hit;
}

FrameLookup TagFile::remove(std::string_view id, uint32_t occurrence) {
    FrameLookup hit = lookup(id, occurrence);
    if (hit.found) {
        frames_.erase(frames_.begin() + static_cast<std::ptrdiff_t>(hit.position));
    }
    return hit;
}

std::string TagFile::render(bool show_flags, bool human_readable) const {
    if (frames_.empty()) {
        return std::string(kNoFramesLine);
    }
    std::string out;
    for (size_t i = 0; i < frames_.size(); ++i) {
        const Frame &f = frames_[i];
        if (i != 0) {
            out += '\n';
        }
        out += f.id;
        out += ' ';
        if (show_flags) {
            const std::string flags =
                human_readable ? f.flags.format_human() : f.flags.format_compact();
            if (!flags.empty()) {
                out += flags;
                out += ' ';
            }
        }
        out += f.data;
    }
    return out;
}

uint64_t TagFile::compute_tag_size() const {
    uint64_t total = header_.extended_header.size();
    for (const auto &f : frames_) {
        total += kFrameHeaderSize + f.encoded_size(options_.text_policy);
    }
    return total;
}

TagStatus TagFile::write_to(std::ostream &out) {
    if (!source_) {
        return tag_failure(TagError::WriteFailed, "no tag has been opened");
    }
    const uint64_t tag_size = compute_tag_size();
    if (tag_size > kSyncsafeMax) {
        ID3F_LOG(log_, "error", "tag size " << tag_size << " exceeds the syncsafe range");
        return tag_failure(TagError::WriteFailed, "tag too large for a syncsafe size field");
    }

    const FrameSizeConvention convention = frame_size_convention();
    bool ok = header_.write(out, static_cast<uint32_t>(tag_size));
    for (const auto &f : frames_) {
        if (!ok) {
            break;
        }
        ok = f.write(out, convention, options_.text_policy);
    }
    if (!ok) {
        ID3F_LOG(log_, "error", "failed to write tag");
        return tag_failure(TagError::WriteFailed, "failed to write tag");
    }

    source_->clear();
    source_->seekg(audio_offset_);
    if (!*source_) {
        ID3F_LOG(log_, "error", "could not seek back to the audio data");
        return tag_failure(TagError::ShortRead, "could not reposition source at audio data");
    }
    const auto copied = copy_remaining(*source_, out);
    if (!copied) {
        ID3F_LOG(log_, "error", "failed to copy audio data");
        return tag_failure(TagError::WriteFailed, "failed to copy audio data");
    }
    ID3F_LOG(log_, "debug", "wrote tag of " << tag_size << " bytes, copied " << *copied
                                            << " audio bytes");
    return tag_ok();
}

TagStatus TagFile::save() {
    if (path_.empty()) {
        return tag_failure(TagError::NoSourcePath, "tag was not opened from a file");
    }
    return save_as(path_);
}

TagStatus TagFile::save_as(const std::string &dest) {
    const std::string temp = dest + ".temp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            const int err = errno;
            ID3F_LOG(log_, "error", "open failed for " << temp << " errno=" << err << " ("
                                                       << std::generic_category().message(err)
                                                       << ")");
            return tag_failure(TagError::WriteFailed, "could not create " + temp);
        }
        TagStatus status = write_to(out);
        if (status.ok) {
            out.flush();
            if (!out.good()) {
                status = tag_failure(TagError::WriteFailed, "failed to flush " + temp);
            }
        }
        if (!status.ok) {
            out.close();
            discard_temp(temp);
            return status;
        }
    }

    std::error_code ec;
    if (fs::exists(dest, ec)) {
        fs::permissions(temp, fs::status(dest, ec).permissions(), ec);
        if (ec) {
            ID3F_LOG(log_, "warn", "could not copy permissions of " << dest << ": "
                                                                    << ec.message());
        }
    }
    fs::rename(temp, dest, ec);
    if (ec) {
        ID3F_LOG(log_, "error", "rename " << temp << " -> " << dest << " failed: "
                                          << ec.message());
        discard_temp(temp);
        return tag_failure(TagError::RenameFailed, "could not replace " + dest);
    }
    ID3F_LOG(log_, "debug", "renamed " << temp << " -> " << dest);

    if (dest == path_) {
        // The old handle still points at the replaced file; follow the new one.
        const uint64_t tag_size = compute_tag_size();
        if (options_.text_policy == TextWritePolicy::Utf16) {
            for (auto &f : frames_) {
                f.payload = f.encoded_payload(TextWritePolicy::Utf16);
                f.size = static_cast<uint32_t>(f.payload.size());
                f.encoding = TextEncoding::Utf16BigEndian;
            }
        }
        header_.size = static_cast<uint32_t>(tag_size);
        auto f = std::make_unique<std::ifstream>(dest, std::ios::binary);
        if (fail_next_reopen_) {
            fail_next_reopen_ = false;
            f->close();
        }
        if (!f->is_open()) {
            // The tag is already on disk; only this object lost its audio source.
            ID3F_LOG(log_, "warn", "saved " << dest << " but could not reopen it, open it again "
                                                       "before saving once more");
            source_.reset();
            return tag_ok();
        }
        audio_offset_ = static_cast<std::streamoff>(kTagHeaderSize + tag_size);
        source_ = std::move(f);
    }
    return tag_ok();
}

}  // namespace id3forge
