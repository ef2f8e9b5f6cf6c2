//
//  tag_file.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "logging.hpp"
#include "tag_frame.hpp"
#include "tag_header.hpp"
#include "tag_options.hpp"
#include "tag_status.hpp"

namespace id3forge {

// Outcome of a search for the Nth frame with a given ID.
struct FrameLookup {
    bool found = false;
    size_t position = 0;       ///< index into frames() when found
    uint32_t match_count = 0;  ///< frames with that ID seen (all of them when not found)
};

// Shown by render() for a tag without frames.
inline constexpr std::string_view kNoFramesLine = "(no frames)";

/**
 * @brief One MP3 file's ID3v2 tag: header, ordered frames and the audio that follows.
 *
 * After open() the source stream is kept and remembers where the audio starts;
 * write_to()/save() append everything from that offset verbatim.
 */
class TagFile {
   public:
    explicit TagFile(Logger &log, TagOptions options = {});

    TagFile(const TagFile &) = delete;
    TagFile &operator=(const TagFile &) = delete;

    // Open and parse the tag of the file at `path`.
    TagStatus open(const std::string &path);

    // Parse from an already opened stream (no path; save() is unavailable).
    TagStatus open(std::unique_ptr<std::istream> source);

    const TagHeader &header() const { return header_; }
    const std::vector<Frame> &frames() const { return frames_; }
    const std::string &path() const { return path_; }
    const TagOptions &options() const { return options_; }
    FrameSizeConvention frame_size_convention() const {
        return header_.frame_size_convention(options_.frame_size);
    }

    // `occurrence` is 0-based among frames sharing `id`.
    FrameLookup lookup(std::string_view id, uint32_t occurrence) const;

    // Append a frame; fails with TagError::BadFrameId unless `id` is four A-Z/0-9 characters.
    TagStatus add(std::string id, std::string data);
    FrameLookup edit(std::string_view id, uint32_t occurrence, std::string data);
    FrameLookup remove(std::string_view id, uint32_t occurrence);

    // One "ID [FLAGS ]DATA" line per frame, joined by '\n'.
    std::string render(bool show_flags, bool human_readable) const;

    // Frames (header + payload each) plus the extended header.
    uint64_t compute_tag_size() const;

    // Header, frames, then the original audio bytes.
    TagStatus write_to(std::ostream &out);

    // Replace the opened file through a temporary file and rename.
    TagStatus save();

    // Write to `dest` through a temporary file next to it.
    TagStatus save_as(const std::string &dest);

#ifdef ID3FORGE_TESTING
    // Make the reopen that follows the next in-place save fail.
    void fail_next_reopen_for_test() { fail_next_reopen_ = true; }
#endif

   private:
    TagStatus load();
    void discard_temp(const std::string &temp);

    Logger &log_;
    TagOptions options_;
    TagHeader header_;
    std::vector<Frame> frames_;
    std::unique_ptr<std::istream> source_;
    std::string path_;
    std::streampos audio_offset_ = 0;
    bool fail_next_reopen_ = false;
};

}  // namespace id3forge
