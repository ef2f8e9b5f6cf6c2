//
//  tag_status.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace id3forge {

enum class TagError {
    None,
    OpenFailed,    ///< source file could not be opened
    ShortRead,     ///< input ended inside the header, extended header or a frame
    BadMagic,      ///< header does not start with "ID3"
    BadFrameId,    ///< frame ID bytes are not ASCII
    WriteFailed,   ///< output could not be created or written
    RenameFailed,  ///< temporary file could not replace the target
    NoSourcePath,  ///< save() on a tag that was not opened from a path
};

std::string_view tag_error_name(TagError error);

/**
 * @brief Result object with success flag, failure reason and message.
 *
 * When `ok == true`, `error` is `TagError::None` and `message` is empty.
 */
struct TagStatus {
    bool ok{false};
    TagError error{TagError::None};
    std::string message;
};

inline TagStatus tag_ok() { return TagStatus{true, TagError::None, {}}; }

inline TagStatus tag_failure(TagError error, std::string message) {
    return TagStatus{false, error, std::move(message)};
}

}  // namespace id3forge
