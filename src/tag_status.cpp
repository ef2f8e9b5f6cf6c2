//
//  tag_status.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tag_status.hpp"

namespace id3forge {

std::string_view tag_error_name(TagError error) {
    switch (error) {
        case TagError::None:
            return "none";
        case TagError::OpenFailed:
            return "open-failed";
        case TagError::ShortRead:
            return "short-read";
        case TagError::BadMagic:
            return "bad-magic";
        case TagError::BadFrameId:
            return "bad-frame-id";
        case TagError::WriteFailed:
            return "write-failed";
        case TagError::RenameFailed:
            return "rename-failed";
        case TagError::NoSourcePath:
            return "no-source-path";
    }
    return "unknown";
}

}  // namespace id3forge
