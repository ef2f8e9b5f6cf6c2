//
//  id3forge.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "logging.hpp"
#include "tag_file.hpp"
#include "tag_status.hpp"

namespace id3forge {

/// @defgroup api ID3Forge Public API
/// Public, supported C++ interfaces for reading and rewriting ID3v2 tags.
/// @{

/**
 * @brief Return the ID3Forge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/// English ordinal suffix: 1 -> "st", 2 -> "nd", 3 -> "rd", everything else "th".
std::string_view ordinal_suffix(uint32_t n);  ///< @ingroup api

/**
 * @brief User-facing text for a failed frame lookup.
 *
 * @param frame_id ID that was searched for.
 * @param requested 1-based index the user asked for.
 * @param match_count Number of frames with that ID (FrameLookup::match_count).
 * @param verb What was attempted ("remove", "edit").
 */
std::string lookup_failure_message(std::string_view frame_id, uint32_t requested,
                                   uint32_t match_count,
                                   std::string_view verb);  ///< @ingroup api

/**
 * @brief JSON document describing the tag: version, header flags, size and frames.
 *
 * Each frame carries id, description (when known), encoding, size, flags and data.
 */
std::string tag_to_json(const TagFile &tag, int indent = 2);  ///< @ingroup api

/// @}

}  // namespace id3forge
