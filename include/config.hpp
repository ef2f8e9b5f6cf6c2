//
//  config.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "logging.hpp"
#include "tag_options.hpp"

namespace id3forge {

// Environment variables consulted by apply_environment().
inline constexpr const char *kConfigEnvVar = "ID3FORGE_CONFIG";
inline constexpr const char *kLogLevelEnvVar = "ID3FORGE_LOG";

/**
 * @brief Runtime configuration.
 *
 * JSON form:
 * @code
 * { "log_level": "warn", "text_encoding": "preserve", "frame_size": "auto" }
 * @endcode
 * Unknown keys are ignored; invalid values are reported and leave the default.
 */
struct Config {
    LogVerbosity log_level = LogVerbosity::Info;
    TagOptions tag;
};

std::optional<TextWritePolicy> text_policy_from_string(std::string_view name);
std::optional<FrameSizeMode> frame_size_mode_from_string(std::string_view name);

// Merge settings from JSON text into `config`. False on a JSON syntax error.
bool merge_config_json(const std::string &text, Config &config, Logger &log);

// Merge settings from a JSON file. False if the file cannot be read or parsed.
bool merge_config_file(const std::string &path, Config &config, Logger &log);

// Apply ID3FORGE_CONFIG (file) and ID3FORGE_LOG (level) when set.
// Merge the file named by ID3FORGE_CONFIG, then `cli_config_path` (if any), then
// the ID3FORGE_LOG level. Only a failing `cli_config_path` returns false.
bool apply_environment(Config &config, Logger &log, const std::string &cli_config_path = {});

}  // namespace id3forge
