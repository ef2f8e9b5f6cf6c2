//
//  config.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

namespace id3forge {

std::optional<TextWritePolicy> text_policy_from_string(std::string_view name) {
    if (name == "preserve") return TextWritePolicy::Preserve;
    if (name == "utf16" || name == "utf-16") return TextWritePolicy::Utf16;
    return std::nullopt;
}

std::optional<FrameSizeMode> frame_size_mode_from_string(std::string_view name) {
    if (name == "auto") return FrameSizeMode::Auto;
    if (name == "syncsafe") return FrameSizeMode::Syncsafe;
    if (name == "big-endian" || name == "bigendian") return FrameSizeMode::BigEndian;
    return std::nullopt;
}

bool merge_config_json(const std::string &text, Config &config, Logger &log) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error &e) {
        ID3F_LOG(log, "error", "config is not valid JSON: " << e.what());
        return false;
    }
    if (!j.is_object()) {
        ID3F_LOG(log, "error", "config must be a JSON object");
        return false;
    }

    auto string_field = [&](const char *key) -> std::optional<std::string> {
        if (!j.contains(key)) {
            return std::nullopt;
        }
        if (!j[key].is_string()) {
            ID3F_LOG(log, "warn", "config key \"" << key << "\" must be a string, ignoring");
            return std::nullopt;
        }
        return j[key].get<std::string>();
    };

    if (auto v = string_field("log_level")) {
        if (auto level = log_verbosity_from_string(*v)) {
            config.log_level = *level;
        } else {
            ID3F_LOG(log, "warn", "unknown log_level \"" << *v << "\" in config, ignoring");
        }
    }
    if (auto v = string_field("text_encoding")) {
        if (auto policy = text_policy_from_string(*v)) {
            config.tag.text_policy = *policy;
        } else {
            ID3F_LOG(log, "warn", "unknown text_encoding \"" << *v << "\" in config, ignoring");
        }
    }
    if (auto v = string_field("frame_size")) {
        if (auto mode = frame_size_mode_from_string(*v)) {
            config.tag.frame_size = *mode;
        } else {
            ID3F_LOG(log, "warn", "unknown frame_size \"" << *v << "\" in config, ignoring");
        }
    }
    return true;
}

bool merge_config_file(const std::string &path, Config &config, Logger &log) {
    std::ifstream f(path);
    if (!f.is_open()) {
        ID3F_LOG(log, "error", "open failed for " << path << " errno=" << errno << " ("
                                                  << std::generic_category().message(errno)
                                                  << ")");
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    ID3F_LOG(log, "debug", "loading config from " << path);
    return merge_config_json(ss.str(), config, log);
}

bool apply_environment(Config &config, Logger &log, const std::string &cli_config_path) {
    if (const char *path = std::getenv(kConfigEnvVar); path && *path) {
        if (!merge_config_file(path, config, log)) {
            ID3F_LOG(log, "warn", "ignoring " << kConfigEnvVar << "=" << path);
        }
    }
    if (!cli_config_path.empty() && !merge_config_file(cli_config_path, config, log)) {
        return false;
    }
    if (const char *level = std::getenv(kLogLevelEnvVar); level && *level) {
        if (auto v = log_verbosity_from_string(level)) {
            config.log_level = *v;
        } else {
            ID3F_LOG(log, "warn", kLogLevelEnvVar << "=" << level << " is not a log level");
        }
    }
    return true;
}

}  // namespace id3forge
