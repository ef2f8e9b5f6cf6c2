//
//  logging.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <cctype>

namespace id3forge {

std::optional<LogVerbosity> log_verbosity_from_string(std::string_view name) {
    std::string s(name);
    for (auto &c : s) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (s == "debug") return LogVerbosity::Debug;
    if (s == "info") return LogVerbosity::Info;
    if (s == "warn" || s == "warning") return LogVerbosity::Warn;
    if (s == "error" || s == "err") return LogVerbosity::Error;
    return std::nullopt;
}

std::string_view log_verbosity_name(LogVerbosity level) {
    switch (level) {
        case LogVerbosity::Error:
            return "error";
        case LogVerbosity::Warn:
            return "warn";
        case LogVerbosity::Info:
            return "info";
        case LogVerbosity::Debug:
            return "debug";
    }
    return "info";
}

void Logger::log(const char *level, const std::string &msg, const char *file, int line,
                 const char *func) {
    const std::string lvl(level ? level : "");
    if (severity_for_tag(lvl) == LogVerbosity::Warn) {
        ++warnings_;
    }
    if (lvl == "error") {
        *sink_ << "[ID3Forge][" << lvl << "][" << file << ":" << line << " " << func << "] "
               << msg << std::endl;
    } else {
        *sink_ << "[ID3Forge][" << lvl << "] " << msg << std::endl;
    }
}

}  // namespace id3forge
