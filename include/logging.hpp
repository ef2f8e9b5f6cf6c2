//
//  logging.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace id3forge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Parse "error", "warn"/"warning", "info", "debug" (case-insensitive).
std::optional<LogVerbosity> log_verbosity_from_string(std::string_view name);

std::string_view log_verbosity_name(LogVerbosity level);

inline constexpr LogVerbosity severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return LogVerbosity::Warn;
    }
    if (tag == "info") {
        return LogVerbosity::Info;
    }
    // Everything else (io/parser/frame/etc.) treated as debug-level.
    return LogVerbosity::Debug;
}

/**
 * @brief Leveled diagnostic sink shared by the tag codec.
 *
 * Constructed once at startup from configuration and handed to the components by
 * reference. Messages go to `sink` (stderr by default).
 */
class Logger {
   public:
    explicit Logger(LogVerbosity level = LogVerbosity::Info, std::ostream &sink = std::cerr)
        : level_(level), sink_(&sink) {}

    void set_verbosity(LogVerbosity level) { level_ = level; }
    LogVerbosity verbosity() const { return level_; }

    bool should_log(const char *level) const {
        const auto sev = severity_for_tag(level ? level : "");
        return static_cast<int>(sev) <= static_cast<int>(level_);
    }

    void log(const char *level, const std::string &msg, const char *file, int line,
             const char *func);

    // Number of warnings emitted so far (filtered ones are not counted).
    size_t warning_count() const { return warnings_; }

   private:
    LogVerbosity level_;
    std::ostream *sink_;
    size_t warnings_ = 0;
};

// Hex-preview helper used in debug logs to dump a short prefix of binary blobs (frame payloads).
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t> &data,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace id3forge

#define ID3F_LOG(logger, level, message)                                    \
    do {                                                                    \
        if ((logger).should_log(level)) {                                   \
            std::ostringstream _id3f_log_ss;                                \
            _id3f_log_ss << message;                                        \
            (logger).log(level, _id3f_log_ss.str(), __FILE__, __LINE__,     \
                         __func__);                                         \
        }                                                                   \
    } while (0)
