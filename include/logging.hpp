//
//  logging.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace tafforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Hex preview of the bytes found at a file offset, for diagnostics such as a missing capture
// pattern: "@4096: 4f 67 67 53".
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_preview(const uint8_t* data, size_t size, uint64_t offset,
                               size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << '@' << offset << ':' << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, size);
    for (size_t i = 0; i < limit; ++i) {
        oss << ' ' << std::setw(2) << static_cast<unsigned int>(data[i]);
    }
    if (size > limit) {
        oss << " ...";
    }
    return oss.str();
}

}  // namespace tafforge

inline constexpr tafforge::LogVerbosity tf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return tafforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return tafforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return tafforge::LogVerbosity::Info;
    }
    // Everything else (ogg/header/split/etc.) treated as debug-level.
    return tafforge::LogVerbosity::Debug;
}

inline bool tf_should_log(const char* level) {
    const auto current = tafforge::get_log_verbosity();
    const auto sev = tf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void tf_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[TafForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[TafForge][" << level << "] " << msg << std::endl;
    }
}

#define TF_LOG(level, message)                                              \
    do {                                                                    \
        if (tf_should_log(level)) {                                         \
            std::ostringstream _tf_log_ss;                                  \
            _tf_log_ss << message;                                          \
            tf_log_impl(level, _tf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
