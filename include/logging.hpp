//
//  logging.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace chaptify {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

}  // namespace chaptify

inline constexpr chaptify::LogVerbosity cy_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return chaptify::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return chaptify::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return chaptify::LogVerbosity::Info;
    }
    // catalog/probe/match/remux etc. are debug-level.
    return chaptify::LogVerbosity::Debug;
}

inline bool cy_should_log(const char* level) {
    const auto current = chaptify::get_log_verbosity();
    const auto sev = cy_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

// Writes one line to stderr; a single insertion keeps lines from worker threads intact.
inline void cy_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::ostringstream out;
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        out << "[Chaptify][" << lvl << "][" << file << ":" << line << " " << func << "] " << msg
            << "\n";
    } else {
        out << "[Chaptify][" << lvl << "] " << msg << "\n";
    }
    std::cerr << out.str() << std::flush;
}

#define CY_LOG(level, message)                                              \
    do {                                                                    \
        if (cy_should_log(level)) {                                         \
            std::ostringstream _cy_log_ss;                                  \
            _cy_log_ss << message;                                          \
            cy_log_impl(level, _cy_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
