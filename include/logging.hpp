//
//  logging.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace subforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Map a CLI/config string ("debug", "info", "warn", ...) to a verbosity; unknown -> Error.
LogVerbosity parse_log_verbosity(const std::string &s);

// Optional capture of formatted log lines (tests, embedding hosts). Pass an empty
// function to restore stderr output.
using LogSink = std::function<void(const std::string &tag, const std::string &line)>;
void set_log_sink(LogSink sink);
bool emit_to_sink(const std::string &tag, const std::string &line);

// Debug-log helper: first max_len bytes of a text payload with newlines flattened.
inline constexpr size_t kTextPreviewBytes = 80;
inline std::string text_preview(const std::string &text, size_t max_len = kTextPreviewBytes) {
    std::string out = text.substr(0, max_len);
    for (auto &c : out) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    if (text.size() > max_len) {
        out += "...";
    }
    return out;
}

}  // namespace subforge

inline constexpr subforge::LogVerbosity sf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return subforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return subforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return subforge::LogVerbosity::Info;
    }
    // Component tags (parser/codec/optimizer/stream/ratelimit/http) are debug-level.
    return subforge::LogVerbosity::Debug;
}

inline bool sf_should_log(const char *level) {
    const auto current = subforge::get_log_verbosity();
    const auto sev = sf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void sf_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    std::ostringstream out;
    if (lvl == "error") {
        out << "[SubForge][" << lvl << "][" << file << ":" << line << " " << func << "] " << msg;
    } else {
        out << "[SubForge][" << lvl << "] " << msg;
    }
    if (!subforge::emit_to_sink(lvl, out.str())) {
        std::cerr << out.str() << std::endl;
    }
}

#define SF_LOG(level, message)                                              \
    do {                                                                    \
        if (sf_should_log(level)) {                                         \
            std::ostringstream _sf_log_ss;                                  \
            _sf_log_ss << message;                                          \
            sf_log_impl(level, _sf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
