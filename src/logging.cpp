//
//  logging.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <mutex>

namespace subforge {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

static std::mutex g_sink_mutex;
static LogSink g_sink;

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

LogVerbosity parse_log_verbosity(const std::string &s) {
    if (s == "debug") return LogVerbosity::Debug;
    if (s == "info") return LogVerbosity::Info;
    if (s == "warn" || s == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

bool emit_to_sink(const std::string &tag, const std::string &line) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (!g_sink) {
        return false;
    }
    g_sink(tag, line);
    return true;
}

}  // namespace subforge
