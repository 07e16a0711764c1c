//
//  config.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <system_error>
#include <type_traits>

using json = nlohmann::json;

namespace subforge {

namespace {

template <typename T> void read_positive(const json &j, const char *key, T &field) {
    if (!j.contains(key)) {
        return;
    }
    const auto &v = j[key];
    if (!v.is_number() || !(v.template get<double>() > 0)) {
        throw std::invalid_argument(std::string("'") + key + "' must be a positive number");
    }
    const double d = v.template get<double>();
    if (std::is_integral<T>::value &&
        (d < 1 || !(d < static_cast<double>(std::numeric_limits<T>::max())))) {
        throw std::invalid_argument(std::string("'") + key + "' is out of range");
    }
    field = v.template get<T>();
}

}  // namespace

Status load_config(const std::string &path, SubforgeConfig &cfg) {
    std::ifstream f(path);
    if (!f.is_open()) {
        SF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return make_error(ErrorKind::Validation, "Cannot open config file: " + path);
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return make_error(ErrorKind::Validation, "Config file is not a JSON object: " + path);
    }

    SubforgeConfig next = cfg;
    try {
        read_positive(j, "max_upload_bytes", next.max_upload_bytes);
        read_positive(j, "max_items_per_request", next.max_items_per_request);
        read_positive(j, "max_tokens_per_batch", next.max_tokens_per_batch);
        read_positive(j, "chars_per_token", next.chars_per_token);
        read_positive(j, "stream_window", next.stream_window);
        read_positive(j, "sub_fps", next.sub_fps);
        next.brand_suffix = j.value("brand_suffix", next.brand_suffix);
        if (j.contains("rate_limit")) {
            const auto &rl = j["rate_limit"];
            if (!rl.is_object()) {
                throw std::invalid_argument("'rate_limit' must be an object");
            }
            read_positive(rl, "max_requests", next.rate_limit_max);
            read_positive(rl, "window_ms", next.rate_limit_window_ms);
        }
        if (j.contains("gemini")) {
            const auto &g = j["gemini"];
            if (!g.is_object()) {
                throw std::invalid_argument("'gemini' must be an object");
            }
            next.gemini_model = g.value("model", next.gemini_model);
            next.gemini_endpoint = g.value("endpoint", next.gemini_endpoint);
            read_positive(g, "timeout_seconds", next.gemini_timeout_seconds);
        }
        if (j.contains("log_level")) {
            next.log_level = parse_log_verbosity(j.value("log_level", std::string()));
        }
    } catch (const std::exception &e) {
        return make_error(ErrorKind::Validation,
                          "Invalid config file " + path + ": " + e.what());
    }

    Status st = validate_config(next);
    if (!st.ok) {
        return st;
    }
    cfg = std::move(next);
    SF_LOG("info", "loaded config " << path);
    return ok_status();
}

void apply_env(SubforgeConfig &cfg) {
    if (const char *key = std::getenv("SUBFORGE_API_KEY"); key && *key) {
        cfg.api_key = key;
    } else if (const char *fallback = std::getenv("GEMINI_API_KEY"); fallback && *fallback) {
        cfg.api_key = fallback;
    }
    if (const char *level = std::getenv("SUBFORGE_LOG_LEVEL"); level && *level) {
        cfg.log_level = parse_log_verbosity(level);
    }
}

Status validate_config(const SubforgeConfig &cfg) {
    if (cfg.max_upload_bytes == 0 || cfg.max_items_per_request == 0 ||
        cfg.max_tokens_per_batch == 0 || cfg.chars_per_token == 0 || cfg.stream_window == 0) {
        return make_error(ErrorKind::Validation, "Limits must be positive");
    }
    if (cfg.rate_limit_max == 0 || cfg.rate_limit_window_ms <= 0) {
        return make_error(ErrorKind::Validation, "Rate limit must be positive");
    }
    if (!(cfg.sub_fps > 0)) {
        return make_error(ErrorKind::Validation, "Frame rate must be positive");
    }
    if (cfg.gemini_timeout_seconds <= 0 || cfg.gemini_model.empty() ||
        cfg.gemini_endpoint.empty()) {
        return make_error(ErrorKind::Validation, "Invalid provider settings");
    }
    return ok_status();
}

GeminiSettings gemini_settings(const SubforgeConfig &cfg) {
    GeminiSettings s;
    s.model = cfg.gemini_model;
    s.endpoint = cfg.gemini_endpoint;
    s.timeout_seconds = cfg.gemini_timeout_seconds;
    return s;
}

}  // namespace subforge
