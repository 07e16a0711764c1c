//
//  config.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "format_parser.hpp"
#include "format_serializer.hpp"
#include "gemini_client.hpp"
#include "logging.hpp"
#include "rate_limiter.hpp"
#include "status.hpp"
#include "streaming_emitter.hpp"
#include "token_batch_planner.hpp"

namespace subforge {

/**
 * @brief Process-wide settings, layered: defaults, then JSON file, then environment,
 * then command-line flags.
 *
 * Example file (every key optional):
 * @code
 * {
 *   "max_upload_bytes": 52428800,
 *   "max_items_per_request": 50,
 *   "max_tokens_per_batch": 75000,
 *   "chars_per_token": 3,
 *   "stream_window": 100,
 *   "rate_limit": {"max_requests": 10, "window_ms": 60000},
 *   "brand_suffix": "-subforge",
 *   "sub_fps": 25,
 *   "gemini": {"model": "gemini-2.0-flash", "endpoint": "...", "timeout_seconds": 120},
 *   "log_level": "warn"
 * }
 * @endcode
 */
struct SubforgeConfig {
    size_t max_upload_bytes = kMaxUploadBytes;
    size_t max_items_per_request = kDefaultMaxItemsPerRequest;
    size_t max_tokens_per_batch = kDefaultMaxTokensPerBatch;
    size_t chars_per_token = kDefaultCharsPerToken;
    size_t stream_window = kDefaultStreamWindow;
    uint32_t rate_limit_max = kDefaultRateLimitMax;
    int64_t rate_limit_window_ms = kDefaultRateLimitWindow.count();
    std::string brand_suffix = kDefaultBrandSuffix;
    double sub_fps = kDefaultSubFps;
    std::string gemini_model = kDefaultGeminiModel;
    std::string gemini_endpoint = kDefaultGeminiEndpoint;
    long gemini_timeout_seconds = kDefaultGeminiTimeoutSeconds;
    std::string api_key;  ///< never read from the file
    LogVerbosity log_level = LogVerbosity::Warn;
};

// Overlay values from a JSON file; Validation on unreadable/malformed files or bad values.
Status load_config(const std::string &path, SubforgeConfig &cfg);

// Overlay SUBFORGE_API_KEY (falling back to GEMINI_API_KEY) and SUBFORGE_LOG_LEVEL.
void apply_env(SubforgeConfig &cfg);

// Reject non-positive limits.
Status validate_config(const SubforgeConfig &cfg);

GeminiSettings gemini_settings(const SubforgeConfig &cfg);

}  // namespace subforge
