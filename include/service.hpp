//
//  service.hpp
//  SubForge
//
//  Request-boundary handlers: a hosting layer passes request bytes in and writes the
//  returned status, headers and body out. None of them throws.
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <memory>
#include <string>

#include "cancellation.hpp"
#include "config.hpp"
#include "rate_limiter.hpp"
#include "status.hpp"
#include "streaming_emitter.hpp"
#include "text_generator.hpp"

namespace subforge {

inline constexpr int kHttpUnsupportedMediaType = 415;

struct ServiceResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::string filename;  ///< Content-Disposition attachment name, when a file is returned
    bool uses_bom = false;
};

// Chunked download: `response` carries the headers (or the error); `stream` is only
// live when response.status == 200.
struct StreamResponse {
    ServiceResponse response;
    ChunkStream stream;
};

// `{"success": false, "error": message, "kind": name}` with the kind's HTTP status,
// or `http_status` when given.
ServiceResponse error_response(const Status &status, int http_status = 0);

class SubtitleService {
   public:
    explicit SubtitleService(SubforgeConfig config = {},
                             std::shared_ptr<RateLimiter> limiter = nullptr);

    // Upload: admission, content type, size/extension, parse. Success body is
    // `{"success": true, "data": [...], "filename", "format", "count"}`.
    ServiceResponse handle_upload(const std::string &bytes, const std::string &filename,
                                  const std::string &content_type = {},
                                  const std::string &client_id = {});

    // Download: `{"subtitles": [...], "format", "filename"}` -> file bytes.
    ServiceResponse handle_download(const std::string &request_json);

    // Optimize: `{"apiKey", "subtitles": [{"index", "content"}]}` ->
    // `{"success": true, "optimized": [...]}`.
    ServiceResponse handle_optimize(const std::string &request_json, TextGenerator &provider,
                                    const CancellationToken &cancel = CancellationToken());

    // Streaming download: same request as handle_download.
    StreamResponse open_stream(const std::string &request_json);

    const SubforgeConfig &config() const { return config_; }
    RateLimiter &rate_limiter() { return *limiter_; }

   private:
    SubforgeConfig config_;
    std::shared_ptr<RateLimiter> limiter_;
};

}  // namespace subforge
