//
//  service.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "service.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <limits>
#include <nlohmann/json.hpp>

#include "caption_json.hpp"
#include "content_sanitizer.hpp"
#include "format_parser.hpp"
#include "format_serializer.hpp"
#include "logging.hpp"
#include "optimization_orchestrator.hpp"

using json = nlohmann::json;

namespace subforge {

namespace {

std::string dump(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

ServiceResponse json_response(int status, const json &body) {
    ServiceResponse res;
    res.status = status;
    res.body = dump(body);
    return res;
}

// Missing or non-string fields read as empty.
std::string string_field(const json &j, const char *key) {
    auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    return s;
}

struct FileRequest {
    std::vector<Caption> captions;
    std::string format;
    std::string filename;
};

// Wire captions for a download. Timings are taken as sent so the serializer can reject
// inverted or negative ones; indices follow request order.
Status read_file_request(const std::string &request_json, FileRequest &out) {
    json j = json::parse(request_json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return make_error(ErrorKind::Validation, "Invalid request data");
    }
    auto subtitles = j.find("subtitles");
    if (subtitles == j.end() || !subtitles->is_array()) {
        return make_error(ErrorKind::Validation, "Invalid request data");
    }
    out.format = string_field(j, "format");
    out.filename = string_field(j, "filename");
    try {
        uint32_t index = 0;
        for (const auto &item : *subtitles) {
            SubtitleEntry e = entry_from_json(item);
            Caption c;
            c.index = ++index;
            c.kind = e.kind.value_or(CaptionKind::Caption);
            c.start_ms = e.start_ms.value_or(0);
            c.end_ms = e.end_ms.value_or(0);
            c.duration_ms =
                c.start_ms >= 0 && c.end_ms >= c.start_ms ? c.end_ms - c.start_ms : 0;
            c.content = sanitize(e.content.empty() ? e.text : e.content);
            c.text = e.text.empty() ? strip_markup(c.content) : sanitize(e.text);
            out.captions.push_back(std::move(c));
        }
    } catch (const std::exception &e) {
        SF_LOG("http", "rejecting request: " << e.what());
        return make_error(ErrorKind::Validation, "Invalid request data");
    }
    return ok_status();
}

}  // namespace

ServiceResponse error_response(const Status &status, int http_status) {
    json body;
    body["success"] = false;
    body["error"] = status.message;
    body["kind"] = error_kind_name(status.kind);
    return json_response(http_status > 0 ? http_status : error_kind_http_status(status.kind),
                         body);
}

SubtitleService::SubtitleService(SubforgeConfig config, std::shared_ptr<RateLimiter> limiter)
    : config_(std::move(config)), limiter_(std::move(limiter)) {
    if (!limiter_) {
        limiter_ = std::make_shared<RateLimiter>(
            std::make_shared<InMemoryRateLimitStore>(), config_.rate_limit_max,
            std::chrono::milliseconds(config_.rate_limit_window_ms));
        limiter_->start_sweeper();
    }
}

ServiceResponse SubtitleService::handle_upload(const std::string &bytes,
                                               const std::string &filename,
                                               const std::string &content_type,
                                               const std::string &client_id) {
    const std::string client = client_id.empty() ? "unknown" : client_id;
    if (limiter_->admit(client) == Admission::Denied) {
        return error_response(make_error(ErrorKind::RateLimit,
                                         "Too many requests. Please try again later."));
    }
    if (!content_type.empty() &&
        lower(content_type).find("multipart/form-data") == std::string::npos) {
        return error_response(make_error(ErrorKind::Validation,
                                         "Invalid content type. Must be multipart/form-data"),
                              kHttpUnsupportedMediaType);
    }
    if (filename.empty()) {
        return error_response(make_error(ErrorKind::Validation, "No file provided"));
    }

    ParseOptions opts;
    opts.max_bytes = config_.max_upload_bytes;
    ParseResult parsed = parse_subtitles(bytes, filename, opts);
    if (!parsed.status.ok) {
        return error_response(parsed.status);
    }
    SF_LOG("http", "upload '" << filename << "' from " << client << ": "
                              << parsed.document.size() << " captions");

    json body;
    body["success"] = true;
    body["data"] = document_to_json(parsed.document);
    body["filename"] = filename;
    body["format"] = format_extension(parsed.format);
    body["count"] = parsed.document.size();
    return json_response(200, body);
}

ServiceResponse SubtitleService::handle_download(const std::string &request_json) {
    FileRequest req;
    Status st = read_file_request(request_json, req);
    if (!st.ok) {
        return error_response(st);
    }
    if (req.format.empty() || req.filename.empty()) {
        return error_response(make_error(ErrorKind::Validation, "Invalid request data"));
    }

    SerializeOptions opts;
    opts.fps = config_.sub_fps;
    opts.brand_suffix = config_.brand_suffix;
    CaptionDocument doc;
    doc.captions = std::move(req.captions);
    SerializeResult out = build_download(doc, req.format, req.filename, opts);
    if (!out.status.ok) {
        return error_response(out.status);
    }

    ServiceResponse res;
    res.status = 200;
    res.content_type = out.content_type;
    res.body = std::move(out.bytes);
    res.filename = out.filename;
    res.uses_bom = out.uses_bom;
    return res;
}

ServiceResponse SubtitleService::handle_optimize(const std::string &request_json,
                                                 TextGenerator &provider,
                                                 const CancellationToken &cancel) {
    json j = json::parse(request_json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return error_response(make_error(ErrorKind::Validation, "Invalid request data"));
    }
    const std::string api_key = string_field(j, "apiKey");
    if (api_key.empty()) {
        return error_response(make_error(ErrorKind::Validation, "API key is required"));
    }
    auto subtitles = j.find("subtitles");
    if (subtitles == j.end() || !subtitles->is_array() || subtitles->empty()) {
        return error_response(make_error(ErrorKind::Validation,
                                         "Subtitles array is required and must not be empty"));
    }

    std::vector<CaptionContent> items;
    items.reserve(subtitles->size());
    for (const auto &item : *subtitles) {
        if (!item.is_object()) {
            return error_response(make_error(ErrorKind::Validation, "Invalid subtitle item"));
        }
        auto index = item.find("index");
        if (index == item.end() || !index->is_number_integer() || index->get<int64_t>() <= 0 ||
            index->get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
            return error_response(make_error(ErrorKind::Validation, "Invalid subtitle item"));
        }
        CaptionContent c;
        c.index = static_cast<uint32_t>(index->get<int64_t>());
        auto content = item.find("content");
        if (content != item.end() && content->is_string()) {
            c.content = content->get<std::string>();
        }
        items.push_back(std::move(c));
    }

    OptimizerSettings settings;
    settings.max_items = config_.max_items_per_request;
    settings.max_tokens_per_batch = config_.max_tokens_per_batch;
    settings.chars_per_token = config_.chars_per_token;
    OptimizationOrchestrator orchestrator(provider, settings);
    OptimizeResult result = orchestrator.optimize(api_key, items, cancel);
    if (!result.status.ok) {
        return error_response(result.status);
    }

    json body;
    body["success"] = true;
    body["optimized"] = contents_to_json(result.optimized);
    return json_response(200, body);
}

StreamResponse SubtitleService::open_stream(const std::string &request_json) {
    StreamResponse out;
    FileRequest req;
    Status st = read_file_request(request_json, req);
    if (!st.ok) {
        out.response = error_response(st);
        return out;
    }
    if (req.captions.empty()) {
        out.response =
            error_response(make_error(ErrorKind::Validation, "No valid subtitles provided"));
        return out;
    }

    StreamOptions opts;
    opts.window = config_.stream_window;
    opts.fps = config_.sub_fps;
    opts.brand_suffix = config_.brand_suffix;
    CaptionDocument doc;
    doc.captions = std::move(req.captions);
    EmitResult emitted = emit(doc, req.format, std::move(opts), req.filename);
    if (!emitted.status.ok) {
        out.response = error_response(emitted.status);
        return out;
    }
    out.response.status = 200;
    out.response.content_type = emitted.content_type;
    out.response.filename = emitted.filename;
    out.response.uses_bom = format_uses_bom(emitted.stream.format());
    out.stream = std::move(emitted.stream);
    return out;
}

}  // namespace subforge
