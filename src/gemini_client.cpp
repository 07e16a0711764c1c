//
//  gemini_client.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "gemini_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

#include "logging.hpp"

using json = nlohmann::json;

namespace subforge {

namespace {

constexpr size_t kMaxResponseBytes = 16 * 1024 * 1024;

struct CurlEasyDeleter {
    void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};
using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_body(char *data, size_t size, size_t nmemb, void *userp) {
    auto *out = static_cast<std::string *>(userp);
    const size_t total = size * nmemb;
    if (out->size() + total > kMaxResponseBytes) {
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    out->append(data, total);
    return total;
}

int on_progress(void *userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto *cancel = static_cast<const CancellationToken *>(userp);
    return cancel->cancelled() ? 1 : 0;
}

// Appends a header; returns false when libcurl could not allocate.
bool append_header(CurlHeaders &headers, const std::string &line) {
    curl_slist *next = curl_slist_append(headers.get(), line.c_str());
    if (!next) {
        return false;
    }
    headers.release();
    headers.reset(next);
    return true;
}

}  // namespace

std::string gemini_request_url(const GeminiSettings &settings) {
    std::string base = settings.endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/v1beta/models/" + settings.model + ":generateContent";
}

std::string gemini_request_body(const std::string &prompt) {
    json body;
    body["contents"] = json::array({json{{"parts", json::array({json{{"text", prompt}}})}}});
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool gemini_extract_text(long http_status, const std::string &body, std::string &text,
                         std::string &error) {
    text.clear();
    json j = json::parse(body, nullptr, false);
    std::string provider_message;
    if (!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_object()) {
        const auto message = j["error"].find("message");
        if (message != j["error"].end() && message->is_string()) {
            provider_message = message->get<std::string>();
        }
    }

    if (http_status == 401 || http_status == 403) {
        error = "authentication failed (HTTP " + std::to_string(http_status) + ")";
        if (!provider_message.empty()) {
            error += ": " + provider_message;
        }
        return false;
    }
    if (http_status < 200 || http_status >= 300) {
        error = provider_message.empty()
                    ? "HTTP " + std::to_string(http_status)
                    : provider_message + " (HTTP " + std::to_string(http_status) + ")";
        return false;
    }
    if (j.is_discarded() || !j.is_object()) {
        error = "malformed provider reply";
        return false;
    }
    if (!provider_message.empty()) {
        error = provider_message;
        return false;
    }

    const auto candidates = j.find("candidates");
    if (candidates == j.end() || !candidates->is_array() || candidates->empty()) {
        error = "provider returned no candidates";
        return false;
    }
    const json &first = (*candidates)[0];
    if (!first.is_object() || !first.contains("content") || !first["content"].is_object()) {
        error = "provider returned no content";
        return false;
    }
    const json &parts = first["content"].value("parts", json::array());
    if (!parts.is_array()) {
        error = "provider returned no content";
        return false;
    }
    for (const auto &part : parts) {
        if (part.is_object() && part.contains("text") && part["text"].is_string()) {
            text += part["text"].get<std::string>();
        }
    }
    if (text.empty()) {
        error = "provider returned an empty reply";
        return false;
    }
    return true;
}

GeminiClient::GeminiClient(GeminiSettings settings) : settings_(std::move(settings)) {
    ensure_curl_global();
}

bool GeminiClient::generate(const std::string &api_key, const std::string &prompt,
                            const CancellationToken &cancel, std::string &response,
                            std::string &error) {
    response.clear();
    error.clear();

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        error = "failed to initialize HTTP client";
        return false;
    }
    CurlHeaders headers;
    if (!append_header(headers, "Content-Type: application/json") ||
        !append_header(headers, "x-goog-api-key: " + api_key)) {
        error = "failed to build request headers";
        return false;
    }

    const std::string url = gemini_request_url(settings_);
    const std::string body = gemini_request_body(prompt);
    std::string reply;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &reply);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &cancel);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, settings_.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    SF_LOG("optimizer", "POST " << url << " (" << body.size() << " bytes)");
    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        error = "request cancelled";
        return false;
    }
    if (rc != CURLE_OK) {
        error = std::string("request failed: ") + curl_easy_strerror(rc);
        SF_LOG("error", "gemini: " << error);
        return false;
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    SF_LOG("optimizer", "HTTP " << http_status << " (" << reply.size() << " bytes): "
                                << text_preview(reply));
    if (!gemini_extract_text(http_status, reply, response, error)) {
        SF_LOG("warn", "gemini: " << error);
        return false;
    }
    return true;
}

}  // namespace subforge
