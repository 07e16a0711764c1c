//
//  optimize_protocol.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "optimize_protocol.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include <set>

#include "caption_json.hpp"
#include "content_sanitizer.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace subforge {

namespace {

std::string trim_ws(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
    for (auto &c : s) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

// Integral, positive and representable as a caption index.
bool read_index(const json &v, uint32_t &index) {
    if (v.is_number_unsigned() || v.is_number_integer()) {
        const auto n = v.get<int64_t>();
        if (n <= 0 || n > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        index = static_cast<uint32_t>(n);
        return true;
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (!(d > 0) || d > std::numeric_limits<uint32_t>::max() || std::floor(d) != d) {
            return false;
        }
        index = static_cast<uint32_t>(d);
        return true;
    }
    return false;
}

}  // namespace

std::string build_optimize_prompt(const std::vector<CaptionContent> &items) {
    std::string scope;
    if (items.size() > kPromptScopeThreshold) {
        scope = "Processing " + std::to_string(items.size()) + " subtitles from index " +
                std::to_string(items.front().index) + " to " +
                std::to_string(items.back().index) + ".\n\n";
    }
    std::string prompt =
        "You are a professional subtitle editor with expertise in multiple languages.\n\n"
        "TASK: Optimize the provided subtitles by following these steps:\n\n"
        "STEP 1 - CONTEXT ANALYSIS:\n"
        "First, analyze ALL the provided subtitles to understand:\n"
        "- The language being used\n"
        "- The overall context and topic\n"
        "- The tone and style\n"
        "- The narrative flow\n"
        "- Any recurring themes or technical terms\n\n";
    prompt += scope;
    prompt +=
        "STEP 2 - OPTIMIZATION:\n"
        "Using the context you've built, optimize each subtitle by:\n"
        "1. Fixing grammar and spelling errors\n"
        "2. Improving sentence structure and clarity\n"
        "3. Maintaining the original meaning and intent\n"
        "4. Ensuring natural flow between subtitles, you can rephrase for better coherence\n"
        "5. Respecting cultural and linguistic nuances\n\n"
        "IMPORTANT RULES:\n"
        "- Keep the SAME LANGUAGE as the input (do not translate)\n"
        "- Preserve the original meaning completely\n"
        "- Maintain natural flow between subtitles\n"
        "- Keep subtitle length appropriate for timing\n"
        "- Return every index exactly once\n\n"
        "OUTPUT FORMAT:\n"
        "Return ONLY a valid JSON array with this EXACT format, no additional text or "
        "explanation:\n"
        "[\n"
        "  {\"index\": 1, \"content\": \"optimized subtitle text\"},\n"
        "  {\"index\": 2, \"content\": \"optimized subtitle text\"}\n"
        "]\n\n"
        "Subtitles to optimize:\n";
    prompt += contents_to_json(items).dump(2, ' ', false, json::error_handler_t::replace);
    return prompt;
}

std::string extract_json_payload(const std::string &response_text) {
    const std::string text = trim_ws(response_text);
    if (text.rfind("```", 0) != 0) {
        return text;
    }
    size_t pos = 3;
    if (text.compare(pos, 4, "json") == 0) {
        pos += 4;
    }
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos >= text.size() || text[pos] != '[') {
        return text;
    }
    // First "]<ws>```" after the opening bracket closes the array.
    size_t fence = text.find("```", pos);
    while (fence != std::string::npos) {
        size_t end = fence;
        while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
            --end;
        }
        if (end > pos && text[end - 1] == ']') {
            return text.substr(pos, end - pos);
        }
        fence = text.find("```", fence + 3);
    }
    return text;
}

Status parse_optimize_response(const std::string &response_text,
                               const std::vector<CaptionContent> &batch,
                               std::vector<CaptionContent> &out) {
    out.clear();
    const std::string payload = extract_json_payload(response_text);
    json root = json::parse(payload, nullptr, false);
    if (root.is_discarded()) {
        SF_LOG("optimizer", "unparseable response: " << text_preview(payload));
        return make_error(ErrorKind::UpstreamFormat, "Response is not valid JSON");
    }
    if (!root.is_array()) {
        return make_error(ErrorKind::UpstreamFormat, "Response is not an array");
    }

    std::set<uint32_t> expected;
    for (const auto &item : batch) {
        expected.insert(item.index);
    }
    std::set<uint32_t> seen;
    std::vector<CaptionContent> parsed;
    parsed.reserve(root.size());
    for (const auto &item : root) {
        uint32_t index = 0;
        if (!item.is_object() || !item.contains("index") || !item.contains("content") ||
            !read_index(item["index"], index) || !item["content"].is_string()) {
            return make_error(ErrorKind::UpstreamFormat, "Invalid item format in response");
        }
        if (!seen.insert(index).second) {
            return make_error(ErrorKind::UpstreamFormat,
                              "Duplicate index " + std::to_string(index) + " in response");
        }
        if (expected.count(index) == 0) {
            return make_error(ErrorKind::UpstreamFormat,
                              "Unexpected index " + std::to_string(index) + " in response");
        }
        parsed.push_back(CaptionContent{index, sanitize(item["content"].get<std::string>())});
    }
    for (uint32_t index : expected) {
        if (seen.count(index) == 0) {
            return make_error(ErrorKind::UpstreamFormat,
                              "Response is missing index " + std::to_string(index));
        }
    }
    out = std::move(parsed);
    return ok_status();
}

bool is_auth_failure(const std::string &message) {
    const std::string l = lower(message);
    return l.find("api key") != std::string::npos ||
           l.find("authentication") != std::string::npos;
}

}  // namespace subforge
