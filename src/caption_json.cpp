//
//  caption_json.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "caption_json.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace subforge {

namespace {

std::optional<int64_t> optional_ms(const json &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    // 2^63 is exact as a double; anything at or beyond it has no int64 value.
    constexpr double kLimit = 9223372036854775808.0;
    const bool in_range =
        it->is_number_float()
            ? std::fabs(it->get<double>()) < kLimit
            : !it->is_number_unsigned() ||
                  it->get<uint64_t>() <=
                      static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (!in_range) {
        throw std::out_of_range(std::string("'") + key + "' is out of range");
    }
    return it->get<int64_t>();
}

}  // namespace

json caption_to_json(const Caption &caption) {
    json j;
    j["type"] = caption.kind == CaptionKind::Meta ? "meta" : "caption";
    j["index"] = caption.index;
    j["start"] = caption.start_ms;
    j["end"] = caption.end_ms;
    j["duration"] = caption.duration_ms;
    j["content"] = caption.content;
    j["text"] = caption.text;
    return j;
}

json document_to_json(const CaptionDocument &doc) {
    json arr = json::array();
    for (const auto &c : doc.captions) {
        arr.push_back(caption_to_json(c));
    }
    return arr;
}

SubtitleEntry entry_from_json(const json &j) {
    if (!j.is_object()) {
        throw std::runtime_error("subtitle entry is not an object");
    }
    SubtitleEntry e;
    auto type = j.find("type");
    if (type != j.end() && type->is_string()) {
        e.kind = type->get<std::string>() == "meta" ? CaptionKind::Meta : CaptionKind::Caption;
    }
    e.start_ms = optional_ms(j, "start");
    e.end_ms = optional_ms(j, "end");
    e.duration_ms = optional_ms(j, "duration");
    auto content = j.find("content");
    if (content != j.end() && content->is_string()) {
        e.content = content->get<std::string>();
    }
    auto text = j.find("text");
    if (text != j.end() && text->is_string()) {
        e.text = text->get<std::string>();
    }
    return e;
}

json contents_to_json(const std::vector<CaptionContent> &items) {
    json arr = json::array();
    for (const auto &item : items) {
        arr.push_back({{"index", item.index}, {"content", item.content}});
    }
    return arr;
}

}  // namespace subforge
