//
//  json_codec.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "caption_json.hpp"
#include "content_sanitizer.hpp"
#include "subtitle_codec.hpp"

using json = nlohmann::json;

namespace subforge {
namespace codecs {

using codec_detail::trim;

bool detect_json(const std::string &text) {
    const std::string t = trim(text);
    if (t.empty()) {
        return false;
    }
    // "{1}{25}" is MicroDVD, so an object must open with a key.
    const char close = t.front() == '{' ? '}' : ']';
    const char member = t.front() == '{' ? '"' : '{';
    if (t.front() != '{' && t.front() != '[') {
        return false;
    }
    size_t next = t.find_first_not_of(" \t\n", 1);
    return next != std::string::npos && (t[next] == member || t[next] == close);
}

// Accepts a bare array of caption objects or an upload response ({"data": [...]}).
std::vector<SubtitleEntry> parse_json(const std::string &text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error &e) {
        throw std::runtime_error(std::string("json: ") + e.what());
    }
    const json *items = &root;
    if (root.is_object()) {
        if (root.contains("data") && root["data"].is_array()) {
            items = &root["data"];
        } else if (root.contains("subtitles") && root["subtitles"].is_array()) {
            items = &root["subtitles"];
        }
    }
    if (!items->is_array()) {
        throw std::runtime_error("json: expected an array of captions");
    }
    std::vector<SubtitleEntry> entries;
    entries.reserve(items->size());
    for (const auto &item : *items) {
        auto e = entry_from_json(item);
        if (e.text.empty()) {
            e.text = strip_markup(e.content);
        }
        entries.push_back(std::move(e));
    }
    return entries;
}

std::string build_json(const std::vector<Caption> &captions, const BuildOptions &opts) {
    std::string out;
    if (opts.header) {
        out += "[\n";
    }
    uint32_t number = opts.first_number;
    for (size_t i = 0; i < captions.size(); ++i) {
        if (i > 0 || opts.first_number > 1) {
            out += ",\n";
        }
        Caption numbered = captions[i];
        numbered.index = number++;
        out += "  " + caption_to_json(numbered).dump();
    }
    if (opts.footer) {
        out += "\n]\n";
    }
    return out;
}

}  // namespace codecs
}  // namespace subforge
