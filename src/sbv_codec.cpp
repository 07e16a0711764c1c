//
//  sbv_codec.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <stdexcept>

#include "content_sanitizer.hpp"
#include "logging.hpp"
#include "subtitle_codec.hpp"
#include "timecode.hpp"

namespace subforge {
namespace codecs {

using codec_detail::join_lines;
using codec_detail::split_blocks;
using codec_detail::split_lines;
using codec_detail::trim;

namespace {

// "0:00:01.000,0:00:03.500"
bool split_sbv_timing(const std::string &line, int64_t &start_ms, int64_t &end_ms) {
    const std::string t = trim(line);
    if (t.find("-->") != std::string::npos) {
        return false;
    }
    const auto comma = t.find(',');
    if (comma == std::string::npos) {
        return false;
    }
    auto start = parse_timecode(t.substr(0, comma));
    auto end = parse_timecode(t.substr(comma + 1));
    if (!start || !end) {
        return false;
    }
    start_ms = *start;
    end_ms = *end;
    return true;
}

}  // namespace

bool detect_sbv(const std::string &text) {
    for (const auto &line : split_lines(text)) {
        if (trim(line).empty()) {
            continue;
        }
        int64_t s = 0;
        int64_t e = 0;
        return split_sbv_timing(line, s, e);
    }
    return false;
}

std::vector<SubtitleEntry> parse_sbv(const std::string &text) {
    std::vector<SubtitleEntry> entries;
    for (const auto &block : split_blocks(text)) {
        int64_t start = 0;
        int64_t end = 0;
        if (!split_sbv_timing(block[0], start, end)) {
            throw std::runtime_error("sbv: invalid timing line '" + trim(block[0]) + "'");
        }
        SubtitleEntry e;
        e.kind = CaptionKind::Caption;
        e.start_ms = start;
        e.end_ms = end;
        e.duration_ms = end - start;
        e.content = join_lines(block, 1);
        e.text = strip_markup(e.content);
        entries.push_back(std::move(e));
    }
    return entries;
}

std::string build_sbv(const std::vector<Caption> &captions, const BuildOptions &) {
    std::string out;
    for (const auto &c : captions) {
        if (c.kind == CaptionKind::Meta) {
            continue;
        }
        out += format_sbv_time(c.start_ms);
        out += ",";
        out += format_sbv_time(c.end_ms);
        out += "\n";
        out += c.content;
        out += "\n\n";
    }
    return out;
}

}  // namespace codecs
}  // namespace subforge
