//
//  vtt_codec.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "content_sanitizer.hpp"
#include "logging.hpp"
#include "subtitle_codec.hpp"
#include "timecode.hpp"

namespace subforge {
namespace codecs {

using codec_detail::istarts_with;
using codec_detail::join_lines;
using codec_detail::parse_arrow_line;
using codec_detail::split_blocks;
using codec_detail::trim;

bool detect_vtt(const std::string &text) { return trim(text).rfind("WEBVTT", 0) == 0; }

std::vector<SubtitleEntry> parse_vtt(const std::string &text) {
    std::vector<SubtitleEntry> entries;
    const auto blocks = split_blocks(text);
    for (size_t b = 0; b < blocks.size(); ++b) {
        const auto &block = blocks[b];
        if (b == 0 && istarts_with(trim(block[0]), "WEBVTT")) {
            continue;  // file header (+ optional header metadata lines)
        }
        const std::string first = trim(block[0]);
        if (istarts_with(first, "NOTE") || istarts_with(first, "STYLE") ||
            istarts_with(first, "REGION")) {
            SubtitleEntry meta;
            meta.kind = CaptionKind::Meta;
            meta.content = join_lines(block, 0);
            meta.text = meta.content;
            entries.push_back(std::move(meta));
            continue;
        }
        size_t timing = 0;
        int64_t start = 0;
        int64_t end = 0;
        if (parse_arrow_line(block[0], start, end)) {
            timing = 0;
        } else if (block.size() > 1 && parse_arrow_line(block[1], start, end)) {
            timing = 1;  // cue identifier line precedes timing
        } else {
            SF_LOG("codec", "vtt: skipping block without timing line: " << first);
            continue;
        }
        SubtitleEntry e;
        e.kind = CaptionKind::Caption;
        e.start_ms = start;
        e.end_ms = end;
        e.duration_ms = end - start;
        e.content = join_lines(block, timing + 1);
        e.text = strip_markup(e.content);
        entries.push_back(std::move(e));
    }
    return entries;
}

std::string build_vtt(const std::vector<Caption> &captions, const BuildOptions &opts) {
    std::string out;
    if (opts.header) {
        out += "WEBVTT\n\n";
    }
    uint32_t number = opts.first_number;
    for (const auto &c : captions) {
        if (c.kind == CaptionKind::Meta) {
            out += istarts_with(c.content, "NOTE") ? c.content : "NOTE " + c.content;
            out += "\n\n";
            continue;
        }
        out += std::to_string(number++);
        out += "\n";
        out += format_vtt_time(c.start_ms);
        out += " --> ";
        out += format_vtt_time(c.end_ms);
        out += "\n";
        out += c.content;
        out += "\n\n";
    }
    return out;
}

}  // namespace codecs
}  // namespace subforge
