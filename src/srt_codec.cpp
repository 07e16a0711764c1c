//
//  srt_codec.cpp
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
using codec_detail::parse_arrow_line;
using codec_detail::split_blocks;
using codec_detail::split_lines;

bool detect_srt(const std::string &text) {
    for (const auto &line : split_lines(text)) {
        const auto arrow = line.find("-->");
        if (arrow == std::string::npos) {
            continue;
        }
        return parse_timecode(line.substr(0, arrow)).has_value();
    }
    return false;
}

// Blocks are "[number]\nstart --> end\ntext..." separated by blank lines. The number is
// optional and ignored; blocks without a timing line are skipped.
std::vector<SubtitleEntry> parse_srt(const std::string &text) {
    std::vector<SubtitleEntry> entries;
    for (const auto &block : split_blocks(text)) {
        size_t timing = 0;
        int64_t start = 0;
        int64_t end = 0;
        if (parse_arrow_line(block[0], start, end)) {
            timing = 0;
        } else if (block.size() > 1 && parse_arrow_line(block[1], start, end)) {
            timing = 1;
        } else {
            SF_LOG("codec", "srt: skipping block without timing line: " << block[0]);
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

std::string build_srt(const std::vector<Caption> &captions, const BuildOptions &opts) {
    std::string out;
    uint32_t number = opts.first_number;
    for (size_t i = 0; i < captions.size(); ++i) {
        const auto &c = captions[i];
        // Blocks are joined by a blank line; a continuation window owes the separator.
        if (i > 0 || opts.first_number > 1) {
            out += "\n";
        }
        out += std::to_string(number++);
        out += "\n";
        out += format_time(c.start_ms);
        out += " --> ";
        out += format_time(c.end_ms);
        out += "\n";
        out += c.content;
        out += "\n";
    }
    return out;
}

}  // namespace codecs
}  // namespace subforge
