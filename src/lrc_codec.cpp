//
//  lrc_codec.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <algorithm>
#include <cctype>

#include "content_sanitizer.hpp"
#include "logging.hpp"
#include "subtitle_codec.hpp"
#include "timecode.hpp"

namespace subforge {
namespace codecs {

using codec_detail::split_lines;
using codec_detail::trim;

namespace {

struct TimedLine {
    int64_t start_ms;
    std::string content;
};

// Leading "[...]" tags of a line; rest receives the remaining text.
std::vector<std::string> leading_tags(const std::string &line, std::string &rest) {
    std::vector<std::string> tags;
    size_t pos = 0;
    while (pos < line.size() && line[pos] == '[') {
        size_t close = line.find(']', pos);
        if (close == std::string::npos) {
            break;
        }
        tags.push_back(line.substr(pos + 1, close - pos - 1));
        pos = close + 1;
    }
    rest = line.substr(pos);
    return tags;
}

bool is_meta_tag(const std::string &tag) {
    const auto colon = tag.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    for (size_t i = 0; i < colon; ++i) {
        if (!std::isalpha(static_cast<unsigned char>(tag[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

bool detect_lrc(const std::string &text) {
    for (const auto &line : split_lines(text)) {
        std::string rest;
        auto tags = leading_tags(trim(line), rest);
        if (!tags.empty() && parse_timecode(tags.front()).has_value()) {
            return true;
        }
    }
    return false;
}

// Lines may carry several time tags ("[00:12.00][01:30.00]chorus"). End times are the
// next line's start; the final line gets zero duration.
std::vector<SubtitleEntry> parse_lrc(const std::string &text) {
    std::vector<SubtitleEntry> meta;
    std::vector<TimedLine> timed;
    for (const auto &line : split_lines(text)) {
        const std::string t = trim(line);
        if (t.empty()) {
            continue;
        }
        std::string rest;
        const auto tags = leading_tags(t, rest);
        bool any_time = false;
        for (const auto &tag : tags) {
            if (auto ms = parse_timecode(tag)) {
                timed.push_back(TimedLine{*ms, trim(rest)});
                any_time = true;
            } else if (is_meta_tag(tag)) {
                SubtitleEntry m;
                m.kind = CaptionKind::Meta;
                m.content = tag;
                m.text = tag;
                meta.push_back(std::move(m));
            }
        }
        if (!any_time && tags.empty()) {
            SF_LOG("codec", "lrc: ignoring untagged line: " << t);
        }
    }
    std::stable_sort(timed.begin(), timed.end(),
                     [](const TimedLine &a, const TimedLine &b) { return a.start_ms < b.start_ms; });

    std::vector<SubtitleEntry> entries = std::move(meta);
    for (size_t i = 0; i < timed.size(); ++i) {
        SubtitleEntry e;
        e.kind = CaptionKind::Caption;
        e.start_ms = timed[i].start_ms;
        e.end_ms = (i + 1 < timed.size()) ? timed[i + 1].start_ms : timed[i].start_ms;
        e.duration_ms = *e.end_ms - *e.start_ms;
        e.content = timed[i].content;
        e.text = strip_markup(e.content);
        entries.push_back(std::move(e));
    }
    return entries;
}

std::string build_lrc(const std::vector<Caption> &captions, const BuildOptions &) {
    std::string out;
    for (const auto &c : captions) {
        if (c.kind == CaptionKind::Meta) {
            out += "[" + c.content + "]\n";
            continue;
        }
        std::string line = c.content;
        std::replace(line.begin(), line.end(), '\n', ' ');
        out += "[" + format_lrc_time(c.start_ms) + "]" + line + "\n";
    }
    return out;
}

}  // namespace codecs
}  // namespace subforge
