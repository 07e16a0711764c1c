//
//  ssa_codec.cpp
//  SubForge
//
//  SubStation Alpha (v4.00) and Advanced SubStation Alpha (v4.00+). Both share the
//  [Events] grammar; only the script header and style table differ.
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

using codec_detail::istarts_with;
using codec_detail::split_lines;
using codec_detail::trim;

namespace {

const char *kAssEventFormat =
    "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text";
const char *kSsaEventFormat =
    "Format: Marked, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text";

std::vector<std::string> split_fields(const std::string &s, size_t max_fields) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() + 1 < max_fields) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) {
            break;
        }
        fields.push_back(trim(s.substr(start, comma - start)));
        start = comma + 1;
    }
    fields.push_back(s.substr(start));
    return fields;
}

// "\N" and "\n" are hard/soft line breaks, "\h" a hard space.
std::string decode_text(const std::string &s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            const char n = s[i + 1];
            if (n == 'N' || n == 'n') {
                out.push_back('\n');
                ++i;
                continue;
            }
            if (n == 'h') {
                out.push_back(' ');
                ++i;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::string encode_text(const std::string &s) {
    std::string out;
    for (char c : s) {
        if (c == '\n') {
            out += "\\N";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

int field_index(const std::vector<std::string> &format, const std::string &name) {
    for (size_t i = 0; i < format.size(); ++i) {
        if (istarts_with(format[i], name) && format[i].size() == name.size()) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string build_script(const std::vector<Caption> &captions, const BuildOptions &opts,
                         bool advanced) {
    std::string out;
    if (opts.header) {
        out += "[Script Info]\n; Script generated by SubForge\n";
        out += advanced ? "ScriptType: v4.00+\n" : "ScriptType: v4.00\n";
        out += "Collisions: Normal\nPlayResX: 384\nPlayResY: 288\n\n";
        if (advanced) {
            out += "[V4+ Styles]\n"
                   "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, "
                   "OutlineColour, BackColour, Bold, Italic, Underline, StrikeOut, ScaleX, "
                   "ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, Alignment, MarginL, "
                   "MarginR, MarginV, Encoding\n"
                   "Style: Default,Arial,20,&H00FFFFFF,&H000000FF,&H00000000,&H00000000,0,0,0,"
                   "0,100,100,0,0,1,2,2,2,10,10,10,1\n\n";
        } else {
            out += "[V4 Styles]\n"
                   "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, "
                   "TertiaryColour, BackColour, Bold, Italic, BorderStyle, Outline, Shadow, "
                   "Alignment, MarginL, MarginR, MarginV, AlphaLevel, Encoding\n"
                   "Style: Default,Arial,20,16777215,65535,65535,-2147483640,0,0,1,2,2,2,10,10,"
                   "10,0,1\n\n";
        }
        out += "[Events]\n";
        out += advanced ? kAssEventFormat : kSsaEventFormat;
        out += "\n";
    }
    for (const auto &c : captions) {
        if (c.kind == CaptionKind::Meta) {
            continue;
        }
        out += "Dialogue: ";
        out += advanced ? "0," : "Marked=0,";
        out += format_ass_time(c.start_ms) + "," + format_ass_time(c.end_ms);
        out += ",Default,,0,0,0,," + encode_text(c.content) + "\n";
    }
    return out;
}

}  // namespace

// Only a script that opens with its header counts; "[Events]" can appear in caption text.
bool detect_ssa(const std::string &text) { return istarts_with(trim(text), "[Script Info]"); }

bool detect_ass(const std::string &text) {
    return detect_ssa(text) && (text.find("[V4+ Styles]") != std::string::npos ||
                                text.find("v4.00+") != std::string::npos);
}

std::vector<SubtitleEntry> parse_ssa(const std::string &text) {
    std::vector<SubtitleEntry> entries;
    std::string section;
    std::vector<std::string> format = split_fields(
        std::string(kAssEventFormat).substr(8), 10);
    for (auto &f : format) {
        f = trim(f);
    }
    for (const auto &raw : split_lines(text)) {
        const std::string line = trim(raw);
        if (line.empty() || line[0] == ';') {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            section = line;
            continue;
        }
        if (istarts_with(section, "[V4") && istarts_with(line, "Style:")) {
            SubtitleEntry style;
            style.kind = CaptionKind::Meta;
            style.content = line;
            style.text = line;
            entries.push_back(std::move(style));
            continue;
        }
        if (!istarts_with(section, "[Events]")) {
            continue;
        }
        if (istarts_with(line, "Format:")) {
            format = split_fields(line.substr(7), 64);
            for (auto &f : format) {
                f = trim(f);
            }
            continue;
        }
        if (!istarts_with(line, "Dialogue:")) {
            continue;
        }
        const int start_i = field_index(format, "Start");
        const int end_i = field_index(format, "End");
        const int text_i = field_index(format, "Text");
        if (start_i < 0 || end_i < 0 || text_i < 0) {
            throw std::runtime_error("ssa: event format lacks Start/End/Text");
        }
        const auto fields = split_fields(line.substr(9), format.size());
        if (fields.size() != format.size()) {
            throw std::runtime_error("ssa: dialogue has " + std::to_string(fields.size()) +
                                     " fields, format declares " +
                                     std::to_string(format.size()));
        }
        auto start = parse_timecode(fields[start_i]);
        auto end = parse_timecode(fields[end_i]);
        if (!start || !end) {
            throw std::runtime_error("ssa: invalid dialogue timing in '" + line + "'");
        }
        SubtitleEntry e;
        e.kind = CaptionKind::Caption;
        e.start_ms = *start;
        e.end_ms = *end;
        e.duration_ms = *end - *start;
        e.content = decode_text(fields[text_i]);
        e.text = strip_markup(e.content);
        entries.push_back(std::move(e));
    }
    return entries;
}

std::string build_ssa(const std::vector<Caption> &captions, const BuildOptions &opts) {
    return build_script(captions, opts, false);
}

std::string build_ass(const std::vector<Caption> &captions, const BuildOptions &opts) {
    return build_script(captions, opts, true);
}

}  // namespace codecs
}  // namespace subforge
