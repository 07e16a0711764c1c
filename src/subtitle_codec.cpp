//
//  subtitle_codec.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_codec.hpp"

#include <cctype>
#include <stdexcept>

#include "logging.hpp"
#include "timecode.hpp"

namespace subforge {

namespace {

const SubtitleCodec kCodecs[] = {
    {SubtitleFormat::Srt, codecs::detect_srt, codecs::parse_srt, codecs::build_srt},
    {SubtitleFormat::Vtt, codecs::detect_vtt, codecs::parse_vtt, codecs::build_vtt},
    {SubtitleFormat::Sub, codecs::detect_sub, codecs::parse_sub, codecs::build_sub},
    {SubtitleFormat::Sbv, codecs::detect_sbv, codecs::parse_sbv, codecs::build_sbv},
    {SubtitleFormat::Lrc, codecs::detect_lrc, codecs::parse_lrc, codecs::build_lrc},
    {SubtitleFormat::Smi, codecs::detect_smi, codecs::parse_smi, codecs::build_smi},
    {SubtitleFormat::Ssa, codecs::detect_ssa, codecs::parse_ssa, codecs::build_ssa},
    {SubtitleFormat::Ass, codecs::detect_ass, codecs::parse_ssa, codecs::build_ass},
    {SubtitleFormat::Json, codecs::detect_json, codecs::parse_json, codecs::build_json},
};

// Order matters: containers with explicit magic first, loose line grammars last.
constexpr SubtitleFormat kDetectOrder[] = {
    SubtitleFormat::Vtt, SubtitleFormat::Smi, SubtitleFormat::Ass, SubtitleFormat::Ssa,
    SubtitleFormat::Json, SubtitleFormat::Sbv, SubtitleFormat::Srt, SubtitleFormat::Sub,
    SubtitleFormat::Lrc,
};

}  // namespace

const SubtitleCodec &codec_for(SubtitleFormat format) {
    for (const auto &c : kCodecs) {
        if (c.format == format) {
            return c;
        }
    }
    throw std::runtime_error("no codec registered for format");
}

std::optional<SubtitleFormat> detect_format(const std::string &text) {
    for (auto f : kDetectOrder) {
        if (codec_for(f).detect(text)) {
            SF_LOG("codec", "detected format " << format_extension(f));
            return f;
        }
    }
    return std::nullopt;
}

std::string normalize_newlines(const std::string &raw) {
    size_t start = 0;
    if (raw.size() >= 3 && static_cast<unsigned char>(raw[0]) == kUtf8Bom[0] &&
        static_cast<unsigned char>(raw[1]) == kUtf8Bom[1] &&
        static_cast<unsigned char>(raw[2]) == kUtf8Bom[2]) {
        start = 3;
    }
    std::string out;
    out.reserve(raw.size() - start);
    for (size_t i = start; i < raw.size(); ++i) {
        if (raw[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < raw.size() && raw[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(raw[i]);
        }
    }
    return out;
}

void check_build_timing(const std::vector<Caption> &captions) {
    for (const auto &c : captions) {
        if (c.start_ms < 0 || c.end_ms < 0) {
            throw std::runtime_error("caption " + std::to_string(c.index) +
                                     " has a negative timestamp");
        }
        if (c.end_ms < c.start_ms) {
            throw std::runtime_error("caption " + std::to_string(c.index) +
                                     " ends before it starts");
        }
    }
}

namespace codec_detail {

std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            if (start < text.size()) {
                lines.push_back(text.substr(start));
            }
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::vector<std::vector<std::string>> split_blocks(const std::string &text) {
    std::vector<std::vector<std::string>> blocks;
    std::vector<std::string> current;
    for (auto &line : split_lines(text)) {
        if (trim(line).empty()) {
            if (!current.empty()) {
                blocks.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(line);
    }
    if (!current.empty()) {
        blocks.push_back(std::move(current));
    }
    return blocks;
}

std::string trim(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string join_lines(const std::vector<std::string> &lines, size_t from,
                       const std::string &sep) {
    std::string out;
    for (size_t i = from; i < lines.size(); ++i) {
        if (i != from) {
            out += sep;
        }
        out += lines[i];
    }
    return out;
}

bool istarts_with(const std::string &s, const std::string &prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (::tolower(static_cast<unsigned char>(s[i])) !=
            ::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

bool parse_arrow_line(const std::string &line, int64_t &start_ms, int64_t &end_ms) {
    const auto arrow = line.find("-->");
    if (arrow == std::string::npos) {
        return false;
    }
    const std::string lhs = trim(line.substr(0, arrow));
    std::string rhs = trim(line.substr(arrow + 3));
    // Drop cue settings ("align:start position:10%").
    const auto ws = rhs.find_first_of(" \t");
    if (ws != std::string::npos) {
        rhs = rhs.substr(0, ws);
    }
    auto start = parse_timecode(lhs);
    auto end = parse_timecode(rhs);
    if (!start || !end) {
        throw std::runtime_error("invalid timing line '" + trim(line) + "'");
    }
    start_ms = *start;
    end_ms = *end;
    return true;
}

}  // namespace codec_detail

}  // namespace subforge
