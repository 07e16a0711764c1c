//
//  sub_codec.cpp
//  SubForge
//
//  MicroDVD: "{start_frame}{end_frame}line one|line two".
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "content_sanitizer.hpp"
#include "logging.hpp"
#include "subtitle_codec.hpp"

namespace subforge {
namespace codecs {

using codec_detail::split_lines;
using codec_detail::trim;

namespace {

constexpr double kDefaultFps = 25.0;

// Reads "{digits}" at pos; advances pos past the closing brace.
bool read_frame(const std::string &line, size_t &pos, long long &frame) {
    if (pos >= line.size() || line[pos] != '{') {
        return false;
    }
    size_t close = line.find('}', pos);
    if (close == std::string::npos || close == pos + 1 || close - pos - 1 > 12) {
        return false;
    }
    for (size_t i = pos + 1; i < close; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
            return false;
        }
    }
    frame = std::stoll(line.substr(pos + 1, close - pos - 1));
    pos = close + 1;
    return true;
}

int64_t frames_to_ms(long long frame, double fps) {
    return static_cast<int64_t>(std::llround(static_cast<double>(frame) * 1000.0 / fps));
}

long long ms_to_frames(int64_t ms, double fps) {
    return std::llround(static_cast<double>(ms) * fps / 1000.0);
}

std::string pipes_to_newlines(const std::string &s) {
    std::string out = s;
    for (auto &c : out) {
        if (c == '|') {
            c = '\n';
        }
    }
    return out;
}

}  // namespace

bool detect_sub(const std::string &text) {
    for (const auto &line : split_lines(text)) {
        const std::string t = trim(line);
        if (t.empty()) {
            continue;
        }
        size_t pos = 0;
        long long a = 0;
        long long b = 0;
        return read_frame(t, pos, a) && read_frame(t, pos, b);
    }
    return false;
}

std::vector<SubtitleEntry> parse_sub(const std::string &text) {
    std::vector<SubtitleEntry> entries;
    double fps = kDefaultFps;
    bool first = true;
    for (const auto &line : split_lines(text)) {
        const std::string t = trim(line);
        if (t.empty()) {
            continue;
        }
        size_t pos = 0;
        long long start = 0;
        long long end = 0;
        if (!read_frame(t, pos, start) || !read_frame(t, pos, end)) {
            throw std::runtime_error("sub: invalid frame line '" + t + "'");
        }
        const std::string body = t.substr(pos);
        // "{1}{1}23.976" declares the frame rate instead of a caption.
        if (first && start <= 1 && end <= 1 && !body.empty()) {
            char *parsed_end = nullptr;
            const double declared = std::strtod(body.c_str(), &parsed_end);
            if (parsed_end == body.c_str() + body.size() && declared > 0) {
                fps = declared;
                SF_LOG("codec", "sub: frame rate " << fps << " declared in file");
                first = false;
                continue;
            }
        }
        first = false;
        SubtitleEntry e;
        e.kind = CaptionKind::Caption;
        e.start_ms = frames_to_ms(start, fps);
        e.end_ms = frames_to_ms(end, fps);
        e.duration_ms = *e.end_ms - *e.start_ms;
        e.content = pipes_to_newlines(body);
        e.text = strip_markup(e.content);
        entries.push_back(std::move(e));
    }
    return entries;
}

std::string build_sub(const std::vector<Caption> &captions, const BuildOptions &opts) {
    if (!(opts.fps > 0.0)) {
        throw std::runtime_error("sub: frame rate must be positive");
    }
    std::string out;
    for (const auto &c : captions) {
        if (c.kind == CaptionKind::Meta) {
            continue;
        }
        std::string body = c.content;
        for (auto &ch : body) {
            if (ch == '\n') {
                ch = '|';
            }
        }
        out += "{" + std::to_string(ms_to_frames(c.start_ms, opts.fps)) + "}";
        out += "{" + std::to_string(ms_to_frames(c.end_ms, opts.fps)) + "}";
        out += body;
        out += "\n";
    }
    return out;
}

}  // namespace codecs
}  // namespace subforge
