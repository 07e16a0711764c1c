//
//  subtitle_codec.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "caption.hpp"
#include "subtitle_format.hpp"

namespace subforge {

// Raw grammar output. Fields a format does not carry stay unset; the parser fills
// defaults, re-indexes and sanitizes.
struct SubtitleEntry {
    std::optional<CaptionKind> kind;
    std::optional<int64_t> start_ms;
    std::optional<int64_t> end_ms;
    std::optional<int64_t> duration_ms;
    std::string content;
    std::string text;
};

// Framing controls. A window of a larger document is built with `first_number` set to
// its position (1-based) and header/footer only on the first/last window, so that
// concatenated windows equal a one-shot build.
struct BuildOptions {
    double fps = 25.0;          // MicroDVD frame rate
    uint32_t first_number = 1;  // number of the first caption in this fragment
    bool header = true;
    bool footer = true;
};

// One format grammar. parse() and build() throw std::runtime_error on malformed input.
struct SubtitleCodec {
    SubtitleFormat format;
    bool (*detect)(const std::string &text);
    std::vector<SubtitleEntry> (*parse)(const std::string &text);
    std::string (*build)(const std::vector<Caption> &captions, const BuildOptions &opts);
};

const SubtitleCodec &codec_for(SubtitleFormat format);

// Content sniffing, most specific grammar first. nullopt when nothing matches.
std::optional<SubtitleFormat> detect_format(const std::string &text);

// Drop a leading UTF-8 BOM and fold CRLF/CR line endings to LF.
std::string normalize_newlines(const std::string &raw);

// Validates timing before a build; throws std::runtime_error naming the caption.
void check_build_timing(const std::vector<Caption> &captions);

namespace codecs {

bool detect_srt(const std::string &text);
std::vector<SubtitleEntry> parse_srt(const std::string &text);
std::string build_srt(const std::vector<Caption> &captions, const BuildOptions &opts);

bool detect_vtt(const std::string &text);
std::vector<SubtitleEntry> parse_vtt(const std::string &text);
std::string build_vtt(const std::vector<Caption> &captions, const BuildOptions &opts);

bool detect_sbv(const std::string &text);
std::vector<SubtitleEntry> parse_sbv(const std::string &text);
std::string build_sbv(const std::vector<Caption> &captions, const BuildOptions &opts);

bool detect_sub(const std::string &text);
std::vector<SubtitleEntry> parse_sub(const std::string &text);
std::string build_sub(const std::vector<Caption> &captions, const BuildOptions &opts);

bool detect_lrc(const std::string &text);
std::vector<SubtitleEntry> parse_lrc(const std::string &text);
std::string build_lrc(const std::vector<Caption> &captions, const BuildOptions &opts);

bool detect_smi(const std::string &text);
std::vector<SubtitleEntry> parse_smi(const std::string &text);
std::string build_smi(const std::vector<Caption> &captions, const BuildOptions &opts);

bool detect_ssa(const std::string &text);
bool detect_ass(const std::string &text);
std::vector<SubtitleEntry> parse_ssa(const std::string &text);
std::string build_ssa(const std::vector<Caption> &captions, const BuildOptions &opts);
std::string build_ass(const std::vector<Caption> &captions, const BuildOptions &opts);

bool detect_json(const std::string &text);
std::vector<SubtitleEntry> parse_json(const std::string &text);
std::string build_json(const std::vector<Caption> &captions, const BuildOptions &opts);

}  // namespace codecs

// Shared line helpers for the grammars.
namespace codec_detail {

std::vector<std::string> split_lines(const std::string &text);

// Blocks of consecutive non-blank lines.
std::vector<std::vector<std::string>> split_blocks(const std::string &text);

std::string trim(const std::string &s);

std::string join_lines(const std::vector<std::string> &lines, size_t from,
                       const std::string &sep = "\n");

bool istarts_with(const std::string &s, const std::string &prefix);

// Parse "start --> end [settings]"; throws on a malformed timecode.
bool parse_arrow_line(const std::string &line, int64_t &start_ms, int64_t &end_ms);

}  // namespace codec_detail

}  // namespace subforge
