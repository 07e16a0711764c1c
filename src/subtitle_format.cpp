//
//  subtitle_format.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_format.hpp"

#include <cctype>

namespace subforge {

namespace {

struct FormatInfo {
    SubtitleFormat format;
    const char *extension;
    const char *content_type;
    bool bom;
};

constexpr FormatInfo kFormats[] = {
    {SubtitleFormat::Srt, "srt", "application/x-subrip", true},
    {SubtitleFormat::Vtt, "vtt", "text/vtt", true},
    {SubtitleFormat::Sub, "sub", "text/plain", true},
    {SubtitleFormat::Sbv, "sbv", "text/plain", true},
    {SubtitleFormat::Lrc, "lrc", "text/plain", true},
    {SubtitleFormat::Smi, "smi", "text/plain", true},
    {SubtitleFormat::Ssa, "ssa", "text/plain", true},
    {SubtitleFormat::Ass, "ass", "text/plain", true},
    {SubtitleFormat::Json, "json", "application/json", false},
};

const FormatInfo &info_for(SubtitleFormat format) {
    for (const auto &f : kFormats) {
        if (f.format == format) {
            return f;
        }
    }
    return kFormats[0];
}

}  // namespace

std::optional<SubtitleFormat> format_from_name(const std::string &name) {
    std::string ext = name;
    auto dot = name.find_last_of('.');
    if (dot != std::string::npos) {
        ext = name.substr(dot + 1);
    }
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    for (const auto &f : kFormats) {
        if (ext == f.extension) {
            return f.format;
        }
    }
    return std::nullopt;
}

const char *format_extension(SubtitleFormat format) { return info_for(format).extension; }

const char *format_content_type(SubtitleFormat format) { return info_for(format).content_type; }

bool format_uses_bom(SubtitleFormat format) { return info_for(format).bom; }

const std::vector<SubtitleFormat> &supported_formats() {
    static const std::vector<SubtitleFormat> all = [] {
        std::vector<SubtitleFormat> v;
        for (const auto &f : kFormats) {
            v.push_back(f.format);
        }
        return v;
    }();
    return all;
}

std::string supported_extensions_list() {
    std::string out;
    for (const auto &f : kFormats) {
        if (!out.empty()) {
            out += ", ";
        }
        out += ".";
        out += f.extension;
    }
    return out;
}

}  // namespace subforge
