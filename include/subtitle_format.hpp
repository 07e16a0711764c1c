//
//  subtitle_format.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace subforge {

enum class SubtitleFormat { Srt, Vtt, Sub, Sbv, Lrc, Smi, Ssa, Ass, Json };

// Accepts "srt", ".SRT" or a filename such as "movie.en.srt" (last extension wins).
std::optional<SubtitleFormat> format_from_name(const std::string &name);

// Lowercase extension without dot ("srt").
const char *format_extension(SubtitleFormat format);

// MIME type served for the format.
const char *format_content_type(SubtitleFormat format);

// Text formats get a UTF-8 BOM on output; json does not.
bool format_uses_bom(SubtitleFormat format);

// All supported formats in canonical order.
const std::vector<SubtitleFormat> &supported_formats();

// ".srt, .vtt, ..." for error messages.
std::string supported_extensions_list();

inline constexpr unsigned char kUtf8Bom[3] = {0xEF, 0xBB, 0xBF};

}  // namespace subforge
