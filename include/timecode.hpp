//
//  timecode.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace subforge {

// SRT timecode `HH:MM:SS,mmm`. Hours use at least two digits and never wrap
// (360000000 ms -> "100:00:00,000"). Negative input is treated as 0.
std::string format_time(int64_t ms);

// WebVTT `HH:MM:SS.mmm`.
std::string format_vtt_time(int64_t ms);

// YouTube SBV `H:MM:SS.mmm`.
std::string format_sbv_time(int64_t ms);

// SSA/ASS `H:MM:SS.cc` (centiseconds, truncated).
std::string format_ass_time(int64_t ms);

// LRC `MM:SS.cc` (minutes keep counting past 59).
std::string format_lrc_time(int64_t ms);

// Parse `[H]H:MM:SS(,|.)fff`, `MM:SS(,|.)fff` or `H:MM:SS`. The fraction is read as a
// decimal fraction of a second (".5" -> 500 ms, ".25" -> 250 ms, ".123" -> 123 ms).
// Surrounding whitespace is ignored. Returns nullopt when the string is not a timecode.
std::optional<int64_t> parse_timecode(const std::string &s);

}  // namespace subforge
