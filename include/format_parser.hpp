//
//  format_parser.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "caption.hpp"
#include "status.hpp"
#include "subtitle_codec.hpp"
#include "subtitle_format.hpp"

namespace subforge {

inline constexpr size_t kMaxUploadBytes = 50 * 1024 * 1024;  // 50 MiB

struct ParseOptions {
    size_t max_bytes = kMaxUploadBytes;
    bool keep_meta = false;   // keep style/metadata entries (kind Meta) in the document
    bool autodetect = true;   // sniff the grammar from content before trusting the extension
};

struct ParseResult {
    Status status;
    CaptionDocument document;
    SubtitleFormat format = SubtitleFormat::Srt;  ///< grammar that was actually used
};

/**
 * @brief Parse raw subtitle bytes into a normalized CaptionDocument.
 *
 * Size and extension are validated before any parsing work. Entries are re-indexed
 * 1..N in returned order, timings default to 0, and content/text are sanitized.
 *
 * @param raw Raw file bytes (UTF-8, optional BOM, any line ending).
 * @param declared_extension "srt", ".srt" or a filename carrying the extension.
 * @param opts Size cap and meta handling.
 */
ParseResult parse_subtitles(const std::string &raw, const std::string &declared_extension,
                            const ParseOptions &opts = {});

// Normalization shared by the upload and download paths: drop meta unless kept,
// assign indices, default/clamp timings, sanitize content and text.
CaptionDocument normalize_entries(const std::vector<SubtitleEntry> &entries, bool keep_meta);

}  // namespace subforge
