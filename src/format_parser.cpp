//
//  format_parser.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "format_parser.hpp"

#include <chrono>
#include <exception>

#include "content_sanitizer.hpp"
#include "logging.hpp"

namespace subforge {

CaptionDocument normalize_entries(const std::vector<SubtitleEntry> &entries, bool keep_meta) {
    CaptionDocument doc;
    doc.captions.reserve(entries.size());
    uint32_t next_index = 1;
    for (const auto &e : entries) {
        const CaptionKind kind = e.kind.value_or(CaptionKind::Caption);
        if (kind == CaptionKind::Meta && !keep_meta) {
            continue;
        }
        Caption c;
        c.kind = kind;
        c.index = next_index++;
        c.start_ms = e.start_ms.value_or(0);
        c.end_ms = e.end_ms.value_or(0);
        if (c.start_ms < 0) {
            SF_LOG("warn", "caption " << c.index << " has negative start; clamped to 0");
            c.start_ms = 0;
        }
        if (c.end_ms < c.start_ms) {
            if (e.end_ms) {
                SF_LOG("warn", "caption " << c.index << " ends before it starts; end clamped");
            }
            c.end_ms = c.start_ms;
        }
        c.duration_ms = c.end_ms - c.start_ms;
        c.content = sanitize(e.content.empty() ? e.text : e.content);
        c.text = e.text.empty() ? strip_markup(c.content) : sanitize(e.text);
        doc.captions.push_back(std::move(c));
    }
    return doc;
}

ParseResult parse_subtitles(const std::string &raw, const std::string &declared_extension,
                            const ParseOptions &opts) {
    const auto t0 = std::chrono::steady_clock::now();
    ParseResult res;
    if (raw.size() > opts.max_bytes) {
        res.status = make_error(ErrorKind::Validation,
                                "File size exceeds " + std::to_string(opts.max_bytes / (1024 * 1024)) +
                                    "MB limit");
        SF_LOG("warn", res.status.message << " (" << raw.size() << " bytes)");
        return res;
    }
    auto declared = format_from_name(declared_extension);
    if (!declared) {
        res.status = make_error(ErrorKind::UnsupportedFormat,
                                "Invalid file type. Supported formats: " +
                                    supported_extensions_list());
        SF_LOG("warn", res.status.message << " (got '" << declared_extension << "')");
        return res;
    }

    const std::string text = normalize_newlines(raw);
    SubtitleFormat format = *declared;
    if (opts.autodetect) {
        if (auto detected = detect_format(text)) {
            if (*detected != *declared) {
                SF_LOG("info", "content looks like " << format_extension(*detected)
                                                     << ", declared " << format_extension(*declared));
            }
            format = *detected;
        }
    }
    res.format = format;

    std::vector<SubtitleEntry> entries;
    try {
        entries = codec_for(format).parse(text);
    } catch (const std::exception &e) {
        res.status = make_error(ErrorKind::Parse,
                                std::string("Failed to parse subtitle file: ") + e.what());
        SF_LOG("error", res.status.message);
        return res;
    }

    res.document = normalize_entries(entries, opts.keep_meta);
    if (caption_entries(res.document).empty()) {
        res.document = CaptionDocument{};
        res.status = make_error(ErrorKind::Parse,
                                "Failed to parse subtitle file: no valid subtitles found");
        SF_LOG("warn", res.status.message);
        return res;
    }
    res.status = ok_status();

    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0)
            .count();
    SF_LOG("parser", "parsed " << res.document.size() << " entries as "
                               << format_extension(format) << " in " << ms << " ms");
    return res;
}

}  // namespace subforge
