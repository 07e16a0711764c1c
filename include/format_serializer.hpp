//
//  format_serializer.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "caption.hpp"
#include "status.hpp"
#include "subtitle_codec.hpp"
#include "subtitle_format.hpp"

namespace subforge {

inline constexpr const char *kDefaultBrandSuffix = "-subforge";
inline constexpr double kDefaultSubFps = 25.0;

struct SerializeOptions {
    double fps = kDefaultSubFps;              ///< MicroDVD frame rate
    bool include_meta = false;                ///< emit kind Meta entries where the format can
    bool add_bom = true;                      ///< BOM for text formats (json never gets one)
    std::string brand_suffix = kDefaultBrandSuffix;
};

/// Download-path result: `{bytes, contentType, filename, usesBOM}`.
struct SerializeResult {
    Status status;
    std::string bytes;
    std::string content_type;
    std::string filename;  ///< set by build_download()
    bool uses_bom = false;
    SubtitleFormat format = SubtitleFormat::Srt;
};

// MIME type for a format name; UnsupportedFormat when the name is unknown.
Status content_type_for(const std::string &format_name, std::string &content_type);

// "<stem><suffix>.<ext>": the original's last extension is replaced.
std::string output_filename(const std::string &original_name, SubtitleFormat format,
                            const std::string &brand_suffix = kDefaultBrandSuffix);

// Serialize items (renumbered 1..N in output order). Unknown formats fail before any
// byte is produced; build failures come back as Serialization.
SerializeResult serialize(const std::vector<Caption> &captions, const std::string &format_name,
                          const SerializeOptions &opts = {});
SerializeResult serialize(const CaptionDocument &doc, const std::string &format_name,
                          const SerializeOptions &opts = {});

// serialize() plus the suggested filename.
SerializeResult build_download(const CaptionDocument &doc, const std::string &format_name,
                               const std::string &original_name,
                               const SerializeOptions &opts = {});

// One fragment of a document, without BOM. Throws std::runtime_error on build failure.
std::string serialize_window(const std::vector<Caption> &captions, SubtitleFormat format,
                             const BuildOptions &build);

}  // namespace subforge
