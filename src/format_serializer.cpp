//
//  format_serializer.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "format_serializer.hpp"

#include <exception>

#include "logging.hpp"

namespace subforge {

Status content_type_for(const std::string &format_name, std::string &content_type) {
    auto format = format_from_name(format_name);
    if (!format) {
        return make_error(ErrorKind::UnsupportedFormat, "Unsupported subtitle format");
    }
    content_type = format_content_type(*format);
    return ok_status();
}

std::string output_filename(const std::string &original_name, SubtitleFormat format,
                            const std::string &brand_suffix) {
    std::string stem = original_name;
    const auto dot = stem.find_last_of('.');
    const auto slash = stem.find_last_of('/');
    if (dot != std::string::npos && dot + 1 < stem.size() &&
        (slash == std::string::npos || dot > slash)) {
        stem = stem.substr(0, dot);
    }
    return stem + brand_suffix + "." + format_extension(format);
}

std::string serialize_window(const std::vector<Caption> &captions, SubtitleFormat format,
                             const BuildOptions &build) {
    check_build_timing(captions);
    return codec_for(format).build(captions, build);
}

SerializeResult serialize(const std::vector<Caption> &captions, const std::string &format_name,
                          const SerializeOptions &opts) {
    SerializeResult res;
    auto format = format_from_name(format_name);
    if (!format) {
        res.status = make_error(ErrorKind::UnsupportedFormat, "Unsupported subtitle format");
        SF_LOG("warn", res.status.message << " '" << format_name << "'");
        return res;
    }
    res.format = *format;
    res.content_type = format_content_type(*format);
    res.uses_bom = opts.add_bom && format_uses_bom(*format);

    std::vector<Caption> selected;
    selected.reserve(captions.size());
    for (const auto &c : captions) {
        if (c.kind == CaptionKind::Caption || opts.include_meta) {
            selected.push_back(c);
        }
    }

    BuildOptions build;
    build.fps = opts.fps;
    std::string body;
    try {
        body = serialize_window(selected, *format, build);
    } catch (const std::exception &e) {
        res.status = make_error(ErrorKind::Serialization,
                                std::string("Failed to convert subtitles to the requested format: ") +
                                    e.what());
        SF_LOG("error", res.status.message);
        return res;
    }
    if (res.uses_bom) {
        res.bytes.assign(reinterpret_cast<const char *>(kUtf8Bom), sizeof(kUtf8Bom));
    }
    res.bytes += body;
    res.status = ok_status();
    SF_LOG("codec", "serialized " << selected.size() << " captions as " << format_name << " ("
                                  << res.bytes.size() << " bytes)");
    return res;
}

SerializeResult serialize(const CaptionDocument &doc, const std::string &format_name,
                          const SerializeOptions &opts) {
    return serialize(doc.captions, format_name, opts);
}

SerializeResult build_download(const CaptionDocument &doc, const std::string &format_name,
                               const std::string &original_name, const SerializeOptions &opts) {
    auto res = serialize(doc, format_name, opts);
    if (res.status.ok) {
        res.filename = output_filename(original_name, res.format, opts.brand_suffix);
    }
    return res;
}

}  // namespace subforge
