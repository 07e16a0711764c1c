//
//  streaming_emitter.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "streaming_emitter.hpp"

#include <algorithm>
#include <exception>

#include "logging.hpp"

namespace subforge {

ChunkStream::ChunkStream(std::vector<Caption> captions, SubtitleFormat format,
                         StreamOptions opts)
    : captions_(std::move(captions)), format_(format), opts_(std::move(opts)) {
    if (!opts_.serializer) {
        opts_.serializer = serialize_window;
    }
    // An empty document still yields one (header/footer only) window.
    total_windows_ = std::max<size_t>(1, (captions_.size() + opts_.window - 1) / opts_.window);
    finished_ = false;
}

StreamEvent ChunkStream::next() {
    StreamEvent ev;
    if (finished_) {
        return ev;
    }
    if (next_window_ >= total_windows_) {
        finished_ = true;
        SF_LOG("stream", "stream complete after " << next_window_ << " window(s)");
        return ev;
    }

    const size_t begin = next_window_ * opts_.window;
    const size_t end = std::min(captions_.size(), begin + opts_.window);
    std::vector<Caption> window(captions_.begin() + static_cast<std::ptrdiff_t>(begin),
                                captions_.begin() + static_cast<std::ptrdiff_t>(end));

    BuildOptions build;
    build.fps = opts_.fps;
    build.first_number = static_cast<uint32_t>(begin + 1);
    build.header = next_window_ == 0;
    build.footer = next_window_ + 1 == total_windows_;

    std::string body;
    try {
        body = opts_.serializer(window, format_, build);
    } catch (const std::exception &e) {
        finished_ = true;
        ev.kind = StreamEventKind::Error;
        ev.status = make_error(ErrorKind::Serialization,
                               std::string("Failed to convert subtitles to the requested format: ") +
                                   e.what());
        SF_LOG("error", "window " << next_window_ + 1 << "/" << total_windows_ << ": "
                                  << ev.status.message);
        return ev;
    }

    if (next_window_ == 0 && opts_.add_bom && format_uses_bom(format_)) {
        ev.data.assign(reinterpret_cast<const char *>(kUtf8Bom), sizeof(kUtf8Bom));
    }
    ev.data += body;
    ev.kind = StreamEventKind::Chunk;
    ++next_window_;
    SF_LOG("stream", "window " << next_window_ << "/" << total_windows_ << " ("
                               << window.size() << " captions, " << ev.data.size()
                               << " bytes)");
    return ev;
}

void ChunkStream::close() {
    if (!finished_) {
        SF_LOG("stream", "consumer closed stream after " << next_window_ << "/"
                                                         << total_windows_ << " window(s)");
    }
    finished_ = true;
    captions_.clear();
}

EmitResult emit(const CaptionDocument &doc, const std::string &format_name, StreamOptions opts,
                const std::string &original_name) {
    EmitResult res;
    auto format = format_from_name(format_name);
    if (!format) {
        res.status = make_error(ErrorKind::UnsupportedFormat, "Unsupported subtitle format");
        SF_LOG("warn", res.status.message << " '" << format_name << "'");
        return res;
    }
    if (opts.window == 0) {
        res.status = make_error(ErrorKind::Validation, "Stream window size must be positive");
        return res;
    }

    std::vector<Caption> selected;
    selected.reserve(doc.captions.size());
    for (const auto &c : doc.captions) {
        if (c.kind == CaptionKind::Caption || opts.include_meta) {
            selected.push_back(c);
        }
    }
    if (!original_name.empty()) {
        res.filename = output_filename(original_name, *format, opts.brand_suffix);
    }
    res.content_type = kStreamContentType;
    res.stream = ChunkStream(std::move(selected), *format, std::move(opts));
    res.status = ok_status();
    SF_LOG("stream", "opened " << format_extension(*format) << " stream, "
                               << res.stream.total_windows() << " window(s)");
    return res;
}

}  // namespace subforge
