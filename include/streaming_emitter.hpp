//
//  streaming_emitter.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "caption.hpp"
#include "format_serializer.hpp"
#include "status.hpp"
#include "subtitle_codec.hpp"
#include "subtitle_format.hpp"

namespace subforge {

inline constexpr size_t kDefaultStreamWindow = 100;
inline constexpr const char *kStreamContentType = "text/plain; charset=utf-8";

// Builds one window of captions as a document fragment. May throw std::runtime_error.
using WindowSerializer = std::function<std::string(
    const std::vector<Caption> &captions, SubtitleFormat format, const BuildOptions &build)>;

struct StreamOptions {
    size_t window = kDefaultStreamWindow;  ///< captions per chunk
    double fps = kDefaultSubFps;
    bool add_bom = true;
    bool include_meta = false;
    std::string brand_suffix = kDefaultBrandSuffix;
    WindowSerializer serializer;  ///< defaults to serialize_window()
};

enum class StreamEventKind { Chunk, End, Error };

struct StreamEvent {
    StreamEventKind kind = StreamEventKind::End;
    std::string data;  ///< chunk bytes (Chunk only)
    Status status;     ///< failure details (Error only)
};

/**
 * @brief Lazy, finite, non-restartable sequence of serialized windows.
 *
 * Each next() builds exactly one window and returns it as a Chunk; once every window
 * has been produced it returns End. A serializer failure returns Error and finishes the
 * stream. close() models a consumer disconnect: nothing further is computed and next()
 * returns End. Concatenating all Chunk data yields the same bytes as a one-shot
 * serialize() of the document, BOM included.
 */
class ChunkStream {
   public:
    ChunkStream() = default;
    ChunkStream(std::vector<Caption> captions, SubtitleFormat format, StreamOptions opts);

    StreamEvent next();
    void close();

    bool finished() const { return finished_; }
    size_t windows_emitted() const { return next_window_; }
    size_t total_windows() const { return total_windows_; }
    SubtitleFormat format() const { return format_; }

   private:
    std::vector<Caption> captions_;
    SubtitleFormat format_ = SubtitleFormat::Srt;
    StreamOptions opts_;
    size_t total_windows_ = 0;
    size_t next_window_ = 0;
    bool finished_ = true;
};

/// Chunked-transfer metadata plus the stream itself.
struct EmitResult {
    Status status;
    ChunkStream stream;
    std::string content_type;  ///< kStreamContentType
    std::string filename;      ///< set when an original name is given
};

// UnsupportedFormat for unknown names, Validation for a zero window size. No window is
// built until the first next().
EmitResult emit(const CaptionDocument &doc, const std::string &format_name,
                StreamOptions opts = {}, const std::string &original_name = {});

}  // namespace subforge
