// Windowed streaming: lazy production, byte equivalence with a one-shot build,
// consumer disconnect and serializer failure.
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "format_serializer.hpp"
#include "streaming_emitter.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[streaming_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

subforge::CaptionDocument make_document(size_t n) {
    subforge::CaptionDocument doc;
    for (size_t i = 0; i < n; ++i) {
        subforge::Caption c;
        c.index = static_cast<uint32_t>(i + 1);
        c.start_ms = static_cast<int64_t>(i) * 1500;
        c.end_ms = c.start_ms + 1000;
        c.duration_ms = 1000;
        c.content = "Caption number " + std::to_string(i + 1);
        c.text = c.content;
        doc.captions.push_back(c);
    }
    return doc;
}

// Drains a stream; returns false when an Error event is seen.
bool drain(subforge::ChunkStream &stream, std::string &bytes, size_t &chunks) {
    for (;;) {
        auto ev = stream.next();
        if (ev.kind == subforge::StreamEventKind::End) {
            return true;
        }
        if (ev.kind == subforge::StreamEventKind::Error) {
            return false;
        }
        bytes += ev.data;
        ++chunks;
    }
}

bool test_equivalence() {
    using namespace subforge;
    const auto doc = make_document(10);
    bool ok = true;
    for (const char *format : {"srt", "vtt", "json", "sbv", "smi", "ass", "ssa", "lrc", "sub"}) {
        StreamOptions opts;
        opts.window = 3;
        auto emitted = emit(doc, format, opts);
        if (!check(emitted.status.ok, std::string("emit ") + format)) {
            ok = false;
            continue;
        }
        std::string streamed;
        size_t chunks = 0;
        ok &= check(drain(emitted.stream, streamed, chunks), std::string("stream ") + format);
        ok &= check(chunks == 4, std::string("ten captions in four windows for ") + format);
        const auto oneshot = serialize(doc, format);
        ok &= check(streamed == oneshot.bytes,
                    std::string("streamed bytes equal one-shot output for ") + format);
    }
    return ok;
}

bool test_lazy_and_close() {
    using namespace subforge;
    auto calls = std::make_shared<size_t>(0);
    StreamOptions opts;
    opts.window = 2;
    opts.serializer = [calls](const std::vector<Caption> &captions, SubtitleFormat format,
                              const BuildOptions &build) {
        ++*calls;
        return serialize_window(captions, format, build);
    };
    auto emitted = emit(make_document(10), "srt", opts, "movie.srt");
    bool ok = check(emitted.status.ok, "emit succeeds");
    ok &= check(emitted.content_type == "text/plain; charset=utf-8", "chunked content type");
    ok &= check(emitted.filename == "movie-subforge.srt", "attachment filename");
    ok &= check(emitted.stream.total_windows() == 5, "five windows planned");
    ok &= check(*calls == 0, "nothing built before the first pull");

    auto first = emitted.stream.next();
    ok &= check(first.kind == StreamEventKind::Chunk, "first chunk");
    ok &= check(first.data.compare(0, 3, "\xEF\xBB\xBF") == 0, "BOM only on the first chunk");
    auto second = emitted.stream.next();
    ok &= check(second.kind == StreamEventKind::Chunk && second.data.rfind("\n3\n", 0) == 0,
                "second window continues the numbering");
    ok &= check(*calls == 2 && emitted.stream.windows_emitted() == 2, "two windows built");

    emitted.stream.close();
    ok &= check(emitted.stream.next().kind == StreamEventKind::End, "closed stream ends");
    ok &= check(*calls == 2, "windows 3-5 never built after close");
    ok &= check(emitted.stream.finished(), "stream finished");
    return ok;
}

bool test_error_event() {
    using namespace subforge;
    StreamOptions opts;
    opts.window = 2;
    opts.serializer = [](const std::vector<Caption> &captions, SubtitleFormat format,
                         const BuildOptions &build) -> std::string {
        if (build.first_number > 1) {
            throw std::runtime_error("window failed");
        }
        return serialize_window(captions, format, build);
    };
    auto emitted = emit(make_document(6), "vtt", opts);
    bool ok = check(emitted.stream.next().kind == StreamEventKind::Chunk, "first window ok");
    auto ev = emitted.stream.next();
    ok &= check(ev.kind == StreamEventKind::Error, "failure reported as an error event");
    ok &= check(ev.status.kind == ErrorKind::Serialization, "serialization kind");
    ok &= check(ev.status.message.find("window failed") != std::string::npos, "cause kept");
    ok &= check(emitted.stream.next().kind == StreamEventKind::End, "stream ends after error");

    auto doc = make_document(4);
    doc.captions[3].end_ms = 0;
    StreamOptions real;
    real.window = 2;
    auto inverted = emit(doc, "srt", real);
    std::string bytes;
    size_t chunks = 0;
    ok &= check(!drain(inverted.stream, bytes, chunks) && chunks == 1,
                "inverted timing fails in its window");
    return ok;
}

bool test_edge_cases() {
    using namespace subforge;
    auto bad = emit(make_document(2), "docx");
    bool ok = check(bad.status.kind == ErrorKind::UnsupportedFormat, "unknown format");
    StreamOptions zero;
    zero.window = 0;
    ok &= check(emit(make_document(2), "srt", zero).status.kind == ErrorKind::Validation,
                "zero window rejected");

    auto empty = emit(CaptionDocument{}, "json");
    std::string bytes;
    size_t chunks = 0;
    ok &= check(drain(empty.stream, bytes, chunks) && chunks == 1, "empty document, one window");
    ok &= check(bytes == serialize(CaptionDocument{}, "json").bytes, "empty json document");

    ChunkStream idle;
    ok &= check(idle.finished() && idle.next().kind == StreamEventKind::End,
                "default stream is finished");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_equivalence();
    ok &= test_lazy_and_close();
    ok &= test_error_event();
    ok &= test_edge_cases();
    return ok ? 0 : 1;
}
