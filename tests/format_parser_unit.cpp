// Upload-path parsing: validation order, normalization and failure kinds.
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "caption.hpp"
#include "format_parser.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[format_parser_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string read_fixture(const std::string &name) {
    std::ifstream f(std::string(TESTDATA_DIR) + "/" + name, std::ios::binary);
    if (!f.is_open()) {
        std::cerr << "[format_parser_unit] open failed for " << name << "\n";
        return {};
    }
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

bool test_three_captions() {
    using namespace subforge;
    auto res = parse_subtitles(read_fixture("three_captions.srt"), "three_captions.srt");
    bool ok = check(res.status.ok, "three caption srt parses");
    ok &= check(res.format == SubtitleFormat::Srt, "format reported as srt");
    ok &= check(res.document.size() == 3, "three captions returned");
    ok &= check(is_normalized(res.document), "indices are 1..N");
    for (const auto &c : res.document.captions) {
        ok &= check(c.content.find('<') == std::string::npos &&
                        c.content.find('>') == std::string::npos,
                    "content of caption " + std::to_string(c.index) + " is sanitized");
        ok &= check(c.end_ms >= c.start_ms && c.duration_ms == c.end_ms - c.start_ms,
                    "timing consistent for caption " + std::to_string(c.index));
    }
    if (res.document.size() == 3) {
        ok &= check(res.document.captions[0].text == "Hello world", "plain text of caption 1");
    }
    return ok;
}

bool test_size_limit() {
    using namespace subforge;
    std::string big(kMaxUploadBytes + 1, 'a');
    auto res = parse_subtitles(big, "big.srt");
    bool ok = check(!res.status.ok && res.status.kind == ErrorKind::Validation,
                    "oversized upload is a validation error");
    ok &= check(res.status.message == "File size exceeds 50MB limit", "size message");
    ok &= check(res.document.empty(), "no document on failure");

    // The size check runs before the extension check.
    auto both = parse_subtitles(big, "big.exe");
    ok &= check(both.status.kind == ErrorKind::Validation, "size is checked before extension");

    ParseOptions small;
    small.max_bytes = 16;
    auto capped = parse_subtitles(read_fixture("three_captions.srt"), "x.srt", small);
    ok &= check(capped.status.kind == ErrorKind::Validation, "configured cap applies");
    return ok;
}

bool test_extension() {
    using namespace subforge;
    auto res = parse_subtitles("1\n00:00:01,000 --> 00:00:02,000\nHi\n", "notes.txt");
    bool ok = check(res.status.kind == ErrorKind::UnsupportedFormat, "unknown extension rejected");
    ok &= check(res.status.message.rfind("Invalid file type. Supported formats: .srt", 0) == 0,
                "extension message lists formats");
    auto upper = parse_subtitles("1\n00:00:01,000 --> 00:00:02,000\nHi\n", "MOVIE.SRT");
    ok &= check(upper.status.ok, "extension match is case-insensitive");
    return ok;
}

bool test_parse_failures() {
    using namespace subforge;
    auto broken = parse_subtitles(read_fixture("broken.srt"), "broken.srt");
    bool ok = check(broken.status.kind == ErrorKind::Parse, "malformed timing is a parse error");
    ok &= check(broken.status.message.rfind("Failed to parse subtitle file: ", 0) == 0,
                "parse message prefix");

    auto empty = parse_subtitles(read_fixture("empty_like.srt"), "empty_like.srt");
    ok &= check(empty.status.kind == ErrorKind::Parse, "file without captions is a parse error");
    ok &= check(empty.status.message ==
                    "Failed to parse subtitle file: no valid subtitles found",
                "zero captions message");

    auto nothing = parse_subtitles("", "empty.vtt");
    ok &= check(nothing.status.kind == ErrorKind::Parse, "empty upload is a parse error");
    return ok;
}

bool test_autodetect() {
    using namespace subforge;
    const std::string vtt = "WEBVTT\n\n00:00:01.000 --> 00:00:02.000\nNamed wrong\n";
    auto res = parse_subtitles(vtt, "mislabelled.srt");
    bool ok = check(res.status.ok && res.format == SubtitleFormat::Vtt,
                    "content sniffing wins over the extension");

    ParseOptions strict;
    strict.autodetect = false;
    auto declared = parse_subtitles(vtt, "mislabelled.srt", strict);
    ok &= check(declared.format == SubtitleFormat::Srt, "declared grammar used when sniffing is off");
    return ok;
}

bool test_meta() {
    using namespace subforge;
    ParseOptions keep;
    keep.keep_meta = true;
    auto res = parse_subtitles(read_fixture("sample.vtt"), "sample.vtt", keep);
    bool ok = check(res.status.ok && res.document.size() == 3, "NOTE kept as meta");
    if (res.document.size() == 3) {
        ok &= check(res.document.captions[0].kind == CaptionKind::Meta, "first entry is meta");
        ok &= check(res.document.captions[1].index == 2, "meta entries take an index");
    }
    ok &= check(caption_entries(res.document).size() == 2, "caption_entries skips meta");
    ok &= check(to_caption_contents(res.document).size() == 2, "optimizer view skips meta");
    return ok;
}

bool test_normalize_entries() {
    using namespace subforge;
    std::vector<SubtitleEntry> entries(3);
    entries[0].start_ms = -20;
    entries[0].end_ms = 500;
    entries[0].content = "<b>clamped</b>";
    entries[1].start_ms = 2000;
    entries[1].end_ms = 1000;
    entries[1].content = "inverted";
    entries[2].text = "text only";
    auto doc = normalize_entries(entries, false);
    bool ok = check(doc.size() == 3, "all entries kept");
    if (doc.size() == 3) {
        ok &= check(doc.captions[0].start_ms == 0 && doc.captions[0].content == "clamped",
                    "negative start clamped and content sanitized");
        ok &= check(doc.captions[1].end_ms == 2000 && doc.captions[1].duration_ms == 0,
                    "inverted end clamped to start");
        ok &= check(doc.captions[2].start_ms == 0 && doc.captions[2].end_ms == 0,
                    "missing timing defaults to zero");
        ok &= check(doc.captions[2].content == "text only", "content falls back to text");
    }
    return ok;
}

}  // namespace

bool test_json_timing_range() {
    using namespace subforge;
    auto huge = parse_subtitles(R"([{"start": 1e300, "end": 2000, "content": "x"}])", "a.json");
    bool ok = check(huge.status.kind == ErrorKind::Parse, "float beyond int64 rejected");
    ok &= check(huge.status.message.find("'start' is out of range") != std::string::npos,
                "out of range field named");

    auto unsigned_end = parse_subtitles(
        R"([{"start": 0, "end": 18446744073709551615, "content": "x"}])", "a.json");
    ok &= check(unsigned_end.status.kind == ErrorKind::Parse, "unsigned beyond int64 rejected");

    auto fractional = parse_subtitles(R"([{"start": 1.5e3, "end": 2500.9, "content": "x"}])",
                                      "a.json");
    ok &= check(fractional.status.ok && fractional.document.size() == 1, "fractional ms accepted");
    ok &= check(fractional.document.captions[0].start_ms == 1500 &&
                    fractional.document.captions[0].end_ms == 2500,
                "fractional ms truncated");
    return ok;
}

int main() {
    bool ok = true;
    ok &= test_three_captions();
    ok &= test_size_limit();
    ok &= test_extension();
    ok &= test_parse_failures();
    ok &= test_autodetect();
    ok &= test_meta();
    ok &= test_normalize_entries();
    ok &= test_json_timing_range();
    return ok ? 0 : 1;
}
