// Per-format grammar coverage: content sniffing and parsing of every fixture in testdata/.
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "format_parser.hpp"
#include "subtitle_codec.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[codec_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::optional<std::string> read_fixture(const std::string &name) {
    const std::string path = std::string(TESTDATA_DIR) + "/" + name;
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        std::cerr << "[codec_unit] open failed for " << path << "\n";
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

bool expect_caption(const subforge::CaptionDocument &doc, size_t i, int64_t start, int64_t end,
                    const std::string &content, const std::string &label) {
    if (!check(i < doc.size(), label + ": caption " + std::to_string(i + 1) + " present")) {
        return false;
    }
    const auto &c = doc.captions[i];
    bool ok = check(c.index == i + 1, label + ": index " + std::to_string(i + 1));
    ok &= check(c.start_ms == start, label + ": start of caption " + std::to_string(i + 1));
    ok &= check(c.end_ms == end, label + ": end of caption " + std::to_string(i + 1));
    ok &= check(c.duration_ms == end - start, label + ": duration is end - start");
    ok &= check(c.content == content,
                label + ": content of caption " + std::to_string(i + 1) + " was '" + c.content +
                    "'");
    return ok;
}

subforge::ParseResult parse_fixture(const std::string &name) {
    auto bytes = read_fixture(name);
    if (!bytes) {
        subforge::ParseResult res;
        res.status = subforge::make_error(subforge::ErrorKind::Validation, "missing fixture");
        return res;
    }
    return subforge::parse_subtitles(*bytes, name);
}

bool test_detection() {
    using subforge::SubtitleFormat;
    const struct {
        const char *file;
        SubtitleFormat format;
    } cases[] = {
        {"three_captions.srt", SubtitleFormat::Srt}, {"sample.vtt", SubtitleFormat::Vtt},
        {"sample.sbv", SubtitleFormat::Sbv},         {"sample.sub", SubtitleFormat::Sub},
        {"sample.lrc", SubtitleFormat::Lrc},         {"sample.smi", SubtitleFormat::Smi},
        {"sample.ass", SubtitleFormat::Ass},         {"sample.ssa", SubtitleFormat::Ssa},
        {"sample.json", SubtitleFormat::Json},
    };
    bool ok = true;
    for (const auto &c : cases) {
        auto bytes = read_fixture(c.file);
        if (!bytes) {
            ok = false;
            continue;
        }
        auto detected = subforge::detect_format(subforge::normalize_newlines(*bytes));
        ok &= check(detected.has_value() && *detected == c.format,
                    std::string("detect_format for ") + c.file);
    }
    ok &= check(!subforge::detect_format("just some words\n").has_value(),
                "plain prose is not detected");
    return ok;
}

bool test_section_names_in_srt_text() {
    const std::string srt =
        "1\n00:00:01,000 --> 00:00:02,000\nOpen the [Events] tab\n\n"
        "2\n00:00:03,000 --> 00:00:04,000\nThen <SAMI> and [Script Info]\n";
    auto detected = subforge::detect_format(srt);
    bool ok = check(detected.has_value() && *detected == subforge::SubtitleFormat::Srt,
                    "section names inside captions do not override srt detection");
    auto res = subforge::parse_subtitles(srt, "clip.srt");
    ok &= check(res.status.ok, "srt mentioning [Events] parses");
    ok &= check(res.format == subforge::SubtitleFormat::Srt, "srt grammar used");
    ok &= check(res.document.size() == 2, "both captions kept");
    auto script = subforge::detect_format("\n[Script Info]\nScriptType: v4.00\n");
    ok &= check(script.has_value() && *script == subforge::SubtitleFormat::Ssa,
                "blank lines may precede the script header");
    return ok;
}

bool test_normalize_newlines() {
    const std::string raw = "\xEF\xBB\xBFline1\r\nline2\rline3\n";
    return check(subforge::normalize_newlines(raw) == "line1\nline2\nline3\n",
                 "BOM dropped and line endings folded");
}

bool test_srt() {
    auto res = parse_fixture("three_captions.srt");
    bool ok = check(res.status.ok, "srt parses");
    ok &= check(res.document.size() == 3, "srt yields three captions");
    ok &= expect_caption(res.document, 0, 1000, 3500, "Hello world", "srt");
    ok &= expect_caption(res.document, 1, 4000, 6000, "Second line\nwith a break", "srt");
    ok &= expect_caption(res.document, 2, 7250, 9000, "Third caption", "srt");
    return ok;
}

bool test_vtt() {
    auto res = parse_fixture("sample.vtt");
    bool ok = check(res.status.ok, "vtt parses");
    ok &= check(res.document.size() == 2, "vtt NOTE block dropped by default");
    ok &= expect_caption(res.document, 0, 1000, 2000, "Hi there", "vtt");
    ok &= expect_caption(res.document, 1, 2500, 4000, "How are you?", "vtt");
    return ok;
}

bool test_sbv() {
    auto res = parse_fixture("sample.sbv");
    bool ok = check(res.status.ok, "sbv parses");
    ok &= check(res.document.size() == 2, "sbv yields two captions");
    ok &= expect_caption(res.document, 0, 1000, 2500, "First sbv caption", "sbv");
    if (res.document.size() == 2) {
        ok &= check(res.document.captions[1].start_ms == 3000 &&
                        res.document.captions[1].end_ms == 5000,
                    "sbv second caption timing");
    }
    return ok;
}

bool test_sub() {
    auto res = parse_fixture("sample.sub");
    bool ok = check(res.status.ok, "sub parses");
    ok &= check(res.document.size() == 2, "sub frame-rate line is not a caption");
    ok &= expect_caption(res.document, 0, 1000, 3000, "First frame caption", "sub");
    ok &= expect_caption(res.document, 1, 4000, 6000, "Two\nlines", "sub");
    return ok;
}

bool test_lrc() {
    auto res = parse_fixture("sample.lrc");
    bool ok = check(res.status.ok, "lrc parses");
    ok &= check(res.document.size() == 4, "repeated timestamps expand to separate captions");
    ok &= expect_caption(res.document, 0, 1000, 5500, "First lyric", "lrc");
    ok &= expect_caption(res.document, 1, 5500, 10000, "Chorus line", "lrc");
    ok &= expect_caption(res.document, 2, 10000, 20000, "Middle lyric", "lrc");
    ok &= expect_caption(res.document, 3, 20000, 20000, "Chorus line", "lrc");

    subforge::ParseOptions opts;
    opts.keep_meta = true;
    auto with_meta = subforge::parse_subtitles(*read_fixture("sample.lrc"), "sample.lrc", opts);
    ok &= check(with_meta.status.ok && with_meta.document.size() == 6,
                "lrc id tags kept as meta when requested");
    return ok;
}

bool test_smi() {
    auto res = parse_fixture("sample.smi");
    bool ok = check(res.status.ok, "smi parses");
    ok &= check(res.document.size() == 2, "smi blank syncs close captions");
    ok &= expect_caption(res.document, 0, 1000, 3000, "First & best\ncaption", "smi");
    ok &= expect_caption(res.document, 1, 4000, 6000, "Second caption", "smi");
    return ok;
}

bool test_ass_and_ssa() {
    auto ass = parse_fixture("sample.ass");
    bool ok = check(ass.status.ok, "ass parses");
    ok &= check(ass.document.size() == 2, "ass style lines dropped by default");
    ok &= expect_caption(ass.document, 0, 1000, 2500, "{\\i1}Styled{\\i0} text, with comma", "ass");
    ok &= expect_caption(ass.document, 1, 3000, 4000, "Line one\nLine two", "ass");
    if (!ass.document.empty()) {
        ok &= check(ass.document.captions[0].text == "Styled text, with comma",
                    "ass plain text has override blocks removed");
    }

    auto ssa = parse_fixture("sample.ssa");
    ok &= check(ssa.status.ok, "ssa parses");
    ok &= expect_caption(ssa.document, 0, 1000, 2000, "Old style caption", "ssa");
    return ok;
}

bool test_json() {
    auto res = parse_fixture("sample.json");
    bool ok = check(res.status.ok, "json parses");
    ok &= expect_caption(res.document, 0, 1000, 2000, "From json", "json");
    ok &= expect_caption(res.document, 1, 2500, 4000, "Second json", "json");
    if (res.document.size() == 2) {
        ok &= check(res.document.captions[1].text == "Second json", "json text derived from content");
    }
    return ok;
}

bool test_build_shapes() {
    using namespace subforge;
    std::vector<Caption> caps(2);
    caps[0].index = 1;
    caps[0].start_ms = 1000;
    caps[0].end_ms = 3500;
    caps[0].content = "Hello world";
    caps[1].index = 2;
    caps[1].start_ms = 4000;
    caps[1].end_ms = 6000;
    caps[1].content = "Bye";
    BuildOptions opts;

    bool ok = check(codecs::build_srt(caps, opts) ==
                        "1\n00:00:01,000 --> 00:00:03,500\nHello world\n"
                        "\n2\n00:00:04,000 --> 00:00:06,000\nBye\n",
                    "srt block layout");
    ok &= check(codecs::build_vtt(caps, opts) ==
                    "WEBVTT\n\n1\n00:00:01.000 --> 00:00:03.500\nHello world\n\n"
                    "2\n00:00:04.000 --> 00:00:06.000\nBye\n\n",
                "vtt cue layout");
    ok &= check(codecs::build_sbv(caps, opts) ==
                    "0:00:01.000,0:00:03.500\nHello world\n\n0:00:04.000,0:00:06.000\nBye\n\n",
                "sbv block layout");
    ok &= check(codecs::build_sub(caps, opts) == "{25}{88}Hello world\n{100}{150}Bye\n",
                "sub frames at 25 fps");
    ok &= check(codecs::build_lrc(caps, opts) == "[00:01.00]Hello world\n[00:04.00]Bye\n",
                "lrc lines");
    const std::string smi = codecs::build_smi(caps, opts);
    ok &= check(smi.find("<SYNC Start=1000><P Class=ENCC>Hello world</P></SYNC>") !=
                    std::string::npos,
                "smi sync for caption 1");
    ok &= check(smi.rfind("</SAMI>\n") == smi.size() - 8, "smi footer closes the document");
    const std::string ass = codecs::build_ass(caps, opts);
    ok &= check(ass.rfind("[Script Info]", 0) == 0, "ass starts with the script header");
    ok &= check(ass.find("Dialogue: 0,0:00:01.00,0:00:03.50,") != std::string::npos,
                "ass dialogue timing in centiseconds");

    BuildOptions zero_fps;
    zero_fps.fps = 0;
    bool threw = false;
    try {
        codecs::build_sub(caps, zero_fps);
    } catch (const std::runtime_error &) {
        threw = true;
    }
    ok &= check(threw, "sub build rejects a zero frame rate");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_detection();
    ok &= test_section_names_in_srt_text();
    ok &= test_normalize_newlines();
    ok &= test_srt();
    ok &= test_vtt();
    ok &= test_sbv();
    ok &= test_sub();
    ok &= test_lrc();
    ok &= test_smi();
    ok &= test_ass_and_ssa();
    ok &= test_json();
    ok &= test_build_shapes();
    return ok ? 0 : 1;
}
