// Download-path serialization: BOM, content types, filenames and failure kinds.
#include <iostream>
#include <string>
#include <vector>

#include "format_parser.hpp"
#include "format_serializer.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[serializer_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

const std::string kBom = "\xEF\xBB\xBF";

subforge::CaptionDocument sample_document() {
    subforge::CaptionDocument doc;
    for (uint32_t i = 1; i <= 3; ++i) {
        subforge::Caption c;
        c.index = i;
        c.start_ms = (i - 1) * 2000;
        c.end_ms = c.start_ms + 1500;
        c.duration_ms = 1500;
        c.content = "Caption " + std::to_string(i);
        c.text = c.content;
        doc.captions.push_back(c);
    }
    return doc;
}

bool test_bom() {
    using namespace subforge;
    const auto doc = sample_document();
    bool ok = true;
    for (auto format : supported_formats()) {
        const std::string name = format_extension(format);
        auto res = serialize(doc, name);
        ok &= check(res.status.ok, name + " serializes");
        const bool has_bom = res.bytes.compare(0, 3, kBom) == 0;
        if (format == SubtitleFormat::Json) {
            ok &= check(!has_bom && !res.uses_bom, "json never carries a BOM");
        } else {
            ok &= check(has_bom && res.uses_bom, name + " starts with a BOM");
        }
    }
    SerializeOptions plain;
    plain.add_bom = false;
    auto res = serialize(doc, "srt", plain);
    ok &= check(res.bytes.compare(0, 3, kBom) != 0 && !res.uses_bom, "BOM can be disabled");
    return ok;
}

bool test_content_types() {
    using namespace subforge;
    std::string ct;
    bool ok = check(content_type_for("srt", ct).ok && ct == "application/x-subrip", "srt type");
    ok &= check(content_type_for("vtt", ct).ok && ct == "text/vtt", "vtt type");
    ok &= check(content_type_for("json", ct).ok && ct == "application/json", "json type");
    ok &= check(content_type_for("ass", ct).ok && ct == "text/plain", "ass type");
    ok &= check(content_type_for("docx", ct).kind == ErrorKind::UnsupportedFormat,
                "unknown format rejected");
    return ok;
}

bool test_filenames() {
    using namespace subforge;
    bool ok = check(output_filename("x.srt", SubtitleFormat::Vtt) == "x-subforge.vtt",
                    "extension replaced and suffix added");
    ok &= check(output_filename("movie.en.srt", SubtitleFormat::Srt) == "movie.en-subforge.srt",
                "only the last extension is replaced");
    ok &= check(output_filename("noext", SubtitleFormat::Json) == "noext-subforge.json",
                "name without extension keeps its stem");
    ok &= check(output_filename("x.srt", SubtitleFormat::Ass, "-clean") == "x-clean.ass",
                "custom suffix");

    auto res = build_download(sample_document(), "vtt", "x.srt");
    ok &= check(res.status.ok && res.filename == "x-subforge.vtt", "build_download filename");
    ok &= check(res.content_type == "text/vtt", "srt -> vtt served as text/vtt");
    ok &= check(res.bytes.compare(3, 6, "WEBVTT") == 0, "vtt body follows the BOM");
    return ok;
}

bool test_failures() {
    using namespace subforge;
    auto unknown = serialize(sample_document(), "docx");
    bool ok = check(unknown.status.kind == ErrorKind::UnsupportedFormat, "unknown target format");
    ok &= check(unknown.bytes.empty(), "no bytes for an unknown format");

    auto doc = sample_document();
    doc.captions[1].end_ms = doc.captions[1].start_ms - 1;
    auto inverted = serialize(doc, "srt");
    ok &= check(inverted.status.kind == ErrorKind::Serialization, "inverted timing rejected");
    ok &= check(inverted.bytes.empty(), "no partial output on failure");

    doc = sample_document();
    doc.captions[0].start_ms = -1;
    ok &= check(serialize(doc, "vtt").status.kind == ErrorKind::Serialization,
                "negative timing rejected");

    SerializeOptions no_fps;
    no_fps.fps = 0;
    ok &= check(serialize(sample_document(), "sub", no_fps).status.kind ==
                    ErrorKind::Serialization,
                "sub needs a positive frame rate");
    return ok;
}

bool test_renumbering_and_meta() {
    using namespace subforge;
    auto doc = sample_document();
    Caption note;
    note.kind = CaptionKind::Meta;
    note.index = 4;
    note.content = "NOTE kept";
    doc.captions.insert(doc.captions.begin(), note);

    SerializeOptions opts;
    opts.add_bom = false;
    auto dropped = serialize(doc, "vtt", opts);
    bool ok = check(dropped.bytes.find("NOTE") == std::string::npos, "meta dropped by default");
    ok &= check(dropped.bytes.find("\n1\n00:00:00.000") != std::string::npos,
                "first caption numbered 1");

    opts.include_meta = true;
    auto kept = serialize(doc, "vtt", opts);
    ok &= check(kept.bytes.find("NOTE kept\n\n") != std::string::npos, "meta emitted on request");

    std::vector<Caption> gaps = sample_document().captions;
    gaps[0].index = 10;
    gaps[1].index = 20;
    gaps[2].index = 30;
    auto renumbered = serialize(gaps, "srt", SerializeOptions{25.0, false, false, "-subforge"});
    ok &= check(renumbered.bytes.rfind("1\n", 0) == 0 &&
                    renumbered.bytes.find("\n3\n") != std::string::npos,
                "output renumbered 1..N");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_bom();
    ok &= test_content_types();
    ok &= test_filenames();
    ok &= test_failures();
    ok &= test_renumbering_and_meta();
    return ok ? 0 : 1;
}
