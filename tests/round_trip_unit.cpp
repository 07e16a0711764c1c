// Lossless formats: a parsed document serialized and parsed again keeps index, timing
// and content.
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "format_parser.hpp"
#include "format_serializer.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[round_trip_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string read_fixture(const std::string &name) {
    std::ifstream f(std::string(TESTDATA_DIR) + "/" + name, std::ios::binary);
    if (!f.is_open()) {
        std::cerr << "[round_trip_unit] open failed for " << name << "\n";
        return {};
    }
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

bool same_captions(const subforge::CaptionDocument &a, const subforge::CaptionDocument &b,
                   const std::string &label) {
    if (!check(a.size() == b.size(), label + ": caption count preserved")) {
        return false;
    }
    bool ok = true;
    for (size_t i = 0; i < a.size(); ++i) {
        const auto &x = a.captions[i];
        const auto &y = b.captions[i];
        const std::string at = label + " caption " + std::to_string(i + 1);
        ok &= check(x.index == y.index, at + ": index");
        ok &= check(x.start_ms == y.start_ms && x.end_ms == y.end_ms, at + ": timing");
        ok &= check(x.content == y.content, at + ": content '" + y.content + "'");
    }
    return ok;
}

bool round_trip(const std::string &fixture, const std::string &format) {
    using namespace subforge;
    auto first = parse_subtitles(read_fixture(fixture), fixture);
    if (!check(first.status.ok, fixture + " parses")) {
        return false;
    }
    auto out = serialize(first.document, format);
    if (!check(out.status.ok, fixture + " serializes as " + format)) {
        return false;
    }
    auto second = parse_subtitles(out.bytes, "again." + format);
    if (!check(second.status.ok, fixture + " reparses from " + format)) {
        return false;
    }
    return same_captions(first.document, second.document, fixture + " -> " + format);
}

}  // namespace

int main() {
    bool ok = true;
    ok &= round_trip("three_captions.srt", "srt");
    ok &= round_trip("three_captions.srt", "vtt");
    ok &= round_trip("three_captions.srt", "sbv");
    ok &= round_trip("three_captions.srt", "json");
    ok &= round_trip("sample.vtt", "srt");
    ok &= round_trip("sample.vtt", "vtt");
    ok &= round_trip("sample.sbv", "sbv");
    ok &= round_trip("sample.json", "json");
    ok &= round_trip("sample.lrc", "json");
    return ok ? 0 : 1;
}
