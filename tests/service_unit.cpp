// Request handlers: status codes, response bodies and headers for upload, download,
// optimize and streaming download.
#include <chrono>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>

#include "service.hpp"

namespace {

using json = nlohmann::json;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[service_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

const std::string kSrt =
    "1\n00:00:01,000 --> 00:00:02,000\n<i>Hello</i> there\n\n"
    "2\n00:00:03,000 --> 00:00:04,500\nSecond\n";
const std::string kMultipart = "multipart/form-data; boundary=----x";

class EchoGenerator : public subforge::TextGenerator {
   public:
    bool generate(const std::string &, const std::string &prompt,
                  const subforge::CancellationToken &, std::string &response,
                  std::string &) override {
        ++calls;
        const auto pos = prompt.find("Subtitles to optimize:\n");
        json items = json::parse(prompt.substr(pos + 23), nullptr, false);
        json out = json::array();
        for (const auto &item : items) {
            out.push_back({{"index", item["index"]}, {"content", "Better " +
                                                                 item["content"].get<std::string>()}});
        }
        response = out.dump();
        return true;
    }
    int calls = 0;
};

class ThrowingGenerator : public subforge::TextGenerator {
   public:
    bool generate(const std::string &, const std::string &, const subforge::CancellationToken &,
                  std::string &, std::string &) override {
        throw std::runtime_error("provider exploded");
    }
};

json body_of(const subforge::ServiceResponse &res) {
    return json::parse(res.body, nullptr, false);
}

bool test_upload() {
    using namespace subforge;
    SubtitleService service;
    auto res = service.handle_upload(kSrt, "clip.srt", kMultipart, "10.0.0.1");
    auto body = body_of(res);
    bool ok = check(res.status == 200, "upload accepted");
    ok &= check(body.value("success", false), "success flag");
    ok &= check(body.value("count", 0) == 2 && body["data"].size() == 2, "two captions returned");
    ok &= check(body.value("format", std::string()) == "srt", "format reported");
    ok &= check(body.value("filename", std::string()) == "clip.srt", "filename echoed");
    ok &= check(body["data"][0].value("content", std::string()) == "Hello there",
                "content sanitized");
    ok &= check(body["data"][1].value("start", 0) == 3000 && body["data"][1].value("end", 0) == 4500,
                "timing in ms");
    return ok;
}

bool test_upload_failures() {
    using namespace subforge;
    SubtitleService service;
    auto res = service.handle_upload(kSrt, "clip.srt", "application/json");
    bool ok = check(res.status == 415, "wrong content type is 415");
    ok &= check(body_of(res).value("error", std::string()) ==
                    "Invalid content type. Must be multipart/form-data",
                "content type message");

    res = service.handle_upload(kSrt, "", kMultipart);
    ok &= check(res.status == 400 && body_of(res).value("error", std::string()) == "No file provided",
                "missing file");

    res = service.handle_upload(kSrt, "clip.doc", kMultipart);
    ok &= check(res.status == 400 &&
                    body_of(res).value("kind", std::string()) == "unsupported_format",
                "bad extension");

    res = service.handle_upload("garbage without timing", "clip.srt", kMultipart);
    ok &= check(res.status == error_kind_http_status(ErrorKind::Parse) &&
                    body_of(res).value("success", true) == false,
                "unparseable upload");

    SubforgeConfig small;
    small.max_upload_bytes = 8;
    SubtitleService capped(small);
    res = capped.handle_upload(kSrt, "clip.srt", kMultipart);
    ok &= check(res.status == 400 && body_of(res).value("kind", std::string()) == "validation",
                "configured size cap");
    return ok;
}

bool test_rate_limit() {
    using namespace subforge;
    SubtitleService service;
    bool ok = true;
    for (int i = 0; i < 10; ++i) {
        ok &= check(service.handle_upload(kSrt, "clip.srt", kMultipart, "9.9.9.9").status == 200,
                    "upload " + std::to_string(i + 1) + " admitted");
    }
    auto res = service.handle_upload(kSrt, "clip.srt", kMultipart, "9.9.9.9");
    ok &= check(res.status == 429, "11th upload is 429");
    ok &= check(body_of(res).value("error", std::string()) ==
                    "Too many requests. Please try again later.",
                "rate limit message");
    ok &= check(service.handle_upload(kSrt, "clip.srt", kMultipart, "8.8.8.8").status == 200,
                "other clients unaffected");

    auto shared = std::make_shared<RateLimiter>(std::make_shared<InMemoryRateLimitStore>(), 1,
                                                std::chrono::milliseconds(60000));
    SubtitleService strict(SubforgeConfig{}, shared);
    strict.handle_upload(kSrt, "clip.srt", kMultipart);
    ok &= check(strict.handle_upload(kSrt, "clip.srt", kMultipart).status == 429,
                "anonymous clients share one identity");
    return ok;
}

bool test_expired_clients_swept() {
    using namespace subforge;
    SubforgeConfig cfg;
    cfg.rate_limit_window_ms = 20;
    SubtitleService service(cfg);
    for (int i = 0; i < 200; ++i) {
        service.handle_upload(kSrt, "clip.srt", kMultipart, "10.0.0." + std::to_string(i));
    }
    bool ok = check(service.rate_limiter().tracked_clients() > 0, "clients tracked after uploads");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (service.rate_limiter().tracked_clients() > 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ok &= check(service.rate_limiter().tracked_clients() == 0,
                "expired clients removed by the background sweep");
    return ok;
}

bool test_download() {
    using namespace subforge;
    SubtitleService service;
    json req = {{"format", "vtt"},
                {"filename", "clip.srt"},
                {"subtitles",
                 {{{"index", 7}, {"start", 1000}, {"end", 2000}, {"content", "<b>One</b>"}},
                  {{"index", 9}, {"start", 2500}, {"end", 3000}, {"text", "Two"}}}}};
    auto res = service.handle_download(req.dump());
    bool ok = check(res.status == 200, "download ok");
    ok &= check(res.content_type == "text/vtt", "vtt content type");
    ok &= check(res.filename == "clip-subforge.vtt", "attachment filename");
    ok &= check(res.uses_bom && res.body.compare(0, 3, "\xEF\xBB\xBF") == 0, "BOM first");
    ok &= check(res.body.find("1\n00:00:01.000 --> 00:00:02.000\nOne\n") != std::string::npos,
                "renumbered and sanitized");
    ok &= check(res.body.find("2\n00:00:02.500 --> 00:00:03.000\nTwo\n") != std::string::npos,
                "text used when content is absent");

    req["format"] = "json";
    res = service.handle_download(req.dump());
    ok &= check(res.status == 200 && !res.uses_bom && res.content_type == "application/json",
                "json download without BOM");

    req["format"] = "docx";
    res = service.handle_download(req.dump());
    ok &= check(res.status == 400 &&
                    body_of(res).value("kind", std::string()) == "unsupported_format",
                "unknown download format");

    req["format"] = "srt";
    req["subtitles"][0]["end"] = 500;
    res = service.handle_download(req.dump());
    ok &= check(body_of(res).value("kind", std::string()) == "serialization",
                "inverted timing is a serialization failure");

    req["subtitles"][0]["end"] = 1e300;
    res = service.handle_download(req.dump());
    ok &= check(res.status == 400 &&
                    body_of(res).value("error", std::string()) == "Invalid request data",
                "timing beyond int64 rejected");

    req["subtitles"][0]["start"] = -9.0e18;
    req["subtitles"][0]["end"] = 9.0e18;
    res = service.handle_download(req.dump());
    ok &= check(body_of(res).value("kind", std::string()) == "serialization",
                "negative start rejected by the serializer");

    ok &= check(service.handle_download("{not json").status == 400, "malformed request");
    ok &= check(service.handle_download(R"({"format":"srt","filename":"a.srt"})").status == 400,
                "missing subtitles");
    return ok;
}

bool test_optimize() {
    using namespace subforge;
    SubtitleService service;
    EchoGenerator gen;

    json many = {{"apiKey", "k"}, {"subtitles", json::array()}};
    for (int i = 1; i <= 60; ++i) {
        many["subtitles"].push_back({{"index", i}, {"content", "line"}});
    }
    auto res = service.handle_optimize(many.dump(), gen);
    bool ok = check(res.status == 400, "60 items is a 400");
    ok &= check(body_of(res).value("error", std::string()).find("Maximum 50") != std::string::npos,
                "batch size message");
    ok &= check(gen.calls == 0, "provider not called for an oversized request");

    json no_key = {{"subtitles", {{{"index", 1}, {"content", "a"}}}}};
    res = service.handle_optimize(no_key.dump(), gen);
    ok &= check(res.status == 400 &&
                    body_of(res).value("error", std::string()) == "API key is required",
                "missing key");

    json bad_item = {{"apiKey", "k"}, {"subtitles", {{{"index", "x"}, {"content", "a"}}}}};
    res = service.handle_optimize(bad_item.dump(), gen);
    ok &= check(res.status == 400 &&
                    body_of(res).value("error", std::string()) == "Invalid subtitle item",
                "non-numeric index rejected");

    json good = {{"apiKey", "k"},
                 {"subtitles", {{{"index", 2}, {"content", "two"}}, {{"index", 1}, {"content", "one"}}}}};
    res = service.handle_optimize(good.dump(), gen);
    auto body = body_of(res);
    ok &= check(res.status == 200 && body.value("success", false), "optimize ok");
    ok &= check(body["optimized"].size() == 2 && body["optimized"][0]["index"] == 1 &&
                    body["optimized"][0]["content"] == "Better one",
                "optimized items sorted by index");

    ThrowingGenerator broken;
    res = service.handle_optimize(good.dump(), broken);
    ok &= check(res.status == 500, "provider exception is a 500");
    ok &= check(body_of(res).value("error", std::string()) ==
                    "Failed to optimize subtitles: provider exploded",
                "provider exception message");
    return ok;
}

bool test_stream() {
    using namespace subforge;
    SubforgeConfig cfg;
    cfg.stream_window = 1;
    SubtitleService service(cfg);
    json req = {{"format", "srt"},
                {"filename", "clip.vtt"},
                {"subtitles",
                 {{{"start", 0}, {"end", 1000}, {"content", "A"}},
                  {{"start", 1000}, {"end", 2000}, {"content", "B"}}}}};
    auto opened = service.open_stream(req.dump());
    bool ok = check(opened.response.status == 200, "stream opened");
    ok &= check(opened.response.content_type == "text/plain; charset=utf-8", "stream content type");
    ok &= check(opened.response.filename == "clip-subforge.srt", "stream filename");
    ok &= check(opened.stream.total_windows() == 2, "one window per caption");
    std::string bytes;
    for (;;) {
        auto ev = opened.stream.next();
        if (ev.kind != StreamEventKind::Chunk) {
            ok &= check(ev.kind == StreamEventKind::End, "stream ends cleanly");
            break;
        }
        bytes += ev.data;
    }
    ok &= check(bytes == service.handle_download(req.dump()).body,
                "streamed bytes equal the download body");

    req["subtitles"] = json::array();
    ok &= check(service.open_stream(req.dump()).response.status == 400, "empty stream rejected");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_upload();
    ok &= test_upload_failures();
    ok &= test_rate_limit();
    ok &= test_expired_clients_swept();
    ok &= test_download();
    ok &= test_optimize();
    ok &= test_stream();
    return ok ? 0 : 1;
}
