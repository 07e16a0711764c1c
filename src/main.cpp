//
//  main.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "caption_json.hpp"
#include "config.hpp"
#include "gemini_client.hpp"
#include "logging.hpp"
#include "subforge.hpp"
#include "subforge_version.hpp"
#include <nlohmann/json.hpp>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) { g_interrupted = 1; }

void print_usage() {
    std::cerr << "SubForge " << SUBFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  subforge parse <input>\n"
              << "  subforge convert <input> <format> [--output DIR]\n"
              << "  subforge stream <input> <format>\n"
              << "  subforge optimize <input> [--format F] [--output DIR]\n"
              << "Formats: srt vtt sub sbv lrc smi ssa ass json\n"
              << "Options:\n"
              << "  --config FILE       Read settings from a JSON file.\n"
              << "  --api-key KEY       Gemini API key (default: $SUBFORGE_API_KEY, then "
                 "$GEMINI_API_KEY).\n"
              << "  --output DIR        Directory for written files (default: next to input).\n"
              << "  --format F          Output format for optimize (default: input format).\n"
              << "  --log-level LEVEL   Set logging verbosity (default: warn).\n"
              << "  --version           Print version and exit.\n";
}

subforge::ParseOptions parse_options(const subforge::SubforgeConfig &cfg) {
    subforge::ParseOptions opts;
    opts.max_bytes = cfg.max_upload_bytes;
    return opts;
}

subforge::SerializeOptions serialize_options(const subforge::SubforgeConfig &cfg) {
    subforge::SerializeOptions opts;
    opts.fps = cfg.sub_fps;
    opts.brand_suffix = cfg.brand_suffix;
    return opts;
}

int run_parse(const subforge::SubforgeConfig &cfg, const std::string &input) {
    auto res = subforge::parse_subtitle_file(input, parse_options(cfg));
    if (!res.status.ok) {
        SF_LOG("error", "subforge: failed to parse " << input << ": " << res.status.message);
        return 1;
    }
    nlohmann::json j;
    j["filename"] = std::filesystem::path(input).filename().string();
    j["format"] = subforge::format_extension(res.format);
    j["count"] = res.document.size();
    j["data"] = subforge::document_to_json(res.document);
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return 0;
}

int run_convert(const subforge::SubforgeConfig &cfg, const std::string &input,
                const std::string &format, const std::string &output_dir) {
    auto res = subforge::convert_subtitle_file(input, format, output_dir, serialize_options(cfg));
    if (!res.status.ok) {
        SF_LOG("error", "subforge: failed to convert " << input << ": " << res.status.message);
        return 1;
    }
    std::cout << "Wrote: " << res.filename << "\n";
    return 0;
}

int run_stream(const subforge::SubforgeConfig &cfg, const std::string &input,
               const std::string &format) {
    auto parsed = subforge::parse_subtitle_file(input, parse_options(cfg));
    if (!parsed.status.ok) {
        SF_LOG("error", "subforge: failed to parse " << input << ": " << parsed.status.message);
        return 1;
    }
    subforge::StreamOptions opts;
    opts.window = cfg.stream_window;
    opts.fps = cfg.sub_fps;
    opts.brand_suffix = cfg.brand_suffix;
    auto emitted = subforge::emit(parsed.document, format, std::move(opts));
    if (!emitted.status.ok) {
        SF_LOG("error", "subforge: " << emitted.status.message);
        return 1;
    }
    // Ctrl-C or a closed pipe ends the stream like a client disconnect.
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif
    for (;;) {
        if (g_interrupted) {
            emitted.stream.close();
            SF_LOG("warn", "subforge: stream interrupted");
            return 130;
        }
        auto ev = emitted.stream.next();
        if (ev.kind == subforge::StreamEventKind::End) {
            break;
        }
        if (ev.kind == subforge::StreamEventKind::Error) {
            SF_LOG("error", "subforge: stream aborted: " << ev.status.message);
            return 1;
        }
        std::cout.write(ev.data.data(), static_cast<std::streamsize>(ev.data.size()));
        std::cout.flush();
        if (!std::cout.good()) {
            emitted.stream.close();
            SF_LOG("error", "subforge: stdout closed");
            return 1;
        }
    }
    return 0;
}

int run_optimize(const subforge::SubforgeConfig &cfg, const std::string &input,
                 const std::string &format, const std::string &output_dir) {
    if (cfg.api_key.empty()) {
        SF_LOG("error", "subforge: API key is required (--api-key or $SUBFORGE_API_KEY)");
        return 2;
    }
    auto parsed = subforge::parse_subtitle_file(input, parse_options(cfg));
    if (!parsed.status.ok) {
        SF_LOG("error", "subforge: failed to parse " << input << ": " << parsed.status.message);
        return 1;
    }

    subforge::GeminiClient client(subforge::gemini_settings(cfg));
    subforge::OptimizerSettings settings;
    settings.max_items = cfg.max_items_per_request;
    settings.max_tokens_per_batch = cfg.max_tokens_per_batch;
    settings.chars_per_token = cfg.chars_per_token;
    auto optimized = subforge::optimize_document(parsed.document, client, cfg.api_key, settings);
    if (!optimized.status.ok) {
        SF_LOG("error", "subforge: optimize failed: " << optimized.status.message);
        return 1;
    }

    const std::string target_format =
        format.empty() ? subforge::format_extension(parsed.format) : format;
    const std::filesystem::path in(input);
    auto out = subforge::build_download(parsed.document, target_format, in.filename().string(),
                                        serialize_options(cfg));
    if (!out.status.ok) {
        SF_LOG("error", "subforge: " << out.status.message);
        return 1;
    }
    const std::filesystem::path dir =
        output_dir.empty() ? in.parent_path() : std::filesystem::path(output_dir);
    const std::string target = (dir / out.filename).string();
    auto st = subforge::write_output_file(target, out.bytes);
    if (!st.ok) {
        SF_LOG("error", "subforge: " << st.message);
        return 1;
    }
    std::cout << "Optimized " << optimized.optimized.size() << " subtitles in "
              << optimized.batches << " request(s)\n"
              << "Wrote: " << target << "\n";
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "SubForge " << SUBFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    subforge::SubforgeConfig cfg;
    subforge::apply_env(cfg);

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::string config_path;
    std::string api_key;
    std::string log_level;
    std::string output_dir;
    std::string format;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--api-key" && i + 1 < argc) {
            api_key = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    // File settings sit below environment and flags.
    if (!config_path.empty()) {
        subforge::SubforgeConfig from_file;
        auto st = subforge::load_config(config_path, from_file);
        if (!st.ok) {
            std::cerr << st.message << "\n";
            return 2;
        }
        subforge::apply_env(from_file);
        cfg = std::move(from_file);
    }
    if (!api_key.empty()) {
        cfg.api_key = api_key;
    }
    if (!log_level.empty()) {
        cfg.log_level = subforge::parse_log_verbosity(log_level);
    }
    subforge::set_log_verbosity(cfg.log_level);

    if (positional.size() < 2) {
        print_usage();
        return 2;
    }
    const std::string &command = positional[0];
    if (command == "parse" && positional.size() == 2) {
        return run_parse(cfg, positional[1]);
    }
    if (command == "convert" && positional.size() == 3) {
        return run_convert(cfg, positional[1], positional[2], output_dir);
    }
    if (command == "stream" && positional.size() == 3) {
        return run_stream(cfg, positional[1], positional[2]);
    }
    if (command == "optimize" && positional.size() == 2) {
        return run_optimize(cfg, positional[1], format, output_dir);
    }
    std::cerr << "Invalid arguments. See usage:\n";
    print_usage();
    return 2;
}
