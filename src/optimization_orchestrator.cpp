//
//  optimization_orchestrator.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "optimization_orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <map>
#include <unordered_map>

#include "content_sanitizer.hpp"
#include "logging.hpp"
#include "optimize_protocol.hpp"

namespace subforge {

namespace {

constexpr const char *kAuthFailureMessage =
    "Invalid API key. Please check your API key and try again.";

bool is_blank(const std::string &s) {
    return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

}  // namespace

const char *optimizer_state_name(OptimizerState state) {
    switch (state) {
    case OptimizerState::Idle:
        return "idle";
    case OptimizerState::Planning:
        return "planning";
    case OptimizerState::Submitting:
        return "submitting";
    case OptimizerState::Merging:
        return "merging";
    case OptimizerState::Done:
        return "done";
    case OptimizerState::Failed:
        return "failed";
    }
    return "unknown";
}

OptimizationOrchestrator::OptimizationOrchestrator(TextGenerator &generator,
                                                   OptimizerSettings settings)
    : generator_(generator), settings_(settings) {}

OptimizeResult OptimizationOrchestrator::fail(Status status) {
    state_ = OptimizerState::Failed;
    SF_LOG("warn", "optimize failed (" << error_kind_name(status.kind) << ") at batch "
                                       << current_batch_ << ": " << status.message);
    OptimizeResult res;
    res.status = std::move(status);
    return res;
}

OptimizeResult OptimizationOrchestrator::optimize(const std::string &api_key,
                                                  const std::vector<CaptionContent> &items,
                                                  const CancellationToken &cancel) {
    state_ = OptimizerState::Planning;
    current_batch_ = 0;

    if (api_key.empty()) {
        return fail(make_error(ErrorKind::Validation, "API key is required"));
    }
    if (items.empty()) {
        return fail(make_error(ErrorKind::Validation,
                               "Subtitles array is required and must not be empty"));
    }
    Status limit = check_item_limit(items.size(), settings_.max_items);
    if (!limit.ok) {
        return fail(std::move(limit));
    }

    std::vector<CaptionContent> valid;
    valid.reserve(items.size());
    for (const auto &item : items) {
        if (!is_blank(item.content)) {
            valid.push_back(item);
        }
    }
    if (valid.empty()) {
        return fail(make_error(ErrorKind::Validation, "No valid subtitles to optimize"));
    }
    std::stable_sort(valid.begin(), valid.end(),
                     [](const CaptionContent &a, const CaptionContent &b) {
                         return a.index < b.index;
                     });
    for (size_t i = 0; i < valid.size(); ++i) {
        if (valid[i].index == 0) {
            return fail(make_error(ErrorKind::Validation, "Subtitle index must be positive"));
        }
        if (i > 0 && valid[i].index == valid[i - 1].index) {
            return fail(make_error(ErrorKind::Validation, "Duplicate subtitle index " +
                                                              std::to_string(valid[i].index)));
        }
    }

    const auto batches =
        plan_batches(valid, settings_.max_tokens_per_batch, settings_.chars_per_token);

    std::map<uint32_t, std::string> merged;
    for (const auto &batch : batches) {
        if (cancel.cancelled()) {
            return fail(make_error(ErrorKind::Cancelled, "Optimization cancelled"));
        }
        state_ = OptimizerState::Submitting;
        current_batch_ = batch.batch_number;
        SF_LOG("optimizer", "submitting batch " << batch.batch_number << "/"
                                                << batch.total_batches << " ("
                                                << batch.items.size() << " items, ~"
                                                << batch.estimated_tokens << " tokens)");

        const std::string prompt = build_optimize_prompt(batch.items);
        std::string response;
        std::string error;
        bool generated = false;
        try {
            generated = generator_.generate(api_key, prompt, cancel, response, error);
        } catch (const std::exception &e) {
            SF_LOG("optimizer", "batch " << batch.batch_number << " provider threw: " << e.what());
            error = e.what();
        }
        if (!generated) {
            if (cancel.cancelled()) {
                return fail(make_error(ErrorKind::Cancelled, "Optimization cancelled"));
            }
            if (is_auth_failure(error)) {
                return fail(make_error(ErrorKind::UpstreamAuth, kAuthFailureMessage));
            }
            return fail(make_error(ErrorKind::Upstream,
                                   "Failed to optimize subtitles: " +
                                       (error.empty() ? std::string("unknown error") : error)));
        }
        SF_LOG("optimizer", "batch " << batch.batch_number
                                     << " response: " << text_preview(response));

        std::vector<CaptionContent> parsed;
        Status st = parse_optimize_response(response, batch.items, parsed);
        if (!st.ok) {
            return fail(std::move(st));
        }

        state_ = OptimizerState::Merging;
        for (auto &item : parsed) {
            merged[item.index] = sanitize(item.content);
        }
    }

    OptimizeResult res;
    res.status = ok_status();
    res.batches = static_cast<uint32_t>(batches.size());
    res.optimized.reserve(merged.size());
    for (auto &entry : merged) {
        res.optimized.push_back(CaptionContent{entry.first, std::move(entry.second)});
    }
    state_ = OptimizerState::Done;
    SF_LOG("info", "optimized " << res.optimized.size() << " subtitles in " << res.batches
                                << " batch(es)");
    return res;
}

size_t apply_optimized(CaptionDocument &doc, const std::vector<CaptionContent> &optimized) {
    std::unordered_map<uint32_t, const std::string *> by_index;
    by_index.reserve(optimized.size());
    for (const auto &item : optimized) {
        by_index[item.index] = &item.content;
    }
    size_t applied = 0;
    for (auto &caption : doc.captions) {
        if (caption.kind != CaptionKind::Caption) {
            continue;
        }
        auto it = by_index.find(caption.index);
        if (it == by_index.end()) {
            continue;
        }
        caption.content = sanitize(*it->second);
        caption.text = strip_markup(caption.content);
        ++applied;
    }
    return applied;
}

OptimizeResult optimize_document(CaptionDocument &doc, TextGenerator &generator,
                                 const std::string &api_key, const OptimizerSettings &settings,
                                 const CancellationToken &cancel) {
    std::vector<CaptionContent> items;
    for (auto &item : to_caption_contents(doc)) {
        if (!is_blank(item.content)) {
            items.push_back(std::move(item));
        }
    }
    if (items.empty()) {
        OptimizeResult res;
        res.status = make_error(ErrorKind::Validation, "No valid subtitles to optimize");
        return res;
    }

    // Request groups: bounded by the per-call cap and by the token budget.
    const auto groups = plan_batches(items, settings.max_tokens_per_batch,
                                     settings.chars_per_token, settings.max_items);
    OptimizationOrchestrator orchestrator(generator, settings);
    OptimizeResult total;
    for (const auto &group : groups) {
        SF_LOG("info", "optimizing request " << group.batch_number << "/" << group.total_batches
                                             << " (" << group.items.size() << " subtitles)");
        OptimizeResult part = orchestrator.optimize(api_key, group.items, cancel);
        if (!part.status.ok) {
            OptimizeResult res;
            res.status = std::move(part.status);
            return res;
        }
        total.batches += part.batches;
        total.optimized.insert(total.optimized.end(),
                               std::make_move_iterator(part.optimized.begin()),
                               std::make_move_iterator(part.optimized.end()));
    }
    apply_optimized(doc, total.optimized);
    total.status = ok_status();
    return total;
}

}  // namespace subforge
