//
//  token_batch_planner.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "token_batch_planner.hpp"

#include "logging.hpp"

namespace subforge {

size_t utf8_length(const std::string &s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

size_t estimate_tokens(const std::string &content, size_t chars_per_token) {
    if (chars_per_token == 0) {
        chars_per_token = 1;
    }
    const size_t chars = utf8_length(content);
    return (chars + chars_per_token - 1) / chars_per_token;
}

Status check_item_limit(size_t item_count, size_t max_items) {
    if (item_count > max_items) {
        return make_error(ErrorKind::BatchSize,
                          "Too many subtitles in single request. Maximum " +
                              std::to_string(max_items) + " subtitles per request.");
    }
    return ok_status();
}

std::vector<OptimizationBatch> plan_batches(const std::vector<CaptionContent> &items,
                                            size_t max_tokens_per_batch, size_t chars_per_token,
                                            size_t max_items_per_batch) {
    std::vector<OptimizationBatch> batches;
    OptimizationBatch current;
    for (const auto &item : items) {
        const size_t cost = estimate_tokens(item.content, chars_per_token);
        const bool over_budget = current.estimated_tokens + cost > max_tokens_per_batch;
        const bool over_count =
            max_items_per_batch > 0 && current.items.size() >= max_items_per_batch;
        if (!current.items.empty() && (over_budget || over_count)) {
            batches.push_back(std::move(current));
            current = OptimizationBatch{};
        }
        if (cost > max_tokens_per_batch) {
            SF_LOG("warn", "caption " << item.index << " alone exceeds the token budget ("
                                      << cost << " > " << max_tokens_per_batch << ")");
        }
        current.items.push_back(item);
        current.estimated_tokens += cost;
    }
    if (!current.items.empty()) {
        batches.push_back(std::move(current));
    }

    const auto total = static_cast<uint32_t>(batches.size());
    for (uint32_t i = 0; i < total; ++i) {
        batches[i].batch_number = i + 1;
        batches[i].total_batches = total;
    }
    SF_LOG("optimizer", "planned " << total << " batch(es) for " << items.size() << " items");
    return batches;
}

}  // namespace subforge
