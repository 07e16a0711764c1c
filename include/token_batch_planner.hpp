//
//  token_batch_planner.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "caption.hpp"
#include "status.hpp"

namespace subforge {

inline constexpr size_t kDefaultMaxTokensPerBatch = 75000;  // ~225k characters
inline constexpr size_t kDefaultCharsPerToken = 3;
inline constexpr size_t kDefaultMaxItemsPerRequest = 50;

struct OptimizationBatch {
    uint32_t batch_number = 0;   ///< 1-based position
    uint32_t total_batches = 0;
    size_t estimated_tokens = 0;
    std::vector<CaptionContent> items;
};

// Number of UTF-8 code points (continuation bytes are not counted).
size_t utf8_length(const std::string &s);

// ceil(utf8_length(content) / chars_per_token); chars_per_token 0 is treated as 1.
size_t estimate_tokens(const std::string &content, size_t chars_per_token = kDefaultCharsPerToken);

// Per-call item ceiling, checked before planning.
Status check_item_limit(size_t item_count, size_t max_items = kDefaultMaxItemsPerRequest);

/**
 * @brief Split items into order-preserving batches bounded by an estimated token budget.
 *
 * A batch is closed when adding the next item would exceed `max_tokens_per_batch`; an item
 * whose own estimate exceeds the budget forms a batch alone (captions are never split or
 * dropped). `max_items_per_batch` (0 = unlimited) additionally closes batches on count.
 * Deterministic: the same input always yields the same plan.
 */
std::vector<OptimizationBatch> plan_batches(const std::vector<CaptionContent> &items,
                                            size_t max_tokens_per_batch = kDefaultMaxTokensPerBatch,
                                            size_t chars_per_token = kDefaultCharsPerToken,
                                            size_t max_items_per_batch = 0);

}  // namespace subforge
