//
//  optimization_orchestrator.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "caption.hpp"
#include "status.hpp"
#include "text_generator.hpp"
#include "token_batch_planner.hpp"

namespace subforge {

enum class OptimizerState { Idle, Planning, Submitting, Merging, Done, Failed };

const char *optimizer_state_name(OptimizerState state);

struct OptimizerSettings {
    size_t max_items = kDefaultMaxItemsPerRequest;          ///< per-call item ceiling
    size_t max_tokens_per_batch = kDefaultMaxTokensPerBatch;
    size_t chars_per_token = kDefaultCharsPerToken;
};

/// @ingroup api
/// Outcome of one optimize request. `optimized` is only populated on success, sorted by
/// index and covering exactly the non-empty submitted items.
struct OptimizeResult {
    Status status;
    std::vector<CaptionContent> optimized;
    uint32_t batches = 0;  ///< provider calls that completed
};

/**
 * @brief Drives sequential batch calls to a TextGenerator and merges the results.
 *
 * Planning -> Submitting(batch) -> Merging -> ... -> Done, or Failed on the first error.
 * Batches are never submitted concurrently and a failure discards everything merged so
 * far. The cancellation token is checked before each submission.
 *
 * One orchestrator handles one request at a time; state() reflects the last run.
 */
class OptimizationOrchestrator {
   public:
    explicit OptimizationOrchestrator(TextGenerator &generator, OptimizerSettings settings = {});

    OptimizeResult optimize(const std::string &api_key, const std::vector<CaptionContent> &items,
                            const CancellationToken &cancel = CancellationToken());

    OptimizerState state() const { return state_; }
    uint32_t current_batch() const { return current_batch_; }
    const OptimizerSettings &settings() const { return settings_; }

   private:
    OptimizeResult fail(Status status);

    TextGenerator &generator_;
    OptimizerSettings settings_;
    OptimizerState state_ = OptimizerState::Idle;
    uint32_t current_batch_ = 0;
};

// Re-attach optimized content by index (content and text updated, timings untouched).
// Returns the number of captions that were updated.
size_t apply_optimized(CaptionDocument &doc, const std::vector<CaptionContent> &optimized);

/**
 * @brief Optimize a whole document in requests of at most `settings.max_items` captions.
 *
 * Requests run one after another through an OptimizationOrchestrator; the first failure
 * is returned and `doc` is left unchanged. On success every optimized caption is applied.
 */
OptimizeResult optimize_document(CaptionDocument &doc, TextGenerator &generator,
                                 const std::string &api_key,
                                 const OptimizerSettings &settings = {},
                                 const CancellationToken &cancel = CancellationToken());

}  // namespace subforge
