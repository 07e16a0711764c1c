//
//  optimize_protocol.hpp
//  SubForge
//
//  Prompt construction and response validation for one optimizer call.
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "caption.hpp"
#include "status.hpp"

namespace subforge {

// Batches larger than this get a "Processing N subtitles from index A to B." scope line.
inline constexpr size_t kPromptScopeThreshold = 10;

std::string build_optimize_prompt(const std::vector<CaptionContent> &items);

// Unwrap a fenced code block ("```json\n[...]\n```") to the first bracketed array in it.
// Text that does not start with a fence is returned unchanged (trimmed).
std::string extract_json_payload(const std::string &response_text);

/**
 * @brief Validate a provider response against the batch that was sent.
 *
 * The payload must be a JSON array of objects with an integral numeric `index` and a string
 * `content`, covering exactly the batch's indices once each. Any violation yields
 * UpstreamFormat and leaves `out` empty. Content is sanitized on the way in.
 */
Status parse_optimize_response(const std::string &response_text,
                               const std::vector<CaptionContent> &batch,
                               std::vector<CaptionContent> &out);

// True when a provider failure message points at the credential ("api key",
// "authentication", case-insensitive).
bool is_auth_failure(const std::string &message);

}  // namespace subforge
