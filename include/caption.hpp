//
//  caption.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace subforge {

enum class CaptionKind { Caption, Meta };

/// @ingroup api
/// One timed subtitle unit.
struct Caption {
    uint32_t index = 0;      ///< 1-based position in the document
    int64_t start_ms = 0;    ///< Absolute start time in ms
    int64_t end_ms = 0;      ///< Absolute end time in ms (>= start_ms)
    int64_t duration_ms = 0; ///< end_ms - start_ms
    std::string content;     ///< Sanitized display text (may carry inline cues)
    std::string text;        ///< Plain text, all markup removed
    CaptionKind kind = CaptionKind::Caption;
};

/// @ingroup api
/// Ordered, index-unique caption sequence created once per request.
struct CaptionDocument {
    std::vector<Caption> captions;

    size_t size() const { return captions.size(); }
    bool empty() const { return captions.empty(); }
};

/// The `{index, content}` pair exchanged with the optimizer.
struct CaptionContent {
    uint32_t index = 0;
    std::string content;
};

inline bool operator==(const CaptionContent &a, const CaptionContent &b) {
    return a.index == b.index && a.content == b.content;
}

// True when indices are strictly increasing, dense and start at 1.
bool is_normalized(const CaptionDocument &doc);

// Captions of kind Caption (meta entries dropped), in document order.
std::vector<Caption> caption_entries(const CaptionDocument &doc);

// `{index, content}` view of the caption entries, used as optimizer input.
std::vector<CaptionContent> to_caption_contents(const CaptionDocument &doc);

}  // namespace subforge
