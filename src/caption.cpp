//
//  caption.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "caption.hpp"

namespace subforge {

bool is_normalized(const CaptionDocument &doc) {
    uint32_t expected = 1;
    for (const auto &c : doc.captions) {
        if (c.index != expected) {
            return false;
        }
        ++expected;
    }
    return true;
}

std::vector<Caption> caption_entries(const CaptionDocument &doc) {
    std::vector<Caption> out;
    out.reserve(doc.captions.size());
    for (const auto &c : doc.captions) {
        if (c.kind == CaptionKind::Caption) {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<CaptionContent> to_caption_contents(const CaptionDocument &doc) {
    std::vector<CaptionContent> out;
    out.reserve(doc.captions.size());
    for (const auto &c : doc.captions) {
        if (c.kind == CaptionKind::Caption) {
            out.push_back(CaptionContent{c.index, c.content});
        }
    }
    return out;
}

}  // namespace subforge
