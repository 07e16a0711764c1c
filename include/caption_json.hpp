//
//  caption_json.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "caption.hpp"
#include "subtitle_codec.hpp"

namespace subforge {

// Wire shape shared by the json subtitle format and the upload/download handlers:
// {"type", "index", "start", "end", "duration", "content", "text"}, times in ms.
nlohmann::json caption_to_json(const Caption &caption);
nlohmann::json document_to_json(const CaptionDocument &doc);

// Lenient read of one wire object; absent or mistyped fields stay unset.
// Throws std::runtime_error when `j` is not an object.
SubtitleEntry entry_from_json(const nlohmann::json &j);

nlohmann::json contents_to_json(const std::vector<CaptionContent> &items);

}  // namespace subforge
