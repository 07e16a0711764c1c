//
//  content_sanitizer.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace subforge {

// Remove tag-like markup and any stray angle brackets, then trim whitespace
// (ASCII plus the Unicode space separators, NBSP and BOM included).
// Linear two-pass scanner: pass 1 drops `<x...>` runs (an unterminated tag runs to the
// end of the string), pass 2 drops every remaining '<' and '>'. Idempotent; the result
// never contains '<' or '>'. Every caption's content and text go through this.
std::string sanitize(const std::string &text);

// sanitize() plus removal of format-specific inline cues: ASS override blocks
// (`{\i1}`) and MicroDVD control codes (`{y:i}`). Used to derive a caption's plain text.
std::string strip_markup(const std::string &text);

}  // namespace subforge

#ifdef SUBFORGE_TESTING
namespace subforge::testing {
// Individual sanitizer passes, without trimming.
std::string strip_tags_for_test(const std::string &text);
std::string drop_brackets_for_test(const std::string &text);
}  // namespace subforge::testing
#endif
