//
//  content_sanitizer.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "content_sanitizer.hpp"

#include <cctype>

namespace subforge {

namespace {

bool is_trim_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// UTF-8 encodings of the non-ASCII space separators, line/paragraph separators and BOM.
constexpr const char *kUnicodeSpaces[] = {
    "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82",
    "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8", "\xE2\x80\xA9",
    "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80", "\xEF\xBB\xBF",
};

// Byte length of the whitespace code point starting at `pos`, 0 if there is none.
size_t space_at(const std::string &in, size_t pos, size_t end) {
    if (is_trim_space(in[pos])) {
        return 1;
    }
    for (const char *seq : kUnicodeSpaces) {
        const size_t n = std::char_traits<char>::length(seq);
        if (end - pos >= n && in.compare(pos, n, seq) == 0) {
            return n;
        }
    }
    return 0;
}

// Byte length of the whitespace code point ending just before `end`, 0 if there is none.
size_t space_before(const std::string &in, size_t begin, size_t end) {
    if (is_trim_space(in[end - 1])) {
        return 1;
    }
    for (const char *seq : kUnicodeSpaces) {
        const size_t n = std::char_traits<char>::length(seq);
        if (end - begin >= n && in.compare(end - n, n, seq) == 0) {
            return n;
        }
    }
    return 0;
}

// Pass 1: '<' followed by at least one non-'>' byte opens a tag that ends at the next
// '>' (inclusive) or at the end of input. A '<' not opening a tag is kept for pass 2.
std::string strip_tags(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        if (in[i] == '<' && i + 1 < in.size() && in[i + 1] != '>') {
            size_t close = in.find('>', i + 1);
            if (close == std::string::npos) {
                break;
            }
            i = close + 1;
            continue;
        }
        out.push_back(in[i]);
        ++i;
    }
    return out;
}

// Pass 2.
std::string drop_brackets(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        if (c != '<' && c != '>') {
            out.push_back(c);
        }
    }
    return out;
}

std::string trim(const std::string &in) {
    size_t b = 0;
    size_t e = in.size();
    size_t n = 0;
    while (b < e && (n = space_at(in, b, e)) > 0) {
        b += n;
    }
    while (e > b && (n = space_before(in, b, e)) > 0) {
        e -= n;
    }
    return in.substr(b, e - b);
}

bool is_cue_block(const std::string &in, size_t open, size_t close) {
    if (close <= open + 1) {
        return false;
    }
    if (in[open + 1] == '\\') {
        return true;  // ASS override: {\b1}, {\an8}
    }
    // MicroDVD control code: {y:i}, {c:$0000ff}
    return close > open + 2 && std::isalpha(static_cast<unsigned char>(in[open + 1])) &&
           in[open + 2] == ':';
}

}  // namespace

std::string sanitize(const std::string &text) { return trim(drop_brackets(strip_tags(text))); }

std::string strip_markup(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '{') {
            size_t close = text.find('}', i);
            if (close != std::string::npos && is_cue_block(text, i, close)) {
                i = close + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return sanitize(out);
}

}  // namespace subforge

#ifdef SUBFORGE_TESTING
namespace subforge::testing {
std::string strip_tags_for_test(const std::string &text) { return strip_tags(text); }
std::string drop_brackets_for_test(const std::string &text) { return drop_brackets(text); }
}  // namespace subforge::testing
#endif
