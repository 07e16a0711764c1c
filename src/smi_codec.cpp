//
//  smi_codec.cpp
//  SubForge
//
//  SAMI: "<SYNC Start=ms><P Class=ENCC>text" blocks; a blank sync (&nbsp;) ends the
//  previous caption.
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cctype>
#include <stdexcept>

#include "content_sanitizer.hpp"
#include "logging.hpp"
#include "subtitle_codec.hpp"

namespace subforge {
namespace codecs {

using codec_detail::istarts_with;
using codec_detail::trim;

namespace {

std::string lower(const std::string &s) {
    std::string out = s;
    for (auto &c : out) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

void replace_all(std::string &s, const std::string &from, const std::string &to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// Case-insensitive replace for "<br>" variants.
void replace_breaks(std::string &s) {
    std::string l = lower(s);
    std::string out;
    size_t pos = 0;
    while (pos < s.size()) {
        if (l.compare(pos, 3, "<br") == 0) {
            size_t close = l.find('>', pos);
            if (close != std::string::npos) {
                out.push_back('\n');
                pos = close + 1;
                continue;
            }
        }
        out.push_back(s[pos]);
        ++pos;
    }
    s = out;
}

std::string decode_entities(std::string s) {
    replace_all(s, "&nbsp;", " ");
    replace_all(s, "&lt;", "<");
    replace_all(s, "&gt;", ">");
    replace_all(s, "&quot;", "\"");
    replace_all(s, "&amp;", "&");
    return s;
}

std::string encode_entities(const std::string &s) {
    std::string out;
    for (char c : s) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '\n':
            out += "<br>";
            break;
        default:
            out.push_back(c);
        }
    }
    return out;
}

// Value of "Start=123" inside a <SYNC ...> tag.
bool read_sync_start(const std::string &tag_lower, int64_t &start_ms) {
    auto pos = tag_lower.find("start");
    if (pos == std::string::npos) {
        return false;
    }
    pos = tag_lower.find('=', pos);
    if (pos == std::string::npos) {
        return false;
    }
    ++pos;
    while (pos < tag_lower.size() && (tag_lower[pos] == ' ' || tag_lower[pos] == '"')) {
        ++pos;
    }
    size_t end = pos;
    while (end < tag_lower.size() && std::isdigit(static_cast<unsigned char>(tag_lower[end]))) {
        ++end;
    }
    if (end == pos || end - pos > 15) {
        return false;
    }
    start_ms = std::stoll(tag_lower.substr(pos, end - pos));
    return true;
}

}  // namespace

bool detect_smi(const std::string &text) { return istarts_with(trim(text), "<sami"); }

std::vector<SubtitleEntry> parse_smi(const std::string &text) {
    const std::string l = lower(text);
    std::vector<SubtitleEntry> entries;
    size_t pos = l.find("<sync");
    while (pos != std::string::npos) {
        const size_t tag_end = l.find('>', pos);
        if (tag_end == std::string::npos) {
            throw std::runtime_error("smi: unterminated SYNC tag");
        }
        int64_t start = 0;
        if (!read_sync_start(l.substr(pos, tag_end - pos), start)) {
            throw std::runtime_error("smi: SYNC tag without Start attribute");
        }
        size_t next = l.find("<sync", tag_end);
        size_t body_end = next;
        if (body_end == std::string::npos) {
            body_end = l.find("</body", tag_end);
            if (body_end == std::string::npos) {
                body_end = text.size();
            }
        }
        std::string body = text.substr(tag_end + 1, body_end - tag_end - 1);
        replace_breaks(body);
        std::string content = trim(decode_entities(sanitize(body)));

        // Any open caption ends where the next sync starts.
        if (!entries.empty() && !entries.back().end_ms) {
            entries.back().end_ms = start;
            entries.back().duration_ms = start - *entries.back().start_ms;
        }
        if (!content.empty()) {
            SubtitleEntry e;
            e.kind = CaptionKind::Caption;
            e.start_ms = start;
            e.content = content;
            e.text = strip_markup(content);
            entries.push_back(std::move(e));
        }
        pos = next;
    }
    if (!entries.empty() && !entries.back().end_ms) {
        entries.back().end_ms = entries.back().start_ms;
        entries.back().duration_ms = 0;
    }
    return entries;
}

std::string build_smi(const std::vector<Caption> &captions, const BuildOptions &opts) {
    std::string out;
    if (opts.header) {
        out += "<SAMI>\n<HEAD>\n<TITLE>SubForge</TITLE>\n<STYLE TYPE=\"text/css\">\n<!--\n"
               "P { font-family: Arial; font-weight: normal; color: white; "
               "background-color: black; text-align: center; }\n"
               ".ENCC { name: English; lang: en-US; SAMIType: CC; }\n"
               "-->\n</STYLE>\n</HEAD>\n<BODY>\n";
    }
    for (const auto &c : captions) {
        if (c.kind == CaptionKind::Meta) {
            continue;
        }
        out += "<SYNC Start=" + std::to_string(c.start_ms) + "><P Class=ENCC>" +
               encode_entities(c.content) + "</P></SYNC>\n";
        out += "<SYNC Start=" + std::to_string(c.end_ms) + "><P Class=ENCC>&nbsp;</P></SYNC>\n";
    }
    if (opts.footer) {
        out += "</BODY>\n</SAMI>\n";
    }
    return out;
}

}  // namespace codecs
}  // namespace subforge
