//
//  timecode.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timecode.hpp"

#include <cctype>
#include <cstdio>
#include <vector>

namespace subforge {

namespace {

constexpr int64_t kMsPerHour = 3600000;
constexpr int64_t kMsPerMinute = 60000;
constexpr int64_t kMsPerSecond = 1000;

struct Clock {
    long long hours;
    long long minutes;
    long long seconds;
    long long millis;
};

Clock split(int64_t ms) {
    if (ms < 0) {
        ms = 0;
    }
    return Clock{ms / kMsPerHour, (ms % kMsPerHour) / kMsPerMinute,
                 (ms % kMsPerMinute) / kMsPerSecond, ms % kMsPerSecond};
}

bool all_digits(const std::string &s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string trim_copy(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}  // namespace

std::string format_time(int64_t ms) {
    const Clock c = split(ms);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", c.hours, c.minutes, c.seconds,
                  c.millis);
    return buf;
}

std::string format_vtt_time(int64_t ms) {
    const Clock c = split(ms);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld", c.hours, c.minutes, c.seconds,
                  c.millis);
    return buf;
}

std::string format_sbv_time(int64_t ms) {
    const Clock c = split(ms);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld.%03lld", c.hours, c.minutes, c.seconds,
                  c.millis);
    return buf;
}

std::string format_ass_time(int64_t ms) {
    const Clock c = split(ms);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld.%02lld", c.hours, c.minutes, c.seconds,
                  c.millis / 10);
    return buf;
}

std::string format_lrc_time(int64_t ms) {
    const Clock c = split(ms);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%02lld", c.hours * 60 + c.minutes, c.seconds,
                  c.millis / 10);
    return buf;
}

std::optional<int64_t> parse_timecode(const std::string &raw) {
    const std::string s = trim_copy(raw);
    if (s.empty()) {
        return std::nullopt;
    }
    std::string clock = s;
    std::string fraction;
    size_t sep = s.find_last_of(",.");
    if (sep != std::string::npos && sep > s.find_last_of(':')) {
        clock = s.substr(0, sep);
        fraction = s.substr(sep + 1);
        if (!all_digits(fraction)) {
            return std::nullopt;
        }
    }

    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t colon = clock.find(':', start);
        fields.push_back(clock.substr(start, colon - start));
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    if (fields.size() < 2 || fields.size() > 3) {
        return std::nullopt;
    }
    for (const auto &f : fields) {
        if (!all_digits(f) || f.size() > 9) {
            return std::nullopt;
        }
    }

    int64_t hours = 0;
    size_t pos = 0;
    if (fields.size() == 3) {
        hours = std::stoll(fields[pos++]);
    }
    const int64_t minutes = std::stoll(fields[pos++]);
    const int64_t seconds = std::stoll(fields[pos]);

    int64_t millis = 0;
    if (!fraction.empty()) {
        std::string digits = fraction.substr(0, 3);
        while (digits.size() < 3) {
            digits.push_back('0');
        }
        millis = std::stoll(digits);
    }
    return hours * kMsPerHour + minutes * kMsPerMinute + seconds * kMsPerSecond + millis;
}

}  // namespace subforge
