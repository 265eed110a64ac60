//
//  srt_timestamp.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_timestamp.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>

namespace {

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

// Reads exactly `width` decimal digits at `pos`.
bool read_digits(std::string_view s, size_t pos, size_t width, int64_t &out) {
    int64_t v = 0;
    for (size_t i = 0; i < width; ++i) {
        const char c = s[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

}  // namespace

Timestamp parse_timestamp(std::string_view text) {
    const std::string_view s = trim(text);
    // HH:MM:SS,mmm
    if (s.size() != 12 || s[2] != ':' || s[5] != ':' || s[8] != ',') {
        throw MalformedTimestamp(std::string(text));
    }
    Timestamp ts{};
    if (!read_digits(s, 0, 2, ts.hours) || !read_digits(s, 3, 2, ts.minutes) ||
        !read_digits(s, 6, 2, ts.seconds) || !read_digits(s, 9, 3, ts.milliseconds)) {
        throw MalformedTimestamp(std::string(text));
    }
    return ts;
}

std::string format_timestamp(const Timestamp &ts) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld",
                  static_cast<long long>(ts.hours), static_cast<long long>(ts.minutes),
                  static_cast<long long>(ts.seconds), static_cast<long long>(ts.milliseconds));
    return std::string(buf);
}

int64_t timestamp_to_ms(const Timestamp &ts) {
    return ts.hours * kMsPerHour + ts.minutes * kMsPerMinute + ts.seconds * kMsPerSecond +
           ts.milliseconds;
}

int64_t round_half_up(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    // 2^63 is exactly representable; anything at or past it does not fit.
    constexpr double kLimit = 9223372036854775808.0;
    const double r = std::floor(value + 0.5);
    if (r >= kLimit) {
        return std::numeric_limits<int64_t>::max();
    }
    if (r < -kLimit) {
        return std::numeric_limits<int64_t>::min();
    }
    return static_cast<int64_t>(r);
}

Timestamp ms_to_timestamp(double total_ms) {
    return ms_to_timestamp_exact(round_half_up(total_ms));
}

Timestamp ms_to_timestamp_exact(int64_t ms) {
    if (ms < 0) {
        ms = 0;
    }
    Timestamp ts{};
    ts.hours = ms / kMsPerHour;
    ts.minutes = (ms % kMsPerHour) / kMsPerMinute;
    ts.seconds = (ms % kMsPerMinute) / kMsPerSecond;
    ts.milliseconds = ms % kMsPerSecond;
    return ts;
}

int64_t duration_ms(std::string_view start, std::string_view end) {
    const int64_t start_ms = timestamp_to_ms(parse_timestamp(start));
    const int64_t end_ms = timestamp_to_ms(parse_timestamp(end));
    return end_ms - start_ms;
}

std::string add_ms(std::string_view timestamp, int64_t delta_ms) {
    const int64_t base = timestamp_to_ms(parse_timestamp(timestamp));
    int64_t sum = 0;
    if (delta_ms > 0 && base > std::numeric_limits<int64_t>::max() - delta_ms) {
        sum = std::numeric_limits<int64_t>::max();
    } else {
        // base is never negative, so only the upper bound can overflow.
        sum = base + delta_ms;
    }
    return format_timestamp(ms_to_timestamp_exact(sum));
}
