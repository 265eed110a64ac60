//
//  srt_timestamp.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

/// Broken-down SRT timestamp. Hours are unbounded; the other fields are within their
/// clock ranges when produced by ms_to_timestamp().
struct Timestamp {
    int64_t hours = 0;
    int64_t minutes = 0;
    int64_t seconds = 0;
    int64_t milliseconds = 0;
};

/// Thrown when text does not match `HH:MM:SS,mmm`.
class MalformedTimestamp : public std::runtime_error {
public:
    explicit MalformedTimestamp(const std::string &text)
        : std::runtime_error("malformed timestamp: '" + text + "'"), text_(text) {}

    const std::string &text() const { return text_; }

private:
    std::string text_;
};

inline constexpr int64_t kMsPerSecond = 1000;
inline constexpr int64_t kMsPerMinute = 60 * kMsPerSecond;
inline constexpr int64_t kMsPerHour = 60 * kMsPerMinute;
// Largest value parse_timestamp() can produce (99:59:59,999).
inline constexpr int64_t kMaxTimestampMs = 100 * kMsPerHour - 1;

// Parse `HH:MM:SS,mmm` (surrounding whitespace ignored). Digit groups must be exactly
// 2/2/2/3 wide; throws MalformedTimestamp otherwise.
Timestamp parse_timestamp(std::string_view text);

// Render with zero-padded fields. Hours wider than two digits are printed in full.
std::string format_timestamp(const Timestamp &ts);

int64_t timestamp_to_ms(const Timestamp &ts);

// Negative input clamps to zero; fractional input rounds half-up before decomposition.
// Values beyond the int64 range saturate, NaN maps to zero.
Timestamp ms_to_timestamp(double total_ms);

// Integer variant without the rounding step; negative input clamps to zero.
Timestamp ms_to_timestamp_exact(int64_t total_ms);

// Half-up rounding shared by the allocation passes (matches ms_to_timestamp()).
// Saturates at the int64 limits; NaN yields 0.
int64_t round_half_up(double value);

// end - start in milliseconds; negative when end precedes start.
int64_t duration_ms(std::string_view start, std::string_view end);

// Shift a timestamp by delta_ms. Results before 00:00:00,000 clamp to zero, results past
// the int64 range saturate.
std::string add_ms(std::string_view timestamp, int64_t delta_ms);
