//
//  time_allocator.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "word_cue.hpp"

inline constexpr int64_t kDefaultMinWordDurationMs = 200;
inline constexpr int64_t kDefaultMaxWordDurationMs = 3000;
// Allowed difference between a sentence span and the span of its allocated words.
inline constexpr int64_t kSpanToleranceMs = 1;

/// Per-word display limits. The final word of a sentence is exempt (it absorbs rounding).
struct AllocationOptions {
    int64_t min_word_duration = kDefaultMinWordDurationMs;
    int64_t max_word_duration = kDefaultMaxWordDurationMs;
};

/// Recorded when a sentence's allocated words do not span its original interval.
struct SpanDrift {
    int64_t source_index = 0;
    int64_t expected_ms = 0;
    int64_t actual_ms = 0;
};

/// Thrown by allocate_all() when sentence and token-list counts differ.
class InputMismatch : public std::runtime_error {
public:
    InputMismatch(size_t sentences, size_t token_lists)
        : std::runtime_error("sentence count (" + std::to_string(sentences) +
                             ") does not match token list count (" +
                             std::to_string(token_lists) + ")") {}
};

// Checks 0 <= min <= max <= kMaxTimestampMs. On failure `error` (if given) receives the
// reason.
bool validate_options(const AllocationOptions &options, std::string *error = nullptr);

// Strict base-10 millisecond value as given on the command line. Rejects empty input,
// trailing characters and values outside the int64 range.
bool parse_duration_ms(const std::string &text, int64_t &out);

/**
 * @brief Split one sentence interval across its words, weighted by word length.
 *
 * Every word but the last gets round(T * length / L) clamped to the configured limits;
 * the last word receives whatever remains up to the sentence end (never negative).
 * Returned indices are 1-based within the sentence. Empty (or zero-length) token lists
 * yield no words. Throws MalformedTimestamp for unparsable sentence timing, and when
 * limits outside validate_options() push a word past the largest SRT time.
 *
 * When the realized span differs from the sentence span by more than kSpanToleranceMs,
 * a warning is logged and, if `drifts` is non-null, a SpanDrift is appended.
 */
std::vector<WordCue> allocate_words(const SentenceCue &sentence,
                                    const std::vector<WordToken> &tokens,
                                    const AllocationOptions &options = {},
                                    std::vector<SpanDrift> *drifts = nullptr);

/**
 * @brief Allocate every sentence and number the concatenated words 1..N.
 *
 * `token_lists[i]` belongs to `sentences[i]`; throws InputMismatch if the sizes differ.
 */
std::vector<WordCue> allocate_all(const std::vector<SentenceCue> &sentences,
                                  const std::vector<std::vector<WordToken>> &token_lists,
                                  const AllocationOptions &options = {},
                                  std::vector<SpanDrift> *drifts = nullptr);
