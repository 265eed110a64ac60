//
//  time_allocator.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "time_allocator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

#include "logging.hpp"
#include "srt_timestamp.hpp"

namespace {

int64_t clamp_duration(int64_t value, const AllocationOptions &options) {
    // max wins when the limits are inverted.
    int64_t d = std::max(options.min_word_duration, value);
    return std::min(options.max_word_duration, d);
}

void check_span(const std::vector<WordCue> &words, int64_t expected_ms,
                const SentenceCue &sentence, std::vector<SpanDrift> *drifts) {
    if (words.empty()) {
        return;
    }
    const WordCue &first = words.front();
    const WordCue &last = words.back();
    const int64_t actual_ms = duration_ms(first.start_time, last.end_time);
    if (std::llabs(actual_ms - expected_ms) <= kSpanToleranceMs) {
        return;
    }
    WC_LOG("warn", "span drift in entry " << sentence.index << ": expected " << expected_ms
                                          << "ms, got " << actual_ms << "ms (diff "
                                          << std::llabs(actual_ms - expected_ms) << "ms)");
    WC_LOG("warn", "  source " << sentence.start_time << " --> " << sentence.end_time << " \""
                               << wordcue::text_preview(sentence.text) << "\"");
    WC_LOG("warn", "  allocated " << first.start_time << " --> " << last.end_time);
    for (size_t i = 0; i < words.size(); ++i) {
        const auto &w = words[i];
        WC_LOG("warn", "    " << (i + 1) << ". \"" << w.word << "\" (" << w.start_time << " --> "
                              << w.end_time << ", " << w.duration_ms << "ms)");
    }
    if (drifts) {
        drifts->push_back(SpanDrift{sentence.index, expected_ms, actual_ms});
    }
}

}  // namespace

bool validate_options(const AllocationOptions &options, std::string *error) {
    if (options.min_word_duration < 0) {
        if (error) {
            *error = "minimum word duration must not be negative (got " +
                     std::to_string(options.min_word_duration) + "ms)";
        }
        return false;
    }
    if (options.max_word_duration < options.min_word_duration) {
        if (error) {
            *error = "maximum word duration (" + std::to_string(options.max_word_duration) +
                     "ms) is below minimum (" + std::to_string(options.min_word_duration) +
                     "ms)";
        }
        return false;
    }
    if (options.max_word_duration > kMaxTimestampMs) {
        if (error) {
            *error = "maximum word duration (" + std::to_string(options.max_word_duration) +
                     "ms) exceeds the longest SRT time (" + std::to_string(kMaxTimestampMs) +
                     "ms)";
        }
        return false;
    }
    return true;
}

bool parse_duration_ms(const std::string &text, int64_t &out) {
    if (text.empty()) {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(v);
    return true;
}

std::vector<WordCue> allocate_words(const SentenceCue &sentence,
                                    const std::vector<WordToken> &tokens,
                                    const AllocationOptions &options,
                                    std::vector<SpanDrift> *drifts) {
    std::vector<WordCue> words;
    if (tokens.empty()) {
        return words;
    }
    int64_t total_chars = 0;
    for (const auto &t : tokens) {
        total_chars += t.length;
    }
    if (total_chars == 0) {
        return words;
    }

    // May be zero or negative for degenerate entries; the last word clamps at zero.
    const int64_t total_ms = duration_ms(sentence.start_time, sentence.end_time);

    words.reserve(tokens.size());
    std::string cursor = sentence.start_time;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto &token = tokens[i];
        int64_t word_ms = 0;
        if (i + 1 == tokens.size()) {
            word_ms = std::max<int64_t>(0, duration_ms(cursor, sentence.end_time));
        } else {
            const double share =
                static_cast<double>(token.length) / static_cast<double>(total_chars);
            word_ms = clamp_duration(round_half_up(share * static_cast<double>(total_ms)),
                                     options);
        }
        WordCue w{};
        w.index = static_cast<int64_t>(i + 1);
        w.word = token.word;
        w.start_time = cursor;
        w.end_time = add_ms(cursor, word_ms);
        w.duration_ms = duration_ms(w.start_time, w.end_time);
        w.source_index = sentence.index;
        cursor = w.end_time;
        words.emplace_back(std::move(w));
    }

    check_span(words, total_ms, sentence, drifts);
    return words;
}

std::vector<WordCue> allocate_all(const std::vector<SentenceCue> &sentences,
                                  const std::vector<std::vector<WordToken>> &token_lists,
                                  const AllocationOptions &options,
                                  std::vector<SpanDrift> *drifts) {
    if (sentences.size() != token_lists.size()) {
        throw InputMismatch(sentences.size(), token_lists.size());
    }
    std::vector<WordCue> all;
    int64_t next_index = 1;
    for (size_t i = 0; i < sentences.size(); ++i) {
        auto words = allocate_words(sentences[i], token_lists[i], options, drifts);
        for (auto &w : words) {
            w.index = next_index++;
            all.emplace_back(std::move(w));
        }
    }
    WC_LOG("alloc", "allocated " << all.size() << " words across " << sentences.size()
                                 << " entries");
    return all;
}
