//
//  word_smoother.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "word_smoother.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "logging.hpp"
#include "srt_timestamp.hpp"

namespace {

// Sweeps words[begin, end) and appends the result to `out`.
size_t smooth_range(const std::vector<WordCue> &words, size_t begin, size_t end,
                    std::vector<WordCue> &out) {
    const size_t count = end - begin;
    if (count <= 2) {
        out.insert(out.end(), words.begin() + static_cast<std::ptrdiff_t>(begin),
                   words.begin() + static_cast<std::ptrdiff_t>(end));
        return 0;
    }

    size_t adjusted = 0;
    out.push_back(words[begin]);
    int64_t prev_nominal = words[begin].duration_ms;
    std::optional<std::string> carried_start;

    for (size_t i = begin + 1; i + 1 < end; ++i) {
        WordCue cur = words[i];
        if (carried_start) {
            cur.start_time = std::move(*carried_start);
            carried_start.reset();
        }
        int64_t nominal = words[i].duration_ms;
        const double avg =
            static_cast<double>(prev_nominal + words[i + 1].duration_ms) / 2.0;
        if (std::fabs(static_cast<double>(nominal) - avg) > kSmoothingThreshold * avg) {
            nominal = round_half_up((static_cast<double>(nominal) + avg) / 2.0);
            cur.end_time = add_ms(cur.start_time, nominal);
            carried_start = cur.end_time;
            ++adjusted;
        }
        cur.duration_ms = duration_ms(cur.start_time, cur.end_time);
        prev_nominal = nominal;
        out.emplace_back(std::move(cur));
    }

    WordCue last = words[end - 1];
    if (carried_start) {
        last.start_time = std::move(*carried_start);
        last.duration_ms = duration_ms(last.start_time, last.end_time);
    }
    out.emplace_back(std::move(last));
    return adjusted;
}

}  // namespace

std::vector<WordCue> smooth_word_durations(const std::vector<WordCue> &words,
                                           SmoothingScope scope) {
    if (words.size() <= 1) {
        return words;
    }
    std::vector<WordCue> out;
    out.reserve(words.size());
    size_t adjusted = 0;
    if (scope == SmoothingScope::Batch) {
        adjusted = smooth_range(words, 0, words.size(), out);
    } else {
        size_t begin = 0;
        while (begin < words.size()) {
            size_t end = begin + 1;
            while (end < words.size() && words[end].source_index == words[begin].source_index) {
                ++end;
            }
            adjusted += smooth_range(words, begin, end, out);
            begin = end;
        }
    }
    WC_LOG("smooth", "adjusted " << adjusted << " of " << words.size() << " word durations ("
                                 << (scope == SmoothingScope::Batch ? "batch" : "per-sentence")
                                 << " scope)");
    return out;
}
