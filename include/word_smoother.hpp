//
//  word_smoother.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <vector>

#include "word_cue.hpp"

// A word whose duration deviates from its neighbors' mean by more than this fraction
// is pulled halfway towards that mean.
inline constexpr double kSmoothingThreshold = 0.3;

enum class SmoothingScope {
    Batch,        // one sweep over the whole word list, across entry boundaries
    PerSentence,  // separate sweeps per run of equal source_index
};

/**
 * @brief Single forward pass that evens out abrupt duration jumps between neighbors.
 *
 * Only interior words are adjusted; the first and last word of each sweep keep their
 * duration. When a word is shortened or lengthened its end moves and the following word
 * starts at the new end (its own end is left alone). Comparisons use each word's
 * allocated duration, or its adjusted duration once changed; returned words always carry
 * duration_ms == end_time - start_time. The pass is not idempotent.
 */
std::vector<WordCue> smooth_word_durations(const std::vector<WordCue> &words,
                                           SmoothingScope scope = SmoothingScope::Batch);
