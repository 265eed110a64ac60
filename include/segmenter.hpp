//
//  segmenter.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "word_cue.hpp"

/// Word list used to cut runs of CJK characters into multi-character words.
class Dictionary {
public:
    Dictionary() = default;

    // One entry per line; the first whitespace-separated field is the word, trailing
    // fields (frequency, part of speech) are ignored. Blank lines and '#' comments skip.
    static std::optional<Dictionary> load(const std::string &path);

    void add(const std::string &word);
    bool contains(const std::u32string &word) const { return words_.count(word) != 0; }
    size_t size() const { return words_.size(); }
    size_t max_word_length() const { return max_len_; }

private:
    std::unordered_set<std::u32string> words_;
    size_t max_len_ = 0;
};

struct SegmentStats {
    size_t total_words = 0;
    size_t total_characters = 0;
    double average_word_length = 0.0;  ///< rounded to 2 decimals
};

/**
 * @brief Splits subtitle text into display words.
 *
 * Letters/digits of space-delimited scripts form words, CJK runs are cut by forward
 * maximum matching against the dictionary (single characters without one), every other
 * non-space character is a token of its own. Whitespace is collapsed first; `position`
 * refers to the collapsed text.
 */
class Segmenter {
public:
    Segmenter() = default;
    explicit Segmenter(std::shared_ptr<const Dictionary> dictionary)
        : dictionary_(std::move(dictionary)) {}

    std::vector<WordToken> segment(const std::string &text) const;
    std::vector<std::vector<WordToken>> segment_all(const std::vector<std::string> &texts) const;

    const Dictionary *dictionary() const { return dictionary_.get(); }

private:
    void cut_cjk(const std::u32string &text, size_t begin, size_t end,
                 std::vector<WordToken> &out) const;

    std::shared_ptr<const Dictionary> dictionary_;
};

SegmentStats segment_stats(const std::vector<WordToken> &tokens);

// True when the text holds any ideograph or kana, i.e. needs a dictionary to form words.
bool contains_cjk(const std::string &text);

// True when the words, concatenated, reproduce `text` with all whitespace removed.
bool validate_segmentation(const std::string &text, const std::vector<WordToken> &tokens);
