//
//  segmenter.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "segmenter.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <system_error>

#include "logging.hpp"
#include "utf8_utils.hpp"

namespace {

// Trim and collapse whitespace runs to a single ASCII space.
std::u32string normalize_spaces(const std::u32string &in) {
    std::u32string out;
    out.reserve(in.size());
    bool pending_space = false;
    for (char32_t c : in) {
        if (is_space_cp(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(U' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

WordToken make_token(const std::u32string &text, size_t begin, size_t end) {
    WordToken t{};
    t.word = u32_to_utf8(std::u32string_view(text).substr(begin, end - begin));
    t.length = static_cast<uint32_t>(end - begin);
    t.position = static_cast<uint32_t>(begin);
    return t;
}

}  // namespace

std::optional<Dictionary> Dictionary::load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        WC_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    Dictionary dict;
    std::string line;
    while (std::getline(f, line)) {
        const auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos || line[b] == '#') {
            continue;
        }
        const auto e = line.find_first_of(" \t\r", b);
        dict.add(line.substr(b, e == std::string::npos ? std::string::npos : e - b));
    }
    WC_LOG("segment", "loaded " << dict.size() << " dictionary words from " << path
                                << " (longest " << dict.max_word_length() << ")");
    return dict;
}

void Dictionary::add(const std::string &word) {
    auto w = utf8_to_u32(word);
    if (w.empty()) {
        return;
    }
    max_len_ = std::max(max_len_, w.size());
    words_.insert(std::move(w));
}

void Segmenter::cut_cjk(const std::u32string &text, size_t begin, size_t end,
                        std::vector<WordToken> &out) const {
    size_t pos = begin;
    while (pos < end) {
        size_t take = 1;
        if (dictionary_ && dictionary_->max_word_length() > 1) {
            const size_t longest = std::min(dictionary_->max_word_length(), end - pos);
            for (size_t len = longest; len > 1; --len) {
                if (dictionary_->contains(text.substr(pos, len))) {
                    take = len;
                    break;
                }
            }
        }
        out.push_back(make_token(text, pos, pos + take));
        pos += take;
    }
}

std::vector<WordToken> Segmenter::segment(const std::string &text) const {
    std::vector<WordToken> tokens;
    const std::u32string clean = normalize_spaces(utf8_to_u32(text));
    const size_t n = clean.size();
    size_t i = 0;
    while (i < n) {
        const char32_t c = clean[i];
        if (c == U' ') {
            ++i;
            continue;
        }
        size_t j = i + 1;
        if (is_cjk_cp(c)) {
            while (j < n && is_cjk_cp(clean[j])) {
                ++j;
            }
            cut_cjk(clean, i, j, tokens);
        } else if (is_word_cp(c)) {
            while (j < n) {
                if (is_word_cp(clean[j])) {
                    ++j;
                } else if (is_word_joiner_cp(clean[j]) && j + 1 < n && is_word_cp(clean[j + 1])) {
                    j += 2;
                } else {
                    break;
                }
            }
            tokens.push_back(make_token(clean, i, j));
        } else {
            tokens.push_back(make_token(clean, i, j));
        }
        i = j;
    }
    return tokens;
}

std::vector<std::vector<WordToken>> Segmenter::segment_all(
    const std::vector<std::string> &texts) const {
    std::vector<std::vector<WordToken>> out;
    out.reserve(texts.size());
    for (const auto &t : texts) {
        out.push_back(segment(t));
    }
    return out;
}

SegmentStats segment_stats(const std::vector<WordToken> &tokens) {
    SegmentStats stats{};
    stats.total_words = tokens.size();
    for (const auto &t : tokens) {
        stats.total_characters += t.length;
    }
    if (stats.total_words > 0) {
        const double avg = static_cast<double>(stats.total_characters) /
                           static_cast<double>(stats.total_words);
        stats.average_word_length = std::floor(avg * 100.0 + 0.5) / 100.0;
    }
    return stats;
}

bool contains_cjk(const std::string &text) {
    for (char32_t c : utf8_to_u32(text)) {
        if (is_cjk_cp(c)) {
            return true;
        }
    }
    return false;
}

bool validate_segmentation(const std::string &text, const std::vector<WordToken> &tokens) {
    auto strip = [](const std::u32string &s) {
        std::u32string out;
        out.reserve(s.size());
        for (char32_t c : s) {
            if (!is_space_cp(c)) {
                out.push_back(c);
            }
        }
        return out;
    };
    std::string joined;
    for (const auto &t : tokens) {
        joined += t.word;
    }
    return strip(utf8_to_u32(text)) == strip(utf8_to_u32(joined));
}
