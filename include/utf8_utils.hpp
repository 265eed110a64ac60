//
//  utf8_utils.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

inline constexpr char32_t kReplacementChar = 0xFFFD;

// Best-effort UTF-8 -> UTF-32. Invalid sequences become U+FFFD.
std::u32string utf8_to_u32(std::string_view s);

// UTF-32 -> UTF-8.
std::string u32_to_utf8(std::u32string_view s);

// Code points in a UTF-8 string (invalid bytes count as one each).
size_t utf8_length(std::string_view s);

// Whitespace as understood by the subtitle cleaner (ASCII, NBSP, the U+2000 block,
// ideographic space, BOM).
inline constexpr bool is_space_cp(char32_t c) {
    return c == U' ' || (c >= U'\t' && c <= U'\r') || c == 0x00A0 || c == 0x1680 ||
           (c >= 0x2000 && c <= 0x200A) || c == 0x2028 || c == 0x2029 || c == 0x202F ||
           c == 0x205F || c == 0x3000 || c == 0xFEFF;
}

// Han ideographs and Japanese kana: scripts written without spaces between words.
inline constexpr bool is_cjk_cp(char32_t c) {
    return (c >= 0x3040 && c <= 0x30FF) ||    // hiragana, katakana
           (c >= 0x31F0 && c <= 0x31FF) ||    // katakana phonetic extensions
           (c >= 0x3400 && c <= 0x4DBF) ||    // CJK extension A
           (c >= 0x4E00 && c <= 0x9FFF) ||    // CJK unified ideographs
           (c >= 0xF900 && c <= 0xFAFF) ||    // compatibility ideographs
           (c >= 0x20000 && c <= 0x2FA1F);    // supplementary ideographic planes
}

// Letters, digits and combining marks of space-delimited scripts.
inline constexpr bool is_word_cp(char32_t c) {
    if (c < 0x80) {
        return (c >= U'0' && c <= U'9') || (c >= U'A' && c <= U'Z') || (c >= U'a' && c <= U'z') ||
               c == U'_';
    }
    if (c == 0x00D7 || c == 0x00F7) {
        return false;
    }
    return (c >= 0x00C0 && c <= 0x024F) ||    // Latin-1 supplement, Latin extended A/B
           (c >= 0x0250 && c <= 0x02AF) ||    // IPA
           (c >= 0x0300 && c <= 0x036F) ||    // combining diacritics
           (c >= 0x0370 && c <= 0x03FF) ||    // Greek
           (c >= 0x0400 && c <= 0x052F) ||    // Cyrillic
           (c >= 0x0531 && c <= 0x0587) ||    // Armenian
           (c >= 0x05D0 && c <= 0x05EA) ||    // Hebrew letters
           (c >= 0x0620 && c <= 0x064A) ||    // Arabic letters
           (c >= 0x0660 && c <= 0x0669) ||    // Arabic-Indic digits
           (c >= 0x0900 && c <= 0x0DFF) ||    // Indic scripts
           (c >= 0x0E00 && c <= 0x0E7F) ||    // Thai
           (c >= 0x1100 && c <= 0x11FF) ||    // Hangul jamo
           (c >= 0x1E00 && c <= 0x1FFF) ||    // Latin extended additional, Greek extended
           (c >= 0x3130 && c <= 0x318F) ||    // Hangul compatibility jamo
           (c >= 0xAC00 && c <= 0xD7AF) ||    // Hangul syllables
           (c >= 0xFF10 && c <= 0xFF19) ||    // fullwidth digits
           (c >= 0xFF21 && c <= 0xFF3A) ||    // fullwidth Latin upper
           (c >= 0xFF41 && c <= 0xFF5A);      // fullwidth Latin lower
}

// Characters that stay inside a word when letters follow on both sides ("don't", "3.14").
inline constexpr bool is_word_joiner_cp(char32_t c) {
    return c == U'\'' || c == 0x2019 || c == U'.' || c == U'-' || c == U'&';
}
