//
//  utf8_utils.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "utf8_utils.hpp"

namespace {

inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

}  // namespace

std::u32string utf8_to_u32(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());

    const auto *p = reinterpret_cast<const unsigned char *>(s.data());
    const auto *end = p + s.size();

    while (p < end) {
        const unsigned char c0 = *p++;
        uint32_t cp = 0;
        size_t extra = 0;
        uint32_t min_cp = 0;
        if (c0 < 0x80) {
            out.push_back(static_cast<char32_t>(c0));
            continue;
        } else if ((c0 >> 5) == 0x6) {
            cp = c0 & 0x1F;
            extra = 1;
            min_cp = 0x80;
        } else if ((c0 >> 4) == 0xE) {
            cp = c0 & 0x0F;
            extra = 2;
            min_cp = 0x800;
        } else if ((c0 >> 3) == 0x1E) {
            cp = c0 & 0x07;
            extra = 3;
            min_cp = 0x10000;
        } else {
            out.push_back(kReplacementChar);
            continue;
        }
        if (static_cast<size_t>(end - p) < extra) {
            out.push_back(kReplacementChar);
            break;
        }
        bool valid = true;
        for (size_t i = 0; i < extra; ++i) {
            if (!is_continuation(p[i])) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (p[i] & 0x3F);
        }
        if (!valid) {
            // Resynchronize on the offending byte.
            out.push_back(kReplacementChar);
            continue;
        }
        p += extra;
        // Overlong forms, surrogate halves and out-of-range values are not scalar values.
        if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            out.push_back(kReplacementChar);
            continue;
        }
        out.push_back(static_cast<char32_t>(cp));
    }
    return out;
}

std::string u32_to_utf8(std::u32string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t ch : s) {
        const auto cp = static_cast<uint32_t>(ch);
        if (cp <= 0x7F) {
            out.push_back(static_cast<char>(cp));
        } else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

size_t utf8_length(std::string_view s) { return utf8_to_u32(s).size(); }
