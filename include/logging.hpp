//
//  logging.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace wordcue {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI/config level name (error|warn|info|debug). Returns false for unknown names.
bool parse_log_verbosity(std::string_view name, LogVerbosity &out);

// Short "text" preview used when logging subtitle lines that may span several rows.
inline constexpr size_t kTextPreviewChars = 48;
inline std::string text_preview(const std::string &text, size_t max_len = kTextPreviewChars) {
    std::string out;
    out.reserve(std::min(text.size(), max_len) + 3);
    for (size_t i = 0; i < text.size() && out.size() < max_len; ++i) {
        out.push_back(text[i] == '\n' ? ' ' : text[i]);
    }
    if (text.size() > max_len) {
        // Drop a UTF-8 sequence the cut left incomplete; complete ones stay.
        size_t lead = out.size();
        while (lead > 0 && (static_cast<unsigned char>(out[lead - 1]) & 0xC0) == 0x80) {
            --lead;
        }
        if (lead > 0) {
            const auto b = static_cast<unsigned char>(out[lead - 1]);
            const size_t need = b >= 0xF0 ? 4 : b >= 0xE0 ? 3 : b >= 0xC0 ? 2 : 1;
            if (out.size() - (lead - 1) < need) {
                out.resize(lead - 1);
            }
        }
        out += "...";
    }
    return out;
}

}  // namespace wordcue

inline constexpr wordcue::LogVerbosity wc_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return wordcue::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return wordcue::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return wordcue::LogVerbosity::Info;
    }
    // Everything else (srt/segment/alloc/etc.) treated as debug-level.
    return wordcue::LogVerbosity::Debug;
}

inline bool wc_should_log(const char* level) {
    const auto current = wordcue::get_log_verbosity();
    const auto sev = wc_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void wc_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[WordCue][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[WordCue][" << level << "] " << msg << std::endl;
    }
}

#define WC_LOG(level, message)                                              \
    do {                                                                    \
        if (wc_should_log(level)) {                                         \
            std::ostringstream _wc_log_ss;                                  \
            _wc_log_ss << message;                                          \
            wc_log_impl(level, _wc_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
