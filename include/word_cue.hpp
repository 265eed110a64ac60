//
//  word_cue.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

/// @ingroup api
/// One sentence-level subtitle entry as read from an SRT file.
struct SentenceCue {
    int64_t index = 0;        ///< Ordinal from the source file
    std::string start_time;   ///< `HH:MM:SS,mmm`
    std::string end_time;     ///< `HH:MM:SS,mmm`
    std::string text;         ///< UTF-8 text; multiple lines joined with '\n'
};

/// @ingroup api
/// One word produced by the segmenter.
struct WordToken {
    std::string word;     ///< UTF-8 word text
    uint32_t length = 0;  ///< Code points in `word`; the only weight used for timing
    uint32_t position = 0;  ///< Code-point offset in the normalized sentence (informational)
};

/// @ingroup api
/// A word with its allocated display interval.
struct WordCue {
    int64_t index = 0;         ///< Output ordinal (global after batch allocation)
    std::string word;
    std::string start_time;
    std::string end_time;
    int64_t duration_ms = 0;   ///< Always end_time - start_time
    int64_t source_index = 0;  ///< SentenceCue::index this word came from
};
