//
//  srt_io.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "word_cue.hpp"

// Parse SRT text. Blocks with a bad ordinal, bad timing line, malformed timestamps or
// empty text are skipped with a warning; never throws for content problems.
std::vector<SentenceCue> parse_srt_content(const std::string &content);

// Read and parse a file. std::nullopt when the file cannot be opened.
std::optional<std::vector<SentenceCue>> read_srt_file(const std::string &path);

// "index\nstart --> end\ntext" blocks separated by a blank line, trailing newline.
std::string generate_srt_content(const std::vector<SentenceCue> &cues);

// Writes the rendered cues, creating missing parent directories.
bool write_srt_file(const std::vector<SentenceCue> &cues, const std::string &path);

// True if the file exists and holds at least one valid cue.
bool validate_srt_file(const std::string &path);

// Word cues rendered as subtitle entries (the word becomes the text).
std::vector<SentenceCue> words_to_cues(const std::vector<WordCue> &words);
