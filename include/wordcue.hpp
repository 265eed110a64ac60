//
//  wordcue.hpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "segmenter.hpp"
#include "time_allocator.hpp"
#include "word_cue.hpp"
#include "word_smoother.hpp"

namespace wordcue {

/// @defgroup api WordCue Public API
/// Public, supported C++ interfaces for splitting sentence subtitles into word cues.
/// @{

enum class OutputFormat { Srt, Json };

/**
 * @brief Settings for one processing run.
 *
 * Populated from CLI flags and/or a JSON config file (see load_config_json()).
 */
struct ProcessConfig {
    std::string input_path;
    std::string output_path;             ///< empty: default_output_path(input_path)
    AllocationOptions allocation;
    bool smooth = true;                  ///< run the neighbor smoothing pass
    SmoothingScope smoothing_scope = SmoothingScope::Batch;
    std::string dictionary_path;         ///< optional word list for CJK segmentation
    OutputFormat format = OutputFormat::Srt;
};

/**
 * @brief Outcome of process_srt_file().
 *
 * When `ok == false`, `message` describes what went wrong and the counters are zero.
 */
struct ProcessResult {
    bool ok{false};
    std::string input_path;
    std::string output_path;
    size_t original_entries = 0;
    size_t processed_entries = 0;
    size_t total_words = 0;
    size_t span_drift_count = 0;  ///< entries whose words do not span the original interval
    int64_t processing_ms = 0;
    std::string message;
};

/// Result object with success flag and optional error message.
struct ConfigStatus {
    bool ok{false};
    std::string message;
};

struct FileStats {
    size_t total_entries = 0;
    size_t total_characters = 0;      ///< code points across all entry texts
    double average_entry_length = 0;  ///< rounded to 2 decimals
    size_t estimated_words = 0;       ///< total_characters / 2.5, rounded
};

/**
 * @brief Return the WordCue library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v1.0` or `v1.0+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Parse, segment, allocate, smooth and write. Never throws.
ProcessResult process_srt_file(const ProcessConfig &config);  ///< @ingroup api

/// Allocate + smooth in memory, for callers that bring their own cues and tokens.
/// Throws InputMismatch / MalformedTimestamp like allocate_all().
std::vector<WordCue> split_cues(const std::vector<SentenceCue> &cues,
                                const std::vector<std::vector<WordToken>> &token_lists,
                                const ProcessConfig &config,
                                std::vector<SpanDrift> *drifts = nullptr);  ///< @ingroup api

/// `<dir>/<stem>_segmented<ext>` next to the input.
std::string default_output_path(const std::string &input_path);  ///< @ingroup api

/// Entry/character statistics for an SRT file; std::nullopt if it cannot be read.
std::optional<FileStats> file_stats(const std::string &path);  ///< @ingroup api

/// Checks that the file exists and holds at least one valid entry.
ConfigStatus validate_input(const std::string &path);  ///< @ingroup api

/**
 * @brief Overlay settings from a JSON config file onto `config`.
 *
 * Recognized keys: `min_duration`, `max_duration` (ms), `smooth` (bool), `smooth_scope`
 * ("batch" | "sentence"), `dictionary` (path, relative to the JSON file), `format`
 * ("srt" | "json"), `log_level`. Unknown keys are ignored with a debug log.
 */
ConfigStatus load_config_json(const std::string &json_path, ProcessConfig &config);  ///< @ingroup api

/// Serialize word cues as `{"words":[...]}` JSON text.
std::string words_to_json(const std::vector<WordCue> &words, int indent = 2);  ///< @ingroup api

/// @}

}  // namespace wordcue
