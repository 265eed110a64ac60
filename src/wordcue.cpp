//
//  wordcue.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "wordcue.hpp"
#include "wordcue_version.hpp"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

#include "logging.hpp"
#include "srt_io.hpp"
#include "srt_timestamp.hpp"
#include "utf8_utils.hpp"

using json = nlohmann::json;

namespace wordcue {

std::string version_string() { return WORDCUE_VERSION_DISPLAY; }

}  // namespace wordcue

namespace {

static bool write_text_file(const std::string &path, const std::string &content) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            WC_LOG("error", "cannot create " << parent.string() << ": " << ec.message());
            return false;
        }
    }
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        WC_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return out.good();
}

static void warn_inverted_cues(const std::vector<SentenceCue> &cues) {
    for (const auto &c : cues) {
        if (duration_ms(c.start_time, c.end_time) < 0) {
            WC_LOG("warn", "entry " << c.index << " ends before it starts (" << c.start_time
                                    << " --> " << c.end_time
                                    << "); its last word will get 0ms");
        }
    }
}

static double round2(double v) { return std::floor(v * 100.0 + 0.5) / 100.0; }

}  // namespace

namespace wordcue {

namespace {
ProcessResult make_failure(ProcessResult res, std::string msg) {
    res.ok = false;
    res.original_entries = 0;
    res.processed_entries = 0;
    res.total_words = 0;
    res.span_drift_count = 0;
    res.message = std::move(msg);
    WC_LOG("error", res.message);
    return res;
}
}  // namespace

std::string default_output_path(const std::string &input_path) {
    const std::filesystem::path in(input_path);
    const std::string name =
        in.stem().string() + "_segmented" + in.extension().string();
    return (in.parent_path() / name).string();
}

std::vector<WordCue> split_cues(const std::vector<SentenceCue> &cues,
                                const std::vector<std::vector<WordToken>> &token_lists,
                                const ProcessConfig &config, std::vector<SpanDrift> *drifts) {
    auto words = allocate_all(cues, token_lists, config.allocation, drifts);
    if (config.smooth) {
        words = smooth_word_durations(words, config.smoothing_scope);
    }
    return words;
}

ProcessResult process_srt_file(const ProcessConfig &config) {
    const auto t0 = std::chrono::steady_clock::now();
    ProcessResult res{};
    res.input_path = config.input_path;
    res.output_path =
        config.output_path.empty() ? default_output_path(config.input_path) : config.output_path;
    auto elapsed_ms = [&]() {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - t0)
                                        .count());
    };
    WC_LOG("debug", "process_srt_file input=" << res.input_path << " output=" << res.output_path
                                              << " min=" << config.allocation.min_word_duration
                                              << " max=" << config.allocation.max_word_duration
                                              << " smooth=" << config.smooth);

    std::string option_error;
    if (!validate_options(config.allocation, &option_error)) {
        res.processing_ms = elapsed_ms();
        return make_failure(std::move(res), "Invalid options: " + option_error);
    }

    std::shared_ptr<const Dictionary> dictionary;
    if (!config.dictionary_path.empty()) {
        auto loaded = Dictionary::load(config.dictionary_path);
        if (!loaded) {
            res.processing_ms = elapsed_ms();
            return make_failure(std::move(res),
                                "Failed to load dictionary from " + config.dictionary_path);
        }
        dictionary = std::make_shared<const Dictionary>(std::move(*loaded));
    }
    const Segmenter segmenter(dictionary);

    auto cues = read_srt_file(config.input_path);
    if (!cues) {
        res.processing_ms = elapsed_ms();
        return make_failure(std::move(res), "Failed to read subtitles from " + config.input_path);
    }
    if (cues->empty()) {
        res.processing_ms = elapsed_ms();
        return make_failure(std::move(res),
                            "No valid subtitle entries found in " + config.input_path);
    }
    const auto t_read = std::chrono::steady_clock::now();
    WC_LOG("info", "parsed " << cues->size() << " subtitle entries");

    std::vector<std::string> texts;
    texts.reserve(cues->size());
    for (const auto &c : *cues) {
        texts.push_back(c.text);
    }
    if (!dictionary) {
        for (const auto &c : *cues) {
            if (contains_cjk(c.text)) {
                WC_LOG("info", "entry " << c.index
                                        << " has CJK text but no dictionary was given; "
                                           "ideographs become one word each (see --dict)");
                break;
            }
        }
    }
    const auto token_lists = segmenter.segment_all(texts);
    size_t total_words = 0;
    for (const auto &tokens : token_lists) {
        total_words += tokens.size();
    }
    WC_LOG("info", "segmented into " << total_words << " words");

    std::vector<WordCue> words;
    std::vector<SpanDrift> drifts;
    try {
        warn_inverted_cues(*cues);
        words = split_cues(*cues, token_lists, config, &drifts);
    } catch (const std::exception &e) {
        res.processing_ms = elapsed_ms();
        return make_failure(std::move(res), std::string("Time allocation failed: ") + e.what());
    }
    const auto t_alloc = std::chrono::steady_clock::now();

    bool written = false;
    if (config.format == OutputFormat::Json) {
        written = write_text_file(res.output_path, words_to_json(words) + "\n");
    } else {
        written = write_srt_file(words_to_cues(words), res.output_path);
    }
    if (!written) {
        res.processing_ms = elapsed_ms();
        return make_failure(std::move(res), "Failed to write output to " + res.output_path);
    }

    const auto t1 = std::chrono::steady_clock::now();
    const auto read_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t_read - t0).count();
    const auto alloc_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(t_alloc - t_read).count();
    const auto write_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t_alloc).count();
    WC_LOG("debug", "process_srt_file timings ms: read=" << read_ms << " split=" << alloc_ms
                                                         << " write=" << write_ms);

    res.ok = true;
    res.original_entries = cues->size();
    res.processed_entries = words.size();
    res.total_words = total_words;
    res.span_drift_count = drifts.size();
    res.processing_ms = elapsed_ms();
    res.message = "Processed " + std::to_string(res.original_entries) + " entries into " +
                  std::to_string(res.total_words) + " words in " +
                  std::to_string(res.processing_ms) + "ms";
    if (!drifts.empty()) {
        WC_LOG("warn", drifts.size() << " entries did not keep their original span");
    }
    WC_LOG("info", res.message);
    return res;
}

std::optional<FileStats> file_stats(const std::string &path) {
    auto cues = read_srt_file(path);
    if (!cues) {
        return std::nullopt;
    }
    FileStats stats{};
    stats.total_entries = cues->size();
    for (const auto &c : *cues) {
        stats.total_characters += utf8_length(c.text);
    }
    if (stats.total_entries > 0) {
        stats.average_entry_length = round2(static_cast<double>(stats.total_characters) /
                                            static_cast<double>(stats.total_entries));
    }
    stats.estimated_words = static_cast<size_t>(
        round_half_up(static_cast<double>(stats.total_characters) / 2.5));
    return stats;
}

ConfigStatus validate_input(const std::string &path) {
    auto cues = read_srt_file(path);
    if (!cues) {
        return ConfigStatus{false, "Cannot read " + path};
    }
    if (cues->empty()) {
        return ConfigStatus{false, "No valid subtitle entries found in " + path};
    }
    return ConfigStatus{true, "Input is valid with " + std::to_string(cues->size()) +
                                  " subtitle entries"};
}

ConfigStatus load_config_json(const std::string &json_path, ProcessConfig &config) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        WC_LOG("error", "open failed for " << json_path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return ConfigStatus{false, "Cannot open config " + json_path};
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception &e) {
        return ConfigStatus{false, "Config parse error in " + json_path + ": " + e.what()};
    }
    if (!j.is_object()) {
        return ConfigStatus{false, "Config " + json_path + " must be a JSON object"};
    }

    ProcessConfig next = config;
    std::optional<LogVerbosity> next_level;
    try {
        next.allocation.min_word_duration =
            j.value("min_duration", next.allocation.min_word_duration);
        next.allocation.max_word_duration =
            j.value("max_duration", next.allocation.max_word_duration);
        next.smooth = j.value("smooth", next.smooth);

        const std::string scope = j.value("smooth_scope", std::string());
        if (scope == "batch") {
            next.smoothing_scope = SmoothingScope::Batch;
        } else if (scope == "sentence") {
            next.smoothing_scope = SmoothingScope::PerSentence;
        } else if (!scope.empty()) {
            return ConfigStatus{false, "Unknown smooth_scope '" + scope + "'"};
        }

        const std::string dict = j.value("dictionary", std::string());
        if (!dict.empty()) {
            // Relative dictionary paths resolve against the config file's directory.
            const auto base = std::filesystem::path(json_path).parent_path();
            const std::filesystem::path p(dict);
            next.dictionary_path = (p.is_absolute() ? p : base / p).string();
        }

        const std::string format = j.value("format", std::string());
        if (format == "srt") {
            next.format = OutputFormat::Srt;
        } else if (format == "json") {
            next.format = OutputFormat::Json;
        } else if (!format.empty()) {
            return ConfigStatus{false, "Unknown format '" + format + "'"};
        }

        const std::string level = j.value("log_level", std::string());
        if (!level.empty()) {
            LogVerbosity v{};
            if (!parse_log_verbosity(level, v)) {
                return ConfigStatus{false, "Unknown log_level '" + level + "'"};
            }
            next_level = v;
        }
    } catch (const json::exception &e) {
        return ConfigStatus{false, "Config type error in " + json_path + ": " + e.what()};
    }

    for (const auto &item : j.items()) {
        const auto &key = item.key();
        if (key != "min_duration" && key != "max_duration" && key != "smooth" &&
            key != "smooth_scope" && key != "dictionary" && key != "format" &&
            key != "log_level") {
            WC_LOG("debug", "ignoring unknown config key '" << key << "'");
        }
    }

    std::string option_error;
    if (!validate_options(next.allocation, &option_error)) {
        return ConfigStatus{false, "Invalid options in " + json_path + ": " + option_error};
    }
    if (next_level) {
        set_log_verbosity(*next_level);
    }
    config = std::move(next);
    return ConfigStatus{true, {}};
}

std::string words_to_json(const std::vector<WordCue> &words, int indent) {
    json arr = json::array();
    for (const auto &w : words) {
        json o;
        o["index"] = w.index;
        o["word"] = w.word;
        o["start"] = w.start_time;
        o["end"] = w.end_time;
        o["duration_ms"] = w.duration_ms;
        o["source_index"] = w.source_index;
        arr.push_back(std::move(o));
    }
    json j;
    j["words"] = std::move(arr);
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace wordcue
