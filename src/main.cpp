//
//  main.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "logging.hpp"
#include "wordcue.hpp"
#include "wordcue_version.hpp"

namespace {

void print_usage() {
    std::cerr << "WordCue " << WORDCUE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage for splitting:\n"
              << "  wordcue -i <input.srt> [-o <output>] [options]\n"
              << "usage for inspecting:\n"
              << "  wordcue validate <input.srt>\n"
              << "  wordcue stats <input.srt>\n"
              << "Options:\n"
              << "  -i, --input FILE         Sentence-level SRT file to split.\n"
              << "  -o, --output FILE        Destination (default: <input>_segmented.srt).\n"
              << "  --min-duration MS        Minimum word display time (default: 200).\n"
              << "  --max-duration MS        Maximum word display time (default: 3000,\n"
              << "                           at most 359999999).\n"
              << "  --no-smooth              Skip the neighbor smoothing pass.\n"
              << "  --smooth-per-sentence    Smooth each entry separately instead of the\n"
              << "                           whole word stream.\n"
              << "  --dict FILE              Word list used to cut CJK text into words.\n"
              << "                           Without one every ideograph is its own word.\n"
              << "  --config FILE            JSON settings; command-line options win.\n"
              << "  --json                   Write word cues as JSON instead of SRT.\n"
              << "  --stats                  Print input statistics before processing.\n"
              << "  --verbose                Same as --log-level debug.\n"
              << "  --log-level LEVEL        error|warn|info|debug (default: info).\n"
              << "  -v, --version            Print the version and exit.\n";
}

void print_stats(const std::string &path, const wordcue::FileStats &stats) {
    std::cout << "Statistics for " << path << "\n"
              << "  entries:              " << stats.total_entries << "\n"
              << "  characters:           " << stats.total_characters << "\n"
              << "  average entry length: " << stats.average_entry_length << "\n"
              << "  estimated words:      " << stats.estimated_words << "\n";
}

int run_stats(const std::string &path) {
    auto stats = wordcue::file_stats(path);
    if (!stats) {
        WC_LOG("error", "wordcue: failed to read " << path);
        return 1;
    }
    print_stats(path, *stats);
    return 0;
}

int run_validate(const std::string &path) {
    auto status = wordcue::validate_input(path);
    if (!status.ok) {
        std::cout << "Invalid: " << status.message << "\n";
        return 1;
    }
    std::cout << "Valid: " << status.message << "\n";
    return run_stats(path);
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "WordCue " << WORDCUE_VERSION_DISPLAY << "\n";
        return 0;
    }
    if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        print_usage();
        return 0;
    }
    if (argc == 3 && std::string(argv[1]) == "validate") {
        return run_validate(argv[2]);
    }
    if (argc == 3 && std::string(argv[1]) == "stats") {
        return run_stats(argv[2]);
    }

    wordcue::ProcessConfig config{};
    std::string config_path;
    bool show_stats = false;
    // Flags are collected first so that a --config file can be overridden by them.
    std::string input;
    std::string output;
    std::string dict;
    int64_t min_ms = -1;
    int64_t max_ms = -1;
    bool have_min = false;
    bool have_max = false;
    bool no_smooth = false;
    bool per_sentence = false;
    bool json_out = false;
    bool have_level = false;
    wordcue::LogVerbosity level = wordcue::LogVerbosity::Info;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need_value = [&](std::string &dst) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            dst = argv[++i];
            return true;
        };
        std::string value;
        if (arg == "-i" || arg == "--input") {
            if (!need_value(input)) return 2;
        } else if (arg == "-o" || arg == "--output") {
            if (!need_value(output)) return 2;
        } else if (arg == "--min-duration") {
            if (!need_value(value)) return 2;
            if (!parse_duration_ms(value, min_ms)) {
                std::cerr << "Invalid --min-duration: " << value << "\n";
                return 2;
            }
            have_min = true;
        } else if (arg == "--max-duration") {
            if (!need_value(value)) return 2;
            if (!parse_duration_ms(value, max_ms)) {
                std::cerr << "Invalid --max-duration: " << value << "\n";
                return 2;
            }
            have_max = true;
        } else if (arg == "--no-smooth") {
            no_smooth = true;
        } else if (arg == "--smooth-per-sentence") {
            per_sentence = true;
        } else if (arg == "--dict") {
            if (!need_value(dict)) return 2;
        } else if (arg == "--config") {
            if (!need_value(config_path)) return 2;
        } else if (arg == "--json") {
            json_out = true;
        } else if (arg == "--stats") {
            show_stats = true;
        } else if (arg == "--verbose") {
            level = wordcue::LogVerbosity::Debug;
            have_level = true;
        } else if (arg == "--log-level") {
            if (!need_value(value)) return 2;
            if (!wordcue::parse_log_verbosity(value, level)) {
                std::cerr << "Unknown log level: " << value << "\n";
                return 2;
            }
            have_level = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        }
    }

    if (input.empty()) {
        print_usage();
        return 2;
    }

    if (!config_path.empty()) {
        auto status = wordcue::load_config_json(config_path, config);
        if (!status.ok) {
            WC_LOG("error", "wordcue: " << status.message);
            return 2;
        }
    }
    if (have_level) {
        wordcue::set_log_verbosity(level);
    }
    config.input_path = input;
    config.output_path = output;
    if (have_min) config.allocation.min_word_duration = min_ms;
    if (have_max) config.allocation.max_word_duration = max_ms;
    if (no_smooth) config.smooth = false;
    if (per_sentence) config.smoothing_scope = SmoothingScope::PerSentence;
    if (!dict.empty()) config.dictionary_path = dict;
    if (json_out) config.format = wordcue::OutputFormat::Json;

    std::string option_error;
    if (!validate_options(config.allocation, &option_error)) {
        std::cerr << "Invalid options: " << option_error << "\n";
        return 2;
    }

    std::error_code ec;
    if (!std::filesystem::exists(config.input_path, ec)) {
        WC_LOG("error", "wordcue: input file does not exist: " << config.input_path);
        return 1;
    }
    std::string ext = std::filesystem::path(config.input_path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (ext != ".srt") {
        WC_LOG("warn", "input file does not have an .srt extension: " << config.input_path);
    }

    if (show_stats) {
        if (run_stats(config.input_path) != 0) {
            return 1;
        }
    }

    auto result = wordcue::process_srt_file(config);
    if (!result.ok) {
        WC_LOG("error", "wordcue: " << result.message);
        return 1;
    }
    std::cout << "Input:    " << result.input_path << "\n"
              << "Output:   " << result.output_path << "\n"
              << "Entries:  " << result.original_entries << "\n"
              << "Words:    " << result.total_words << "\n"
              << "Time:     " << result.processing_ms << "ms\n";
    if (result.span_drift_count > 0) {
        std::cout << "Drift:    " << result.span_drift_count << " entries\n";
    }
    return 0;
}
