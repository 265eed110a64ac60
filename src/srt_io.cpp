//
//  srt_io.cpp
//  WordCue
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_io.hpp"

#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "srt_timestamp.hpp"

namespace {

std::string trim(const std::string &s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

bool is_blank(const std::string &s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Strip a UTF-8 BOM and fold CRLF / CR line endings to LF.
std::string normalize_newlines(const std::string &content) {
    size_t start = 0;
    if (content.size() >= 3 && static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        start = 3;
    }
    std::string out;
    out.reserve(content.size() - start);
    for (size_t i = start; i < content.size(); ++i) {
        const char c = content[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Leading integer of the line ("12", "+3", "7abc"); false when there is none.
bool parse_ordinal(const std::string &line, int64_t &out) {
    const std::string s = trim(line);
    size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        negative = s[i] == '-';
        ++i;
    }
    const size_t digits_begin = i;
    int64_t v = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        if (v > (std::numeric_limits<int64_t>::max() - 9) / 10) {
            return false;
        }
        v = v * 10 + (s[i] - '0');
        ++i;
    }
    if (i == digits_begin) {
        return false;
    }
    out = negative ? -v : v;
    return true;
}

bool is_time_field(const std::string &s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != ':' && c != ',') {
            return false;
        }
    }
    return true;
}

// "<start> --> <end>"; only digits, ':' and ',' are accepted on either side.
bool split_timing_line(const std::string &line, std::string &start, std::string &end) {
    const std::string s = trim(line);
    const auto arrow = s.find("-->");
    if (arrow == std::string::npos) {
        return false;
    }
    start = trim(s.substr(0, arrow));
    end = trim(s.substr(arrow + 3));
    return is_time_field(start) && is_time_field(end);
}

std::vector<std::vector<std::string>> split_blocks(const std::string &content) {
    std::vector<std::vector<std::string>> blocks;
    std::vector<std::string> current;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (is_blank(line)) {
            if (!current.empty()) {
                blocks.emplace_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(line);
    }
    if (!current.empty()) {
        blocks.emplace_back(std::move(current));
    }
    return blocks;
}

}  // namespace

std::vector<SentenceCue> parse_srt_content(const std::string &content) {
    std::vector<SentenceCue> cues;
    for (const auto &lines : split_blocks(normalize_newlines(content))) {
        // ordinal, timing, at least one line of text
        if (lines.size() < 3) {
            WC_LOG("srt", "skipping short block starting with '"
                              << wordcue::text_preview(lines.front()) << "'");
            continue;
        }
        SentenceCue cue{};
        if (!parse_ordinal(lines[0], cue.index)) {
            WC_LOG("warn",
                   "skipping entry with invalid ordinal: " << wordcue::text_preview(lines[0]));
            continue;
        }
        if (!split_timing_line(lines[1], cue.start_time, cue.end_time)) {
            WC_LOG("warn", "skipping entry " << cue.index
                                             << " with invalid timing line: " << lines[1]);
            continue;
        }
        std::string text;
        for (size_t i = 2; i < lines.size(); ++i) {
            if (i > 2) {
                text.push_back('\n');
            }
            text += lines[i];
        }
        cue.text = trim(text);
        if (cue.text.empty()) {
            WC_LOG("warn", "skipping entry " << cue.index << " with empty text");
            continue;
        }
        try {
            const int64_t span = duration_ms(cue.start_time, cue.end_time);
            WC_LOG("srt", "entry " << cue.index << " " << cue.start_time << " --> "
                                   << cue.end_time << " (" << span << "ms)");
        } catch (const MalformedTimestamp &e) {
            WC_LOG("warn", "skipping entry " << cue.index << ": " << e.what());
            continue;
        }
        cues.emplace_back(std::move(cue));
    }
    return cues;
}

std::optional<std::vector<SentenceCue>> read_srt_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        WC_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    auto cues = parse_srt_content(ss.str());
    WC_LOG("srt", "parsed " << cues.size() << " entries from " << path);
    return cues;
}

std::string generate_srt_content(const std::vector<SentenceCue> &cues) {
    std::string out;
    for (size_t i = 0; i < cues.size(); ++i) {
        const auto &c = cues[i];
        if (i > 0) {
            out += "\n\n";
        }
        out += std::to_string(c.index);
        out += '\n';
        out += c.start_time;
        out += " --> ";
        out += c.end_time;
        out += '\n';
        out += c.text;
    }
    out += '\n';
    return out;
}

bool write_srt_file(const std::vector<SentenceCue> &cues, const std::string &path) {
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
    const std::string content = generate_srt_content(cues);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return out.good();
}

bool validate_srt_file(const std::string &path) {
    auto cues = read_srt_file(path);
    return cues && !cues->empty();
}

std::vector<SentenceCue> words_to_cues(const std::vector<WordCue> &words) {
    std::vector<SentenceCue> cues;
    cues.reserve(words.size());
    for (const auto &w : words) {
        cues.push_back(SentenceCue{w.index, w.start_time, w.end_time, w.word});
    }
    return cues;
}
