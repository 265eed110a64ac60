// Neighbor smoothing: threshold, carried start, scope handling and chain integrity.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "srt_timestamp.hpp"
#include "test_utils.hpp"
#include "word_smoother.hpp"

using namespace test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[smoothing_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::vector<int64_t> durations_of(const std::vector<WordCue> &words) {
    std::vector<int64_t> out;
    for (const auto &w : words) {
        out.push_back(w.duration_ms);
    }
    return out;
}

bool consistent(const std::vector<WordCue> &words) {
    for (const auto &w : words) {
        if (w.duration_ms != duration_ms(w.start_time, w.end_time)) {
            return false;
        }
    }
    return true;
}

bool test_trivial_inputs() {
    bool ok = check(smooth_word_durations({}).empty(), "empty input");
    const auto one = chain(0, {5000});
    const auto one_out = smooth_word_durations(one);
    ok &= check(one_out.size() == 1 && one_out[0].duration_ms == 5000, "single word untouched");
    const auto two = chain(0, {100, 5000});
    ok &= check(durations_of(smooth_word_durations(two)) == std::vector<int64_t>({100, 5000}),
                "no interior words with two entries");
    return ok;
}

bool test_outlier_pulled_towards_neighbors() {
    // 200 between two 1000s: mean 1000, off by 800 > 300 -> (200 + 1000) / 2 = 600.
    const auto in = chain(0, {1000, 200, 1000});
    const auto out = smooth_word_durations(in);
    bool ok = check(out.size() == 3, "same length");
    if (out.size() != 3) {
        return false;
    }
    ok &= check(out[0].start_time == "00:00:00,000" && out[0].duration_ms == 1000,
                "first word is never adjusted");
    ok &= check(out[1].duration_ms == 600 && out[1].end_time == "00:00:01,600",
                "outlier lengthened to 600");
    ok &= check(out[2].start_time == "00:00:01,600", "next word starts at the new end");
    ok &= check(out[2].end_time == "00:00:02,200", "next word keeps its end");
    ok &= check(out[2].duration_ms == 600, "next word duration follows its new start");
    ok &= check(out[1].end_time == out[2].start_time, "still a chain");
    ok &= check(in[1].duration_ms == 200 && in[2].start_time == "00:00:01,200",
                "input left untouched");
    return ok;
}

bool test_within_threshold_untouched() {
    const auto in = chain(0, {1000, 900, 1000});
    const auto out = smooth_word_durations(in);
    return check(durations_of(out) == durations_of(in), "100ms off a 1000ms mean stays");
}

bool test_adjusted_duration_feeds_next_comparison() {
    // After word 2 becomes 600, word 3 (nominal 1000) is compared against
    // (600 + 1000) / 2 = 800 and stays; its start moved so it now spans 600ms.
    const auto out = smooth_word_durations(chain(0, {1000, 200, 1000, 1000}));
    bool ok = check(out.size() == 4, "four words");
    if (out.size() != 4) {
        return false;
    }
    ok &= check(durations_of(out) == std::vector<int64_t>({1000, 600, 600, 1000}),
                "only the outlier is resized");
    ok &= check(out[2].start_time == "00:00:01,600" && out[2].end_time == "00:00:02,200",
                "third word start shifted, end kept");
    ok &= check(out[3].start_time == "00:00:02,200" && out[3].end_time == "00:00:03,200",
                "last word untouched");
    ok &= check(consistent(out), "durations match timestamps");
    return ok;
}

bool test_cascade_and_not_idempotent() {
    const auto in = chain(0, {2000, 200, 2000, 200, 2000});
    const auto once = smooth_word_durations(in);
    bool ok = check(durations_of(once) == std::vector<int64_t>({2000, 1100, 1325, 931, 1044}),
                    "single pass cascade");
    ok &= check(once.front().start_time == "00:00:00,000", "batch start kept");
    ok &= check(once.back().end_time == "00:00:06,400", "batch end kept");
    for (size_t i = 0; i + 1 < once.size(); ++i) {
        ok &= check(once[i].end_time == once[i + 1].start_time, "chain after smoothing");
    }
    ok &= check(consistent(once), "durations match timestamps");

    const auto twice = smooth_word_durations(once);
    ok &= check(twice[1].duration_ms == 1381, "second pass keeps adjusting");
    ok &= check(durations_of(twice) != durations_of(once), "smoothing is not idempotent");
    return ok;
}

bool test_scope() {
    // Entries 1 and 2 each have two words: 0-1000, 1000-2000 | 2000-2200, 2200-3200.
    const auto in = chain(0, {1000, 1000, 200, 1000}, {1, 1, 2, 2});

    const auto batch = smooth_word_durations(in, SmoothingScope::Batch);
    bool ok = check(durations_of(batch) == std::vector<int64_t>({1000, 800, 550, 850}),
                    "batch scope smooths across the entry boundary");
    ok &= check(batch[1].end_time == "00:00:01,800", "entry 1 now ends early");
    ok &= check(batch[2].start_time == "00:00:01,800", "entry 2 starts at the moved end");
    ok &= check(batch[3].end_time == "00:00:03,200", "final end kept");

    const auto per_sentence = smooth_word_durations(in, SmoothingScope::PerSentence);
    ok &= check(durations_of(per_sentence) == durations_of(in),
                "per-sentence scope has no interior words here");
    ok &= check(per_sentence[1].end_time == "00:00:02,000", "entry 1 end preserved");

    // Three words per entry: each entry is swept on its own.
    const auto in3 = chain(0, {1000, 200, 1000, 1000, 200, 1000}, {1, 1, 1, 2, 2, 2});
    const auto out3 = smooth_word_durations(in3, SmoothingScope::PerSentence);
    ok &= check(durations_of(out3) == std::vector<int64_t>({1000, 600, 600, 1000, 600, 600}),
                "each entry smoothed separately");
    ok &= check(out3[2].end_time == "00:00:02,200" && out3[3].start_time == "00:00:02,200",
                "entry boundary untouched");
    for (size_t i = 0; i < out3.size(); ++i) {
        ok &= check(out3[i].source_index == in3[i].source_index, "source index kept");
        ok &= check(out3[i].index == in3[i].index, "index kept");
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_trivial_inputs();
    ok &= test_outlier_pulled_towards_neighbors();
    ok &= test_within_threshold_untouched();
    ok &= test_adjusted_duration_feeds_next_comparison();
    ok &= test_cascade_and_not_idempotent();
    ok &= test_scope();
    if (ok) {
        std::cout << "smoothing_unit OK\n";
    }
    return ok ? 0 : 1;
}
