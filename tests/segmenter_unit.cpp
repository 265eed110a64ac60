// Tokenizer behavior for space-delimited text, CJK runs and dictionary cuts.
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "segmenter.hpp"

namespace {

std::string g_testdata = TESTDATA_DIR;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[segmenter_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::vector<std::string> words_of(const std::vector<WordToken> &tokens) {
    std::vector<std::string> out;
    for (const auto &t : tokens) {
        out.push_back(t.word);
    }
    return out;
}

std::shared_ptr<const Dictionary> dict_of(const std::vector<std::string> &words) {
    auto d = std::make_shared<Dictionary>();
    for (const auto &w : words) {
        d->add(w);
    }
    return d;
}

bool test_latin_words_and_punctuation() {
    const Segmenter seg;
    const auto tokens = seg.segment("Hello, world!");
    bool ok = check(words_of(tokens) == std::vector<std::string>({"Hello", ",", "world", "!"}),
                    "words and punctuation are separate tokens");
    if (tokens.size() != 4) {
        return false;
    }
    ok &= check(tokens[0].length == 5 && tokens[1].length == 1 && tokens[2].length == 5 &&
                    tokens[3].length == 1,
                "lengths");
    ok &= check(tokens[0].position == 0 && tokens[1].position == 5 && tokens[2].position == 7 &&
                    tokens[3].position == 12,
                "positions");
    return ok;
}

bool test_whitespace_collapsed() {
    const Segmenter seg;
    const auto tokens = seg.segment("  one \t two\n\nthree  ");
    bool ok = check(words_of(tokens) == std::vector<std::string>({"one", "two", "three"}),
                    "whitespace never becomes a token");
    if (tokens.size() != 3) {
        return false;
    }
    ok &= check(tokens[0].position == 0 && tokens[1].position == 4 && tokens[2].position == 8,
                "positions refer to the collapsed text");
    ok &= check(seg.segment("").empty(), "empty text");
    ok &= check(seg.segment(" \t\r\n ").empty(), "whitespace only");
    return ok;
}

bool test_joiners() {
    const Segmenter seg;
    bool ok = check(words_of(seg.segment("don't stop")) ==
                        std::vector<std::string>({"don't", "stop"}),
                    "apostrophe inside a word");
    ok &= check(words_of(seg.segment("3.14 apples.")) ==
                    std::vector<std::string>({"3.14", "apples", "."}),
                "decimal point kept, trailing period split");
    ok &= check(words_of(seg.segment("well-known 'quote'")) ==
                    std::vector<std::string>({"well-known", "'", "quote", "'"}),
                "hyphenated word, quotes split");
    ok &= check(words_of(seg.segment("R&D")) == std::vector<std::string>({"R&D"}),
                "ampersand between letters");
    return ok;
}

bool test_non_ascii_scripts() {
    const Segmenter seg;
    const auto naive = seg.segment("naïve café");
    bool ok = check(words_of(naive) == std::vector<std::string>({"naïve", "café"}),
                    "Latin-1 letters stay in words");
    ok &= check(naive.size() == 2 && naive[0].length == 5 && naive[1].length == 4,
                "length counts code points, not bytes");
    ok &= check(words_of(seg.segment("Привет мир")) ==
                    std::vector<std::string>({"Привет", "мир"}),
                "Cyrillic");
    ok &= check(words_of(seg.segment("2×3")) == std::vector<std::string>({"2", "×", "3"}),
                "multiplication sign is not a letter");

    const auto bad = seg.segment("\xff");
    ok &= check(bad.size() == 1 && bad[0].word == "\xEF\xBF\xBD" && bad[0].length == 1,
                "invalid byte becomes one replacement character");
    return ok;
}

bool test_cjk_without_dictionary() {
    const Segmenter seg;
    const auto tokens = seg.segment("你好世界");
    bool ok = check(words_of(tokens) == std::vector<std::string>({"你", "好", "世", "界"}),
                    "one token per character");
    for (size_t i = 0; i < tokens.size(); ++i) {
        ok &= check(tokens[i].length == 1 && tokens[i].position == i, "single character tokens");
    }
    const auto spaced = seg.segment("你好\xE3\x80\x80世界");
    ok &= check(spaced.size() == 4, "ideographic space separates");
    if (spaced.size() == 4) {
        ok &= check(spaced[2].position == 3, "ideographic space collapses to one position");
    }
    ok &= check(words_of(seg.segment("你好，世界")) ==
                    std::vector<std::string>({"你", "好", "，", "世", "界"}),
                "fullwidth comma is its own token");
    ok &= check(words_of(seg.segment("ひらがな")).size() == 4, "kana split per character");
    return ok;
}

bool test_cjk_with_dictionary() {
    const Segmenter basic(dict_of({"你好", "世界"}));
    bool ok = check(words_of(basic.segment("你好世界")) ==
                        std::vector<std::string>({"你好", "世界"}),
                    "dictionary words");
    const auto tokens = basic.segment("你好世界");
    ok &= check(tokens.size() == 2 && tokens[1].length == 2 && tokens[1].position == 2,
                "dictionary word length and position");

    const Segmenter longest(dict_of({"北京", "北京大学", "大学", "学生"}));
    ok &= check(words_of(longest.segment("北京大学生")) ==
                    std::vector<std::string>({"北京大学", "生"}),
                "forward maximum matching prefers the longest word");

    const Segmenter mixed(dict_of({"编程"}));
    ok &= check(words_of(mixed.segment("我爱Python编程")) ==
                    std::vector<std::string>({"我", "爱", "Python", "编程"}),
                "mixed scripts");

    ok &= check(words_of(Segmenter(nullptr).segment("你好")).size() == 2,
                "null dictionary behaves like none");
    return ok;
}

bool test_dictionary_load() {
    auto dict = Dictionary::load(g_testdata + "/dict.txt");
    bool ok = check(dict.has_value(), "dict.txt loads");
    if (!dict) {
        return false;
    }
    ok &= check(dict->size() == 7, "comments and blank lines skipped");
    ok &= check(dict->max_word_length() == 4, "longest entry");
    ok &= check(dict->contains(U"北京大学"), "word before frequency column");
    ok &= check(!dict->contains(U"30"), "frequency is not a word");

    const Segmenter seg(std::make_shared<const Dictionary>(std::move(*dict)));
    ok &= check(words_of(seg.segment("北京大学生")) ==
                    std::vector<std::string>({"北京大学", "生"}),
                "loaded dictionary drives segmentation");

    ok &= check(!Dictionary::load(g_testdata + "/no_such_dict.txt").has_value(),
                "missing dictionary file");
    return ok;
}

bool test_stats_and_validation() {
    const Segmenter seg;
    const auto tokens = seg.segment("one two six");
    SegmentStats stats = segment_stats(tokens);
    bool ok = check(stats.total_words == 3 && stats.total_characters == 9, "stats totals");
    ok &= check(stats.average_word_length == 3.0, "average 3.0");
    ok &= check(segment_stats(seg.segment("ab c")).average_word_length == 1.5, "average 1.5");
    ok &= check(segment_stats(seg.segment("a b cc")).average_word_length == 1.33,
                "average rounded to 2 decimals");
    const SegmentStats empty = segment_stats({});
    ok &= check(empty.total_words == 0 && empty.average_word_length == 0.0, "empty stats");

    const std::string text = "Hello,  world! 你好";
    ok &= check(validate_segmentation(text, seg.segment(text)), "segmentation reproduces text");
    auto dropped = seg.segment(text);
    dropped.pop_back();
    ok &= check(!validate_segmentation(text, dropped), "missing token detected");
    ok &= check(validate_segmentation("", {}), "empty text, no tokens");
    return ok;
}

bool test_contains_cjk() {
    bool ok = check(contains_cjk("Hello 你好"), "ideographs detected");
    ok &= check(contains_cjk("カタカナ"), "kana detected");
    ok &= check(!contains_cjk("Hello, world!"), "Latin text");
    ok &= check(!contains_cjk("\xEF\xBC\x8C"), "fullwidth punctuation alone is not CJK text");
    ok &= check(!contains_cjk(""), "empty text");
    return ok;
}

bool test_segment_all() {
    const Segmenter seg;
    const auto lists = seg.segment_all({"a b", "", "c"});
    bool ok = check(lists.size() == 3, "one list per text");
    if (lists.size() == 3) {
        ok &= check(lists[0].size() == 2 && lists[1].empty() && lists[2].size() == 1,
                    "lists line up with input");
    }
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc > 1) {
        g_testdata = argv[1];
    }
    bool ok = true;
    ok &= test_latin_words_and_punctuation();
    ok &= test_whitespace_collapsed();
    ok &= test_joiners();
    ok &= test_non_ascii_scripts();
    ok &= test_cjk_without_dictionary();
    ok &= test_cjk_with_dictionary();
    ok &= test_dictionary_load();
    ok &= test_stats_and_validation();
    ok &= test_contains_cjk();
    ok &= test_segment_all();
    if (ok) {
        std::cout << "segmenter_unit OK\n";
    }
    return ok ? 0 : 1;
}
