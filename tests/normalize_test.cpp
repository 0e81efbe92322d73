// Stage-level checks: leet tables and their order, ambiguous expansion scope,
// diacritic folding, whitespace sanitizing, and the word list / ini loaders.
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstdio>
#include "leet.hpp"
#include "normalize.hpp"
#include "whitespace.hpp"
#include "utils.hpp"
#include "config.hpp"
#include "swear_filter.hpp"

using namespace swearfilter;

static bool expect(bool cond, const std::string& msg) {
    if (!cond) std::cerr << "[FAIL] " << msg << std::endl;
    else std::cout << "[PASS] " << msg << std::endl;
    return cond;
}

static void write_file(const std::string& path, const std::string& body) {
    std::ofstream out(path, std::ios::binary);
    out << body;
}

int main() {
    bool ok_all = true;

    // 1) leet speak
    ok_all &= expect(normalize_leet_speak("h3ll0") == "hello", "Single-character rules");
    ok_all &= expect(normalize_leet_speak("PHONE") == "fone", "Lower-cases before ph -> f");
    ok_all &= expect(normalize_leet_speak("\\/\\/00t") == "woot", "\\/\\/ -> w");
    ok_all &= expect(normalize_leet_speak("vvow") == "wow", "vv -> w before v -> u");
    ok_all &= expect(normalize_leet_speak("1<ill") == "kill", "1< -> k before 1 is seen as ambiguous");
    ok_all &= expect(normalize_leet_speak("()[]") == "oo", "() and [] -> o");
    ok_all &= expect(normalize_leet_speak("h\xE2\x82\xAC$$") == "hess", "Multi-byte euro sign -> e");
    ok_all &= expect(normalize_leet_speak("he||o") == "heiio hello", "One copy per candidate, joined by spaces");
    // two different ambiguous symbols are expanded one at a time, not jointly
    ok_all &= expect(normalize_leet_speak("!1") == "i1 l1 !i !l", "Ambiguous symbols expand independently");
    ok_all &= expect(normalize_leet_speak("") == "", "Empty text");
    ok_all &= expect(multi_char_leet_rules().back().first == "ph", "Multi-character table keeps its order");
    ok_all &= expect(single_char_leet_rules().size() == 19 && ambiguous_leet_rules().size() == 5, "Table sizes");

    // 2) unicode
    ok_all &= expect(fold_diacritics("cr\xC3\xA8me br\xC3\xBBl\xC3\xA9" "e") == "creme brulee", "Precomposed accents fold");
    ok_all &= expect(fold_diacritics("cafe\xCC\x81") == "cafe", "Combining accent is dropped");
    ok_all &= expect(fold_diacritics("ma\xC3\xB1" "ana") == "manana", "n-tilde folds to n");
    ok_all &= expect(fold_diacritics("plain") == "plain", "Plain ASCII is unchanged");
    {
        bool threw = false;
        try {
            fold_diacritics("ab\xC3");
        } catch (const MalformedEncoding& e) {
            threw = e.offset() == 2;
        }
        ok_all &= expect(threw, "Truncated sequence raises MalformedEncoding");
    }
    ok_all &= expect(to_lower_utf8("\xC3\x89T\xC3\x89") == "\xC3\xA9t\xC3\xA9", "Unicode lower-casing");
    ok_all &= expect(to_lower_utf8("\xCE\x9F\xCE\x94\xCE\x9F\xCE\xA3") == "\xCE\xBF\xCE\xB4\xCE\xBF\xCF\x83",
                     "Final capital sigma lowers to plain sigma");
    ok_all &= expect(to_lower_utf8("\xC4\xB0") == "i", "Dotted capital I lowers to a single i");
    ok_all &= expect(to_lower_utf8("AB\xFF") == "ab\xEF\xBF\xBD", "Lower-casing replaces bad bytes");
    ok_all &= expect(sanitize_utf8("\xEF\xBB\xBFok\xFF") == "ok\xEF\xBF\xBD", "BOM stripped, bad byte replaced");
    {
        std::string bom = "\xEF\xBB\xBF" "x\xFF";
        strip_bom(bom);
        ok_all &= expect(bom == "x\xFF", "strip_bom leaves invalid bytes alone");
        std::string plain = "abc";
        strip_bom(plain);
        ok_all &= expect(plain == "abc", "strip_bom without a BOM is a no-op");
    }

    // 3) whitespace
    {
        FilterOptions opts;
        ok_all &= expect(sanitize_whitespace("  hello  world  ", opts) == "helloworld", "Trim, then delete interior runs");
        ok_all &= expect(sanitize_whitespace("a b", opts) == "a b", "Single space kept");
        ok_all &= expect(sanitize_whitespace("a\tb", opts) == "a b", "Tab becomes a space");
        ok_all &= expect(sanitize_whitespace("a\t\tb", opts) == "ab", "Two tabs are a run");
        ok_all &= expect(sanitize_whitespace("a\xE2\x80\x8B" "b", opts) == "ab", "Zero-width space removed");
        ok_all &= expect(sanitize_whitespace(" \xC2\xA0x", opts) == "x", "Leading no-break space trimmed");
        ok_all &= expect(sanitize_whitespace("a\xC2\xA0\xE3\x80\x80" "b", opts) == "ab", "Unicode space separators form runs");
        ok_all &= expect(sanitize_whitespace("a\v\vb", opts) == "a\v\vb", "Vertical tab is not stripped");
        ok_all &= expect(sanitize_whitespace("\xE2\x80\x8B \xE2\x80\x8B", opts) == "", "Zero-width then trim leaves nothing");

        FilterOptions keep_tab;
        keep_tab.disable_spaced_tab = true;
        ok_all &= expect(sanitize_whitespace("a\tb", keep_tab) == "a\tb", "Tab conversion off");
        FilterOptions keep_zw;
        keep_zw.disable_zero_width_stripping = true;
        ok_all &= expect(sanitize_whitespace("a\xE2\x80\x8B" "b", keep_zw) == "a\xE2\x80\x8B" "b", "Zero-width stripping off");
        FilterOptions keep_runs;
        keep_runs.disable_multi_whitespace_stripping = true;
        ok_all &= expect(sanitize_whitespace("  a  ", keep_runs) == "  a  ", "Run stripping off");
    }
    ok_all &= expect(is_strippable_space(U'\u3000') && is_strippable_space(U' ') && is_strippable_space(U'\f'),
                     "Space separators and ASCII whitespace");
    ok_all &= expect(!is_strippable_space(U'\u200B') && !is_strippable_space(U'\v') && !is_strippable_space(U'a'),
                     "Zero-width space, vertical tab and letters are not");

    // 4) helpers and loaders
    ok_all &= expect(ReplaceAll("aaa", "aa", "b") == "ba", "ReplaceAll is non-overlapping, left to right");
    ok_all &= expect(ReplaceAll("abc", "", "x") == "abc", "ReplaceAll with empty pattern is a no-op");
    ok_all &= expect(Join({"a", "b", "c"}, " ") == "a b c", "Join");
    ok_all &= expect(Trim(" \t x y \r\n") == "x y", "Trim");
    {
        const std::string words_path = "normalize_test_words.txt";
        write_file(words_path, "\xEF\xBB\xBF" "first\r\n\r\n<space>\n  spaced  \n");
        std::vector<std::string> words;
        bool loaded = load_word_list(words_path, words);
        ok_all &= expect(loaded && words == std::vector<std::string>({"first", " ", "spaced"}),
                         "Word list: BOM, CRLF, blank lines, <space> sentinel, trimming");
        std::remove(words_path.c_str());

        const std::string raw_path = "normalize_test_raw.txt";
        write_file(raw_path, "\xEF\xBB\xBF\r\n\xEF\xBB\xBF" "a\xFF\r\n\r\n");
        std::vector<std::string> raw;
        bool raw_loaded = ReadRawLines(raw_path, raw);
        ok_all &= expect(raw_loaded && raw == std::vector<std::string>({"", "\xEF\xBB\xBF" "a\xFF", ""}),
                         "Raw lines: BOM dropped from the first line only, bytes and blank lines kept");
        std::remove(raw_path.c_str());
        if (raw_loaded && !raw.empty()) {
            SwearFilter blank(false, {" "});
            ok_all &= expect(blank.check(raw[0]) == std::vector<std::string>({" "}),
                             "A first line holding only a BOM trips the blank sentinel");
        }

        std::vector<std::string> none;
        ok_all &= expect(!load_word_list("does_not_exist.txt", none) && none.empty(), "Missing word list");
    }
    {
        const std::string ini_path = "normalize_test_config.ini";
        write_file(ini_path,
                   "# comment\n"
                   "word_file = w.txt\n"
                   "work_type = 2\n"
                   "enable_spaced_bypass = 1\n"
                   "disable_leet_speak = true\n"
                   "disable_normalize = 0\n"
                   "unknown = 3\n");
        Config cfg;
        bool loaded = LoadIni(ini_path, cfg);
        ok_all &= expect(loaded && cfg.wordFile == "w.txt" && cfg.work_type == 2 && cfg.inputFile == "messages.txt",
                         "Ini: plain keys, defaults kept");
        ok_all &= expect(cfg.options.enable_spaced_bypass && cfg.options.disable_leet_speak && !cfg.options.disable_normalize,
                         "Ini: filter toggles");
        std::remove(ini_path.c_str());

        Config untouched;
        ok_all &= expect(!LoadIni("does_not_exist.ini", untouched) && untouched.work_type == 1, "Missing ini");

        FilterOptions opts;
        ok_all &= expect(!set_option(opts, "disable_everything", "1"), "Unknown option rejected");
        ok_all &= expect(!set_option(opts, "disable_leet_speak", "maybe") && !opts.disable_leet_speak, "Bad value rejected");
    }
    {
        SwearFilter f(false);
        ok_all &= expect(f.normalize("  PH4T\tc4f\xC3\xA9  ") == "fat cafe", "Full pipeline order");
    }

    if (!ok_all) {
        std::cerr << "\nSome tests FAILED." << std::endl;
        return 1;
    }
    std::cout << "\nAll tests PASSED." << std::endl;
    return 0;
}
