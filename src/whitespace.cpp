#include "whitespace.hpp"
#include "utils.hpp"
#include <iterator>

#include "utf8.h"
#include "uni_algo/prop.h"

namespace swearfilter {

namespace {

const char* const kZeroWidthSpace = "\xE2\x80\x8B"; // U+200B

std::string strip_whitespace_runs(const std::string& text) {
    std::u32string u32;
    utf8::utf8to32(text.begin(), text.end(), std::back_inserter(u32));

    size_t b = 0;
    while (b < u32.size() && is_strippable_space(u32[b])) b++;
    size_t e = u32.size();
    while (e > b && is_strippable_space(u32[e - 1])) e--;

    std::u32string kept;
    kept.reserve(e - b);
    size_t i = b;
    while (i < e) {
        if (!is_strippable_space(u32[i])) {
            kept.push_back(u32[i++]);
            continue;
        }
        size_t j = i;
        while (j < e && is_strippable_space(u32[j])) j++;
        if (j - i == 1) kept.push_back(u32[i]); // a lone separator survives
        i = j;
    }

    std::string out;
    utf8::utf32to8(kept.begin(), kept.end(), std::back_inserter(out));
    return out;
}

} // namespace

bool is_strippable_space(char32_t ch) {
    if (ch == U'\t' || ch == U'\n' || ch == U'\f' || ch == U'\r') return true;
    return una::codepoint::get_general_category(ch) == una::codepoint::general_category::Zs;
}

std::string sanitize_whitespace(const std::string& text, const FilterOptions& opts) {
    std::string message = text;
    if (!opts.disable_spaced_tab) {
        message = ReplaceAll(message, "\t", " ");
    }
    if (!opts.disable_zero_width_stripping) {
        message = ReplaceAll(message, kZeroWidthSpace, "");
    }
    if (!opts.disable_multi_whitespace_stripping) {
        message = strip_whitespace_runs(message);
    }
    return message;
}

} // namespace swearfilter
