#include "leet.hpp"
#include "normalize.hpp"
#include "utils.hpp"

namespace swearfilter {

const std::vector<LeetRule>& multi_char_leet_rules() {
    // "ph" must run before the single-character table could touch its letters
    static const std::vector<LeetRule> rules = {
        {"vv", "w"},
        {"uu", "w"},
        {"\\/\\/", "w"},
        {"><", "x"},
        {"1<", "k"},
        {"|<", "k"},
        {"()", "o"},
        {"[]", "o"},
        {"ph", "f"},
    };
    return rules;
}

const std::vector<LeetRule>& single_char_leet_rules() {
    static const std::vector<LeetRule> rules = {
        {"4", "a"},
        {"@", "a"},
        {"8", "b"},
        {"(", "c"},
        {"<", "c"},
        {"[", "c"},
        {"3", "e"},
        {"\xE2\x82\xAC", "e"}, // €
        {"6", "g"},
        {"9", "g"},
        {"#", "h"},
        {"j", "i"},
        {"0", "o"},
        {"5", "s"},
        {"$", "s"},
        {"7", "t"},
        {"+", "t"},
        {"v", "u"},
        {"2", "z"},
    };
    return rules;
}

const std::vector<AmbiguousLeetRule>& ambiguous_leet_rules() {
    static const std::vector<AmbiguousLeetRule> rules = {
        {"!", {"i", "l"}},
        {"|", {"i", "l"}},
        {"1", {"i", "l"}},
        {"]", {"i", "l"}},
        {"}", {"i", "l"}},
    };
    return rules;
}

std::string normalize_leet_speak(const std::string& text) {
    std::string normalized = to_lower_utf8(text);

    for (const auto& rule : multi_char_leet_rules()) {
        normalized = ReplaceAll(normalized, rule.first, rule.second);
    }
    for (const auto& rule : single_char_leet_rules()) {
        normalized = ReplaceAll(normalized, rule.first, rule.second);
    }

    std::vector<std::string> possible;
    for (const auto& rule : ambiguous_leet_rules()) {
        if (normalized.find(rule.first) == std::string::npos) continue;
        for (const auto& candidate : rule.second) {
            possible.push_back(ReplaceAll(normalized, rule.first, candidate));
        }
    }

    // every interpretation side by side, so a substring match can hit any of them
    if (!possible.empty()) {
        return Join(possible, " ");
    }
    return normalized;
}

} // namespace swearfilter
