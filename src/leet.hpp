#pragma once
#include <string>
#include <utility>
#include <vector>

namespace swearfilter {

using LeetRule = std::pair<std::string, std::string>;                           // pattern -> letter
using AmbiguousLeetRule = std::pair<std::string, std::vector<std::string>>;     // pattern -> candidates

// Rule tables, process-wide and immutable. Applied in the order returned.
const std::vector<LeetRule>& multi_char_leet_rules();
const std::vector<LeetRule>& single_char_leet_rules();
const std::vector<AmbiguousLeetRule>& ambiguous_leet_rules();

// Lower-case `text`, apply the multi-character table, then the single-character
// table. For each ambiguous symbol still present, every candidate letter yields
// a copy of the text with all occurrences of that symbol replaced; if any copies
// were made the result is those copies joined with single spaces.
//
// Expansion is per symbol, not a cross product: with two different ambiguous
// symbols in the text, each copy still holds the other symbol unresolved.
std::string normalize_leet_speak(const std::string& text);

} // namespace swearfilter
