#pragma once
#include <string>

#include "filter_options.hpp"

namespace swearfilter {

// \t \n \f \r or any Unicode space separator (Zs). Not \v, not U+200B.
bool is_strippable_space(char32_t ch);

// Tabs -> spaces, drop zero-width spaces, then trim leading/trailing
// whitespace and delete every interior run of two or more whitespace
// characters outright (the run is removed, not shrunk to one space, so
// "a  b" becomes "ab"). Each step can be switched off in `opts`.
std::string sanitize_whitespace(const std::string& text, const FilterOptions& opts);

} // namespace swearfilter
