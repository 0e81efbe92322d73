#pragma once

namespace swearfilter {

// Every normalization stage is on by default; spaced bypass is off.
struct FilterOptions {
    bool disable_normalize = false;                  // diacritic folding (à -> a)
    bool disable_spaced_tab = false;                 // [tab] -> [space]
    bool disable_multi_whitespace_stripping = false; // trim and delete runs of 2+ whitespace
    bool disable_zero_width_stripping = false;       // drop U+200B
    bool disable_leet_speak = false;
    bool enable_spaced_bypass = false;               // also match with all spaces removed
};

} // namespace swearfilter
