#pragma once
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "filter_options.hpp"

namespace swearfilter {

// A word equal to this single space flags messages that normalize to nothing.
extern const char* const kBlankSentinel;

class SwearFilter {
public:
    explicit SwearFilter(bool enable_spaced_bypass, const std::vector<std::string>& initial_words = {});

    SwearFilter(const SwearFilter&) = delete;
    SwearFilter& operator=(const SwearFilter&) = delete;

    // Words that trip the filter, in no particular order. Empty when the word
    // set is empty or nothing matches. Throws MalformedEncoding when diacritic
    // folding is on and `msg` is not valid UTF-8.
    std::vector<std::string> check(const std::string& msg) const;

    void add(const std::vector<std::string>& words);
    void remove(const std::vector<std::string>& words);
    std::vector<std::string> words() const;

    // Lower-case, leet, fold, whitespace: what check() matches against.
    std::string normalize(const std::string& msg) const;

    // Set by the owner; not guarded, so don't change it while check() runs.
    FilterOptions options;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_set<std::string> bad_words_;
};

} // namespace swearfilter
