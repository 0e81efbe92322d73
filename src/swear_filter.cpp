#include "swear_filter.hpp"
#include "leet.hpp"
#include "normalize.hpp"
#include "utils.hpp"
#include "whitespace.hpp"
#include <mutex>

namespace swearfilter {

const char* const kBlankSentinel = " ";

SwearFilter::SwearFilter(bool enable_spaced_bypass, const std::vector<std::string>& initial_words)
    : bad_words_(initial_words.begin(), initial_words.end()) {
    options.enable_spaced_bypass = enable_spaced_bypass;
}

std::string SwearFilter::normalize(const std::string& msg) const {
    // folding is the only stage that may reject input, but lower-casing would
    // paper over bad bytes first, so validate the raw text here
    if (!options.disable_normalize) {
        validate_utf8(msg);
    }

    std::string message = to_lower_utf8(msg);
    if (!options.disable_leet_speak) {
        message = normalize_leet_speak(message);
    }
    if (!options.disable_normalize) {
        message = fold_diacritics(message);
    }
    return sanitize_whitespace(message, options);
}

std::vector<std::string> SwearFilter::check(const std::string& msg) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> tripped;
    if (bad_words_.empty()) return tripped;

    const std::string message = normalize(msg);
    std::string nospace;
    if (options.enable_spaced_bypass) {
        nospace = ReplaceAll(message, " ", "");
    }

    bool check_space = false;
    for (const auto& swear : bad_words_) {
        if (swear == kBlankSentinel) {
            check_space = true;
            continue;
        }
        if (message.find(swear) != std::string::npos) {
            tripped.push_back(swear);
            continue;
        }
        if (options.enable_spaced_bypass && nospace.find(swear) != std::string::npos) {
            tripped.push_back(swear);
        }
    }

    if (check_space && message.empty()) {
        tripped.push_back(kBlankSentinel);
    }
    return tripped;
}

void SwearFilter::add(const std::vector<std::string>& words) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bad_words_.insert(words.begin(), words.end());
}

void SwearFilter::remove(const std::vector<std::string>& words) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& word : words) {
        bad_words_.erase(word);
    }
}

std::vector<std::string> SwearFilter::words() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<std::string>(bad_words_.begin(), bad_words_.end());
}

} // namespace swearfilter
