#pragma once
#include <string>
#include <vector>

#include "filter_options.hpp"

namespace swearfilter {

// Word list lines spelled like this stand for the single-space sentinel.
extern const char* const kBlankSentinelAlias;

struct Config {
    std::string wordFile = "bad_words.txt";
    std::string inputFile = "messages.txt";
    std::string outputFile = "report.txt";
    int work_type = 1;
    FilterOptions options;
};

// Parse "key = value" lines, '#' starts a comment. Unknown keys are ignored.
// Returns false if the file cannot be opened (cfg is left untouched).
bool LoadIni(const std::string& path, Config& cfg);

// Apply one filter toggle by its option name. Returns false for unknown names
// or values other than 0/1/true/false.
bool set_option(FilterOptions& opts, const std::string& key, const std::string& value);

bool load_word_list(const std::string& path, std::vector<std::string>& words);

} // namespace swearfilter
