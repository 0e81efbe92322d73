#include "config.hpp"
#include "swear_filter.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace swearfilter {

const char* const kBlankSentinelAlias = "<space>";

static bool parse_flag(const std::string& value, bool& out) {
    if (value == "1" || value == "true") { out = true; return true; }
    if (value == "0" || value == "false") { out = false; return true; }
    return false;
}

bool set_option(FilterOptions& opts, const std::string& key, const std::string& value) {
    bool* field = nullptr;
    if (key == "disable_normalize") field = &opts.disable_normalize;
    else if (key == "disable_spaced_tab") field = &opts.disable_spaced_tab;
    else if (key == "disable_multi_whitespace_stripping") field = &opts.disable_multi_whitespace_stripping;
    else if (key == "disable_zero_width_stripping") field = &opts.disable_zero_width_stripping;
    else if (key == "disable_leet_speak") field = &opts.disable_leet_speak;
    else if (key == "enable_spaced_bypass") field = &opts.enable_spaced_bypass;
    if (!field) return false;
    return parse_flag(value, *field);
}

bool LoadIni(const std::string& path, Config& cfg) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string t = Trim(line);
        if (t.empty() || t[0] == '#') continue;
        size_t eq = t.find('=');
        if (eq == std::string::npos) continue;
        std::string key = Trim(t.substr(0, eq));
        std::string val = Trim(t.substr(eq + 1));
        if (key == "word_file") cfg.wordFile = val;
        else if (key == "input_file") cfg.inputFile = val;
        else if (key == "output_file") cfg.outputFile = val;
        else if (key == "work_type") cfg.work_type = std::atoi(val.c_str());//atoi: string->int
        else if (key.rfind("disable_", 0) == 0 || key.rfind("enable_", 0) == 0) {
            if (!set_option(cfg.options, key, val)) {
                std::cerr << "[WARNING] " << path << ":" << lineno << ": bad option " << key << " = " << val << std::endl;
            }
        }
    }
    return true;
}

bool load_word_list(const std::string& path, std::vector<std::string>& words) {
    std::vector<std::string> lines;
    if (!ReadUtf8Lines(path, lines)) {
        std::cerr << "[ERROR] cannot open word file: " << path << std::endl;
        return false;
    }
    for (auto& line : lines) {
        if (line == kBlankSentinelAlias) {
            words.push_back(kBlankSentinel);
            continue;
        }
        std::string w = Trim(line);
        if (!w.empty()) words.push_back(w);
    }
    return true;
}

} // namespace swearfilter
