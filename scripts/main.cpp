#include "config.hpp"
#include "normalize.hpp"
#include "swear_filter.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#ifdef _WIN32
#include <windows.h>
#include <psapi.h>
#endif

using namespace swearfilter;

static double get_memory_mb(){
#ifdef _WIN32
    PROCESS_MEMORY_COUNTERS pmc;
    if(GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))){
        return static_cast<double>(pmc.WorkingSetSize) / (1024.0 * 1024.0);
    }
#endif
    return 0.0;
}

// sorted, with the sentinel spelled out so it shows up in reports
static std::string describe(std::vector<std::string> words) {
    std::sort(words.begin(), words.end());
    for (auto& w : words) {
        if (w == kBlankSentinel) w = kBlankSentinelAlias;
    }
    return Join(words, ", ");
}

static std::vector<std::string> split_args(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string w;
    while (iss >> w) out.push_back(w == kBlankSentinelAlias ? std::string(kBlankSentinel) : w);
    return out;
}

int deal_with_file_input(SwearFilter& filter, const Config& cfg) {
    using Clock = std::chrono::steady_clock;
    auto t_begin = Clock::now();
    long long checked_lines = 0;
    long long flagged_lines = 0;
    long long failed_lines = 0;
    std::vector<std::string> lines;

    std::string inputpath = std::string(INPUT_ROOT_DIR) + "/" + cfg.inputFile;
    std::string outputpath = std::string(OUTPUT_ROOT_DIR) + "/" + cfg.outputFile;

    std::ofstream out(outputpath, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "[ERROR] cannot open output file: " << outputpath << std::endl;
        return EXIT_FAILURE;
    }

    out << "===== swear filter report =====";
    out << "\nInputFile: " << inputpath << "\n";
    out << "OutputFile: " << outputpath << "\n";
    out << "SpacedBypass: " << (filter.options.enable_spaced_bypass ? "on" : "off") << "\n";

    // raw read: invalid bytes must reach the filter so it can reject them
    if (!ReadRawLines(inputpath, lines)) {
        std::cerr << "[ERROR] cannot open input file: " << inputpath << std::endl;
        return EXIT_FAILURE;
    }
    if (lines.empty()) {
        std::cout << "[INFO] input file is empty: " << inputpath << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "[INFO] read " << lines.size() << " lines from " << inputpath << std::endl;
    out << "LineCount: " << lines.size() << "\n";

    for (size_t idx = 0; idx < lines.size(); ++idx) {
        checked_lines++;
        try {
            std::vector<std::string> tripped = filter.check(lines[idx]);
            if (!tripped.empty()) {
                flagged_lines++;
                out << "Line " << idx + 1 << ": " << describe(tripped) << "\n";
            }
        } catch (const MalformedEncoding& e) {
            failed_lines++;
            out << "[WARNING] Line " << idx + 1 << ": " << e.what() << "\n";
        }
    }

    double elapsed_sec = std::chrono::duration_cast<std::chrono::duration<double>>(Clock::now() - t_begin).count();
    double avg_latency_ms = checked_lines > 0 ? (elapsed_sec * 1000.0 / checked_lines) : 0.0;
    double throughput_lps = elapsed_sec > 0 ? (static_cast<double>(checked_lines) / elapsed_sec) : 0.0;

    out << "===================================\n";
    out << "Lines checked: " << checked_lines << "\n";
    out << "Lines flagged: " << flagged_lines << "\n";
    out << "Lines rejected: " << failed_lines << "\n";
    out << "Program Metrics" << "\n";
    out << "Throughput(lines/sec): " << throughput_lps << "\n";
    out << "AvgLatency(ms/line): " << avg_latency_ms << "\n";
    out << "Memory(MB): " << get_memory_mb() << "\n";

    std::cout << "[INFO] " << flagged_lines << " of " << checked_lines << " lines flagged, report: " << outputpath << std::endl;
    return EXIT_SUCCESS;
}

int deal_with_console_input(SwearFilter& filter) {
    std::cout << "==========================================================" << std::endl;
    std::cout << "Input format:" << std::endl;
    std::cout << "  1. ADD w1 w2 ...        -> Add banned words (<space> = blank sentinel)." << std::endl;
    std::cout << "  2. DEL w1 w2 ...        -> Remove banned words." << std::endl;
    std::cout << "  3. WORDS                -> List banned words." << std::endl;
    std::cout << "  4. SET <option> <0|1>   -> Toggle a filter option." << std::endl;
    std::cout << "  5. anything else        -> Check the line." << std::endl;
    std::cout << "Type 'exit' to quit." << std::endl;
    std::cout << "==========================================================" << std::endl;

    std::string content;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, content)) break;
        if (!content.empty() && content.back() == '\r') content.pop_back();
        if (content == "exit") break;

        try {
            std::string cmd = content.substr(0, content.find(' '));
            std::string rest = content.size() > cmd.size() ? content.substr(cmd.size() + 1) : "";
            if (cmd == "ADD") {
                filter.add(split_args(rest));
                std::cout << "[INFO] " << filter.words().size() << " words loaded" << std::endl;
            } else if (cmd == "DEL") {
                filter.remove(split_args(rest));
                std::cout << "[INFO] " << filter.words().size() << " words loaded" << std::endl;
            } else if (cmd == "WORDS") {
                std::cout << describe(filter.words()) << std::endl;
            } else if (cmd == "SET") {
                std::vector<std::string> args = split_args(rest);
                if (args.size() != 2 || !set_option(filter.options, args[0], args[1])) {
                    std::cout << "[WARNING] usage: SET <option> <0|1>" << std::endl;
                }
            } else {
                std::vector<std::string> tripped = filter.check(content);
                if (tripped.empty()) std::cout << "clean" << std::endl;
                else std::cout << "tripped: " << describe(tripped) << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] " << e.what() << std::endl;
        }
    }
    return EXIT_SUCCESS;
}

int main() {

    #ifdef _WIN32
    SetConsoleOutputCP(65001);//setting the output to utf-8
    SetConsoleCP(65001);//setting the input to utf-8
    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stdin, nullptr, _IONBF, 0);
    #endif

    Config cfg;
    std::string configPath = std::string(PROJECT_ROOT_DIR) + "/config.ini";
    if (!LoadIni(configPath, cfg)) {
        std::cout << "[WARNING] no config at " << configPath << ", using defaults" << std::endl;
    }

    std::vector<std::string> words;
    if (!load_word_list(std::string(INPUT_ROOT_DIR) + "/" + cfg.wordFile, words)) {
        return EXIT_FAILURE;
    }

    SwearFilter filter(cfg.options.enable_spaced_bypass, words);
    filter.options = cfg.options;
    std::cout << "[INFO] " << filter.words().size() << " banned words loaded" << std::endl;

    if (cfg.work_type == 1) {
        std::cout << "Choosing File_Input mode" << std::endl;
        return deal_with_file_input(filter, cfg);
    }
    std::cout << "Choosing Console_Input mode" << std::endl;
    return deal_with_console_input(filter);
}
