#pragma once
#include <string>
#include <vector>

namespace swearfilter {

// Read a UTF-8 text file line by line. Trailing '\r' is dropped, empty lines
// are skipped, invalid sequences are replaced and a leading BOM is stripped.
// Returns false if the file cannot be opened.
bool ReadUtf8Lines(const std::string& filename, std::vector<std::string>& lines);

// Read lines as they are, bytes untouched, empty lines kept. Only a trailing
// '\r' and a BOM at the start of the first line are removed.
bool ReadRawLines(const std::string& filename, std::vector<std::string>& lines);

std::string Join(const std::vector<std::string>& items, const std::string& delim);

// Remove spaces, tabs and newlines at head and tail.
std::string Trim(const std::string& s);

// Replace every non-overlapping occurrence of `from`, scanning left to right.
std::string ReplaceAll(const std::string& s, const std::string& from, const std::string& to);

} // namespace swearfilter
