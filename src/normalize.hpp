#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace swearfilter {

// Raised when text handed to the diacritic folder is not valid UTF-8.
class MalformedEncoding : public std::runtime_error {
public:
    explicit MalformedEncoding(std::size_t offset);

    // byte offset of the first invalid sequence
    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

// Throws MalformedEncoding if `text` contains an invalid UTF-8 sequence.
void validate_utf8(const std::string& text);

// Drop a leading UTF-8 BOM; everything else is left as is.
void strip_bom(std::string& text);

// Fix invalid UTF-8 sequences (U+FFFD) and strip a leading BOM.
std::string sanitize_utf8(const std::string& raw);

// Simple (one code point to one code point) Unicode lower-casing, so there
// is no final-sigma or special-casing context. Invalid sequences come out as U+FFFD.
std::string to_lower_utf8(const std::string& text);

// Decompose to NFD, drop every combining mark (Mn), recompose to NFC.
// "café" -> "cafe". Throws MalformedEncoding on invalid input.
std::string fold_diacritics(const std::string& text);

} // namespace swearfilter
