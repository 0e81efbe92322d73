#include "normalize.hpp"
#include <iterator>

#include "utf8.h"
#include "uni_algo/case.h"
#include "uni_algo/norm.h"
#include "uni_algo/prop.h"

namespace swearfilter {

MalformedEncoding::MalformedEncoding(std::size_t offset)
    : std::runtime_error("malformed UTF-8 input at byte " + std::to_string(offset)),
      offset_(offset) {}

void validate_utf8(const std::string& text) {
    auto bad = utf8::find_invalid(text.begin(), text.end());
    if (bad != text.end()) {
        throw MalformedEncoding(static_cast<std::size_t>(bad - text.begin()));
    }
}

void strip_bom(std::string& text) {
    if (utf8::starts_with_bom(text.begin(), text.end())) {
        text.erase(0, 3);
    }
}

std::string sanitize_utf8(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    utf8::replace_invalid(raw.begin(), raw.end(), std::back_inserter(out));
    strip_bom(out);
    return out;
}

std::string to_lower_utf8(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(clean));

    std::u32string u32;
    utf8::utf8to32(clean.begin(), clean.end(), std::back_inserter(u32));
    for (auto& ch : u32) {
        ch = una::codepoint::to_simple_lowercase(ch);
    }

    std::string out;
    utf8::utf32to8(u32.begin(), u32.end(), std::back_inserter(out));
    return out;
}

std::string fold_diacritics(const std::string& text) {
    validate_utf8(text);

    std::string nfd = una::norm::to_nfd_utf8(text);
    std::u32string u32;
    utf8::utf8to32(nfd.begin(), nfd.end(), std::back_inserter(u32));

    std::u32string bare;
    bare.reserve(u32.size());
    for (char32_t ch : u32) {
        if (una::codepoint::get_general_category(ch) == una::codepoint::general_category::Mn) continue;
        bare.push_back(ch);
    }

    std::string out;
    utf8::utf32to8(bare.begin(), bare.end(), std::back_inserter(out));
    return una::norm::to_nfc_utf8(out);
}

} // namespace swearfilter
