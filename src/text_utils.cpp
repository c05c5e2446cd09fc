#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace tmx_align {

namespace {

bool is_continuation_byte(unsigned char ch) {
    return (ch & 0xC0) == 0x80;
}

}  // namespace

std::size_t utf8_length(std::string_view text) {
    std::size_t count = 0;
    for (const char ch : text) {
        if (!is_continuation_byte(static_cast<unsigned char>(ch))) {
            ++count;
        }
    }
    return count;
}

std::size_t utf8_byte_offset(std::string_view text, std::size_t index) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (is_continuation_byte(static_cast<unsigned char>(text[i]))) {
            continue;
        }
        if (seen == index) {
            return i;
        }
        ++seen;
    }
    return text.size();
}

std::string sanitize_cell_text(std::string text) {
    std::replace(text.begin(), text.end(), kCellDelimiter, ' ');
    return text;
}

std::string normalize_lang(std::string_view lang) {
    std::size_t begin = 0;
    std::size_t end = lang.size();
    while (begin < end && is_space_byte(lang[begin])) {
        ++begin;
    }
    while (end > begin && is_space_byte(lang[end - 1])) {
        --end;
    }
    return ascii_lower(lang.substr(begin, end - begin));
}

std::string ascii_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool is_space_byte(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace tmx_align
