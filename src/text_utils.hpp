#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tmx_align {

// Internal cell delimiter. Never present in row text.
inline constexpr char kCellDelimiter = '\t';

// Number of code points in a UTF-8 string. Invalid lead bytes count as one.
std::size_t utf8_length(std::string_view text);

// Byte offset of the code point at `index`. Returns text.size() for index == length.
std::size_t utf8_byte_offset(std::string_view text, std::size_t index);

// Replaces every kCellDelimiter with a single space.
std::string sanitize_cell_text(std::string text);

std::string normalize_lang(std::string_view lang);

std::string ascii_lower(std::string_view text);

bool is_space_byte(char ch);

}  // namespace tmx_align
