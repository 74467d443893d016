#pragma once
#include <cstddef>
#include <string>

std::size_t utf8_len(unsigned char c);
bool is_valid_utf8(unsigned char c, std::size_t len, const std::string &s, std::size_t idx);

// count of code points in s before byte_offset
std::size_t utf8_char_index(const std::string &s, std::size_t byte_offset);
std::string make_snippet_utf8(const std::string &s, std::size_t byte_offset, std::size_t max_chars);
