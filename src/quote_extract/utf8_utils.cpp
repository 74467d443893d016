#include "utf8_utils.hpp"


size_t utf8_len(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c >> 5) == 0b110) return 2;
    if ((c >> 4) == 0b1110) return 3;
    if ((c >> 3) == 0b11110) return 4;
    return 1;
}

bool is_valid_utf8(unsigned char c, size_t len, const std::string &s, size_t idx){
    if (idx + len > s.size()) return false;
    if (len > 1 && utf8_len(c) != len) return false;

    for (size_t k = 1; k < len; ++k) {
        unsigned char ck = static_cast<unsigned char>(s[idx + k]);
        if ((ck & 0xC0) != 0x80) return false;
    }

    return true;
}

// broken sequences are stepped over one byte at a time
static size_t step(const std::string &s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t len = utf8_len(c);
    if (!is_valid_utf8(c, len, s, i)) return 1;
    return len;
}

size_t utf8_char_index(const std::string &s, size_t byte_offset) {
    if (byte_offset > s.size()) byte_offset = s.size();

    size_t i = 0;
    size_t chars = 0;
    while (i < byte_offset) {
        i += step(s, i);
        ++chars;
    }
    return chars;
}

std::string make_snippet_utf8(const std::string &s, size_t byte_offset, size_t max_chars) {
    if (byte_offset >= s.size() || max_chars == 0) return {};

    size_t i = byte_offset;
    size_t chars = 0;

    while (i < s.size() && chars < max_chars) {
        i += step(s, i);
        ++chars;
    }

    std::string out = s.substr(byte_offset, i - byte_offset);
    if (i < s.size()) out += "...";
    return out;
}
