#include "extractor.hpp"
#include "utf8_utils.hpp"

#include <utility>

constexpr size_t SNIP_CHARS = 20;


static inline char sentinel_for(char delimiter) {
    return delimiter == '*' ? '#' : '*';
}

static std::string unmatched_message(const std::string& text, size_t open_at, char delimiter) {
    return std::string("Unmatched delimiter '") + delimiter + "' at position "
         + std::to_string(utf8_char_index(text, open_at)) + ": "
         + make_snippet_utf8(text, open_at, SNIP_CHARS);
}

UnmatchedDelimiter::UnmatchedDelimiter(const std::string& text, size_t open_at, char delimiter)
    : std::runtime_error(unmatched_message(text, open_at, delimiter)),
      pos(utf8_char_index(text, open_at)) {}


// Handles one character. Returns false when the character closed a literal
// and has to be dispatched again from OUTSIDE.
static bool step(ParseState& st, char c, size_t i, char delimiter, std::vector<std::string>& out) {
    const bool is_delim = (c == delimiter);

    switch (st.type) {
        case StateType::OUTSIDE:
            if (is_delim) st.open(i);
            return true;

        case StateType::INSIDE:
            if (is_delim) st.type = StateType::PENDING_DELIMITER;
            else st.partial.push_back(c);
            return true;

        case StateType::PENDING_DELIMITER:
            if (is_delim) {
                st.partial.push_back(delimiter);
                st.type = StateType::INSIDE;
                return true;
            }
            out.push_back(std::move(st.partial));
            st.close();
            return false;
    }
    return true;
}

std::vector<std::string> extract_strings(std::string text, char delimiter){
    const size_t real_size = text.size();

    // forces a trailing delimiter to resolve as a closing one
    text.push_back(sentinel_for(delimiter));

    std::vector<std::string> out;
    ParseState st;

    for (size_t i = 0; i < text.size(); ++i) {
        if (!step(st, text[i], i, delimiter, out)) {
            step(st, text[i], i, delimiter, out);
        }
    }

    if (!st.is_outside()) {
        text.resize(real_size);
        throw UnmatchedDelimiter(text, st.open_at, delimiter);
    }

    return out;
}

bool try_extract_strings(const std::string& text, std::vector<std::string>& out, std::string& err,
                         char delimiter){
    out.clear();
    err.clear();

    try {
        out = extract_strings(text, delimiter);
    } catch (const UnmatchedDelimiter& e) {
        err = e.what();
        return false;
    }
    return true;
}

std::string quote_literal(const std::string& s, char delimiter){
    std::string out;
    out.reserve(s.size() + 2);

    out.push_back(delimiter);
    for (char c : s) {
        if (c == delimiter) out.push_back(delimiter);
        out.push_back(c);
    }
    out.push_back(delimiter);
    return out;
}
