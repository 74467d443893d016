#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

constexpr char DEFAULT_DELIMITER = '\'';

enum class StateType { OUTSIDE, INSIDE, PENDING_DELIMITER };

// Where the scanner is relative to a literal. partial and open_at are only
// meaningful while INSIDE or PENDING_DELIMITER.
struct ParseState {
    StateType type = StateType::OUTSIDE;
    std::string partial;
    size_t open_at = 0;

    void open(size_t i){
        type = StateType::INSIDE;
        partial.clear();
        open_at = i;
    }
    void close(){
        type = StateType::OUTSIDE;
        partial.clear();
    }
    bool is_outside() const {
        return type == StateType::OUTSIDE;
    }
};

class UnmatchedDelimiter : public std::runtime_error {
public:
    UnmatchedDelimiter(const std::string& text, size_t open_at, char delimiter);

    // code point index of the opening delimiter that was never closed
    size_t position() const { return pos; }

private:
    size_t pos;
};

/**
 * Returns the contents of every delimiter-quoted literal in text, in order.
 * A doubled delimiter inside a literal stands for one delimiter character.
 * Throws UnmatchedDelimiter when text has an odd number of delimiters.
 */
std::vector<std::string> extract_strings(std::string text, char delimiter = DEFAULT_DELIMITER);

bool try_extract_strings(const std::string& text, std::vector<std::string>& out, std::string& err,
                         char delimiter = DEFAULT_DELIMITER);

std::string quote_literal(const std::string& s, char delimiter = DEFAULT_DELIMITER);
