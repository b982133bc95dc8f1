#include "tokenizer.hpp"

#include <cctype>

Tokens split_whitespace(const std::string& text) {
    Tokens tokens;
    std::string current;

    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(static_cast<char>(ch));
        }
    }

    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }

    return tokens;
}
