#pragma once

#include <string>
#include <vector>

using Tokens = std::vector<std::string>;

// Splits on runs of ASCII whitespace; leading and trailing whitespace yields no empty tokens.
Tokens split_whitespace(const std::string& text);
