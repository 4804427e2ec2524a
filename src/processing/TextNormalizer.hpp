#pragma once

#include <cstddef>
#include <string>

namespace processing
{

// Converts \r\n and lone \r to \n
[[nodiscard]] std::string normalize_line_endings(const std::string& text);

// Caps runs of consecutive newlines at max_consecutive (\n{4,} -> \n\n\n by default)
[[nodiscard]] std::string collapse_newlines(const std::string& text, std::size_t max_consecutive = 3);

// Replaces each tab with a fixed number of spaces
[[nodiscard]] std::string expand_tabs(const std::string& text, std::size_t width = 4);

} // namespace processing
