#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

/// UTF-8 to UTF-32 conversion. Invalid bytes decode to U+FFFD.
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// ASCII whitespace, Unicode space separators (Zs/Zl/Zp) and the zero-width spaces
bool isUnicodeWhitespace(char32_t cp);

/// Number of code points that are not whitespace; the unit of every coverage ratio
std::size_t countNonWhitespace(std::string_view text);

/// Number of code points
std::size_t codepointCount(std::string_view text);

/// Strips Unicode whitespace from both ends
std::string trim(std::string_view text);

/// Splits on '\n' and keeps empty lines, so joining with '\n' restores the input
std::vector<std::string> splitLines(std::string_view text);

/// Joins lines [begin, end) with '\n'
std::string joinLines(const std::vector<std::string>& lines, std::size_t begin, std::size_t end);

bool startsWith(std::string_view text, std::string_view prefix);
bool endsWith(std::string_view text, std::string_view suffix);
bool startsWithIgnoreCase(std::string_view text, std::string_view prefix);

std::string toLowerAscii(std::string_view text);

/// PUA (Private Use Area) markers that delimit placeholder tokens inside note text
constexpr char32_t MARKER_START = U'\uE100';
constexpr char32_t MARKER_SEP = U'\uE101';
constexpr char32_t MARKER_END = U'\uE102';

} // namespace processing
