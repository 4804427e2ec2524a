#include "TextUtils.hpp"
#include <utf8proc.h>

#include <algorithm>
#include <cctype>

namespace processing
{

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    const auto len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            result.push_back(U'\uFFFD');
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isUnicodeWhitespace(char32_t cp)
{
    if (cp < 0x80)
        return cp == ' ' || (cp >= '\t' && cp <= '\r');
    if (cp == U'\u200B' || cp == U'\uFEFF' || cp == char32_t{ 0x85 })
        return true;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::size_t countNonWhitespace(std::string_view text)
{
    const auto cps = utf8ToUtf32(text);
    return static_cast<std::size_t>(
        std::count_if(cps.begin(), cps.end(), [](char32_t cp) { return !isUnicodeWhitespace(cp); }));
}

std::size_t codepointCount(std::string_view text)
{
    // Every byte that is not a continuation byte starts a code point
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string trim(std::string_view text)
{
    if (text.empty())
        return std::string();

    // Fast path for ASCII-only edges
    std::size_t first = 0;
    std::size_t last = text.size();
    while (first < last && static_cast<unsigned char>(text[first]) < 0x80 &&
           isUnicodeWhitespace(static_cast<char32_t>(text[first])))
        ++first;
    while (last > first && static_cast<unsigned char>(text[last - 1]) < 0x80 &&
           isUnicodeWhitespace(static_cast<char32_t>(text[last - 1])))
        --last;

    std::string_view core = text.substr(first, last - first);
    if (core.empty())
        return std::string();
    if (static_cast<unsigned char>(core.front()) < 0x80 && static_cast<unsigned char>(core.back()) < 0x80)
        return std::string(core);

    std::u32string cps = utf8ToUtf32(core);
    auto begin = std::find_if(cps.begin(), cps.end(), [](char32_t cp) { return !isUnicodeWhitespace(cp); });
    auto end = std::find_if(cps.rbegin(), cps.rend(), [](char32_t cp) { return !isUnicodeWhitespace(cp); }).base();
    if (begin >= end)
        return std::string();
    return utf32ToUtf8(std::u32string(begin, end));
}

std::vector<std::string> splitLines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true)
    {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos)
        {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines, std::size_t begin, std::size_t end)
{
    std::string out;
    end = std::min(end, lines.size());
    for (std::size_t i = begin; i < end; ++i)
    {
        if (i > begin)
            out.push_back('\n');
        out += lines[i];
    }
    return out;
}

bool startsWith(std::string_view text, std::string_view prefix)
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::string_view text, std::string_view suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWithIgnoreCase(std::string_view text, std::string_view prefix)
{
    if (text.size() < prefix.size())
        return false;
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

std::string toLowerAscii(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace processing
