#include "TextNormalizer.hpp"

namespace processing
{

std::string normalize_line_endings(const std::string& text)
{
    if (text.find('\r') == std::string::npos)
        return text;

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            // \r\n collapses to a single \n
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

std::string collapse_newlines(const std::string& text, std::size_t max_consecutive)
{
    if (text.empty() || max_consecutive == 0)
        return text;

    std::string result;
    result.reserve(text.size());

    std::size_t consecutive_newlines = 0;
    for (char c : text)
    {
        if (c == '\n')
        {
            if (++consecutive_newlines <= max_consecutive)
                result += '\n';
        }
        else
        {
            consecutive_newlines = 0;
            result += c;
        }
    }
    return result;
}

std::string expand_tabs(const std::string& text, std::size_t width)
{
    if (text.find('\t') == std::string::npos)
        return text;

    std::string out;
    out.reserve(text.size() + width * 4);
    for (char c : text)
    {
        if (c == '\t')
            out.append(width, ' ');
        else
            out.push_back(c);
    }
    return out;
}

} // namespace processing
