#include "ChoiceFieldParser.hpp"

#include "../processing/TextUtils.hpp"

#include <algorithm>
#include <set>

namespace choice
{

using processing::utf32ToUtf8;
using processing::utf8ToUtf32;

namespace
{

constexpr char32_t kFullStop = 0xFF0E;        // ．
constexpr char32_t kIdeographicComma = 0x3001; // 、
constexpr char32_t kFullParen = 0xFF09;       // ）
constexpr char32_t kFullColon = 0xFF1A;       // ：
constexpr char32_t kFullComma = 0xFF0C;       // ，
constexpr char32_t kFullSemicolon = 0xFF1B;   // ；

bool isAsciiUpper(char32_t c) { return c >= U'A' && c <= U'Z'; }
bool isAsciiLower(char32_t c) { return c >= U'a' && c <= U'z'; }
bool isDigit(char32_t c) { return c >= U'0' && c <= U'9'; }

bool isLabelPunct(char32_t c, bool numeric)
{
    if (c == U'.' || c == kFullStop || c == kIdeographicComma || c == U')' || c == kFullParen)
        return true;
    return !numeric && (c == U':' || c == kFullColon);
}

bool isAnswerDelimiter(char32_t c)
{
    return c == U',' || c == U';' || c == kFullComma || c == kFullSemicolon || c == kIdeographicComma ||
           processing::isUnicodeWhitespace(c);
}

bool isLetterId(const std::string& id)
{
    return id.size() == 1 && id[0] >= 'A' && id[0] <= 'Z';
}

bool isNumberId(const std::string& id)
{
    return !id.empty() && std::all_of(id.begin(), id.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string joinMessages(const std::vector<std::string>& messages)
{
    std::string out;
    for (const auto& m : messages)
    {
        if (!out.empty())
            out += "; ";
        out += m;
    }
    return out;
}

} // namespace

std::optional<ChoiceOption> ChoiceFieldParser::parseOptionLine(std::string_view line)
{
    const std::u32string s = utf8ToUtf32(processing::trim(line));
    if (s.empty())
        return std::nullopt;

    std::size_t i = 0;
    bool numeric = false;
    if (isAsciiUpper(s[0]) || isAsciiLower(s[0]))
    {
        i = 1;
    }
    else if (isDigit(s[0]))
    {
        numeric = true;
        while (i < s.size() && i < 3 && isDigit(s[i]))
            ++i;
    }
    else
    {
        return std::nullopt;
    }

    const std::u32string label = s.substr(0, i);
    std::size_t spaces = 0;
    while (i < s.size() && processing::isUnicodeWhitespace(s[i]))
    {
        ++i;
        ++spaces;
    }

    if (i < s.size() && isLabelPunct(s[i], numeric))
    {
        ++i;
    }
    else if (numeric || !isAsciiUpper(label[0]) || spaces == 0)
    {
        // Bare "A content" is only accepted for upper-case letters
        return std::nullopt;
    }

    ChoiceOption option;
    option.label = utf32ToUtf8(label);
    option.id = option.label;
    std::transform(option.id.begin(), option.id.end(), option.id.begin(),
                   [](char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; });
    option.content = processing::trim(utf32ToUtf8(s.substr(i)));
    return option;
}

std::vector<std::string> ChoiceFieldParser::sequenceWarnings(const std::vector<ChoiceOption>& options)
{
    std::vector<std::string> warnings;
    if (options.empty())
        return warnings;

    const bool letters = std::all_of(options.begin(), options.end(), [](const ChoiceOption& o) { return isLetterId(o.id); });
    const bool numbers = std::all_of(options.begin(), options.end(), [](const ChoiceOption& o) { return isNumberId(o.id); });

    if (letters)
    {
        std::vector<char> ids;
        for (const auto& o : options)
            ids.push_back(o.id[0]);
        std::sort(ids.begin(), ids.end());
        for (std::size_t k = 0; k < ids.size(); ++k)
        {
            if (ids[k] != static_cast<char>('A' + k))
            {
                warnings.push_back(std::string("Option labels are not contiguous: expected ") +
                                   static_cast<char>('A' + k) + ", found " + ids[k]);
                break;
            }
        }
    }
    else if (numbers)
    {
        std::vector<long> ids;
        for (const auto& o : options)
            ids.push_back(std::stol(o.id));
        std::sort(ids.begin(), ids.end());
        for (std::size_t k = 1; k < ids.size(); ++k)
        {
            if (ids[k] != ids[0] + static_cast<long>(k))
            {
                warnings.push_back("Option numbers are not contiguous: expected " +
                                   std::to_string(ids[0] + static_cast<long>(k)) + ", found " + std::to_string(ids[k]));
                break;
            }
        }
    }
    else
    {
        warnings.emplace_back("Option labels mix letters and numbers; use A, B, C... or 1, 2, 3...");
    }
    return warnings;
}

OptionsParseResult ChoiceFieldParser::parseOptions(std::string_view text)
{
    OptionsParseResult result;
    if (processing::trim(text).empty())
    {
        result.error = "Options are empty";
        return result;
    }

    std::set<std::string> seen;
    for (const auto& raw : processing::splitLines(text))
    {
        const std::string line = processing::trim(raw);
        if (line.empty())
            continue;

        auto option = parseOptionLine(line);
        if (!option)
        {
            result.warnings.push_back("Not an option line: \"" + line + "\"");
            continue;
        }
        if (option->content.empty())
        {
            result.warnings.push_back("Option " + option->id + " has no content");
            continue;
        }
        if (!seen.insert(option->id).second)
        {
            result.warnings.push_back("Option " + option->id + " appears more than once");
            continue;
        }
        result.options.push_back(std::move(*option));
    }

    if (result.options.empty())
    {
        result.error = "No option lines found";
        return result;
    }

    auto sequence = sequenceWarnings(result.options);
    result.warnings.insert(result.warnings.end(), sequence.begin(), sequence.end());
    result.success = true;
    return result;
}

CorrectAnswerResult ChoiceFieldParser::parseCorrectAnswer(std::string_view text, const std::vector<ChoiceOption>& options)
{
    CorrectAnswerResult result;
    const std::u32string s = utf8ToUtf32(processing::trim(text));
    if (s.empty())
    {
        result.errors.emplace_back("Correct answer is empty");
        return result;
    }

    std::vector<std::u32string> parts;
    std::u32string current;
    for (char32_t c : s)
    {
        if (isAnswerDelimiter(c))
        {
            if (!current.empty())
                parts.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current += c;
        }
    }
    if (!current.empty())
        parts.push_back(std::move(current));

    auto known = [&](const std::string& id) {
        return std::any_of(options.begin(), options.end(), [&](const ChoiceOption& o) { return o.id == id; });
    };
    auto accept = [&](const std::string& id) {
        if (!known(id))
        {
            result.errors.push_back("Option " + id + " does not exist");
            return;
        }
        if (std::find(result.correctIds.begin(), result.correctIds.end(), id) == result.correctIds.end())
            result.correctIds.push_back(id);
    };

    for (auto part : parts)
    {
        while (!part.empty() && isLabelPunct(part.back(), false))
            part.pop_back();
        if (part.empty())
            continue;

        const bool all_digits = std::all_of(part.begin(), part.end(), isDigit);
        const bool all_letters = std::all_of(part.begin(), part.end(),
                                             [](char32_t c) { return isAsciiUpper(c) || isAsciiLower(c); });
        if (all_digits)
        {
            accept(utf32ToUtf8(part));
        }
        else if (all_letters)
        {
            // "ABD" is three labels
            for (char32_t c : part)
            {
                const char letter = static_cast<char>(isAsciiLower(c) ? c - U'a' + U'A' : c);
                accept(std::string(1, letter));
            }
        }
        else
        {
            result.errors.push_back("Cannot read answer label \"" + utf32ToUtf8(part) + "\"");
        }
    }

    result.isMultiple = result.correctIds.size() > 1;
    result.success = result.errors.empty() && !result.correctIds.empty();
    if (result.correctIds.empty() && result.errors.empty())
        result.errors.emplace_back("No answer labels found");
    return result;
}

std::vector<ChoiceOption> ChoiceFieldParser::markCorrectAnswers(std::vector<ChoiceOption> options,
                                                                const std::vector<std::string>& correct_ids)
{
    for (auto& option : options)
        option.isCorrect = std::find(correct_ids.begin(), correct_ids.end(), option.id) != correct_ids.end();
    return options;
}

ChoiceParseResult ChoiceFieldParser::parseChoiceQuestion(std::string_view options_text, std::string_view correct_text)
{
    ChoiceParseResult result;
    OptionsParseResult parsed = parseOptions(options_text);
    result.warnings = std::move(parsed.warnings);
    if (!parsed.success)
    {
        result.error = parsed.error;
        return result;
    }

    CorrectAnswerResult correct = parseCorrectAnswer(correct_text, parsed.options);
    result.options = std::move(parsed.options);
    if (!correct.success)
    {
        result.error = joinMessages(correct.errors);
        return result;
    }

    result.options = markCorrectAnswers(std::move(result.options), correct.correctIds);
    result.correctAnswers = std::move(correct.correctIds);
    result.isMultiple = correct.isMultiple;
    result.success = true;
    return result;
}

} // namespace choice
