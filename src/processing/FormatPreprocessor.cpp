#include "FormatPreprocessor.hpp"
#include "Diagnostics.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <optional>
#include <regex>

#include <plog/Log.h>

namespace processing
{

namespace
{

struct ProtectionRule
{
    SpanKind kind;
    char tag;
    std::regex pattern;
};

// Order matters: fenced blocks before inline code, images before links
const std::vector<ProtectionRule>& protectionRules()
{
    static const std::vector<ProtectionRule> rules = [] {
        std::vector<ProtectionRule> r;
        r.push_back({ SpanKind::FencedCode, 'F', std::regex("```[\\s\\S]*?```") });
        r.push_back({ SpanKind::MathBlock, 'M', std::regex("\\$\\$[\\s\\S]+?\\$\\$") });
        r.push_back({ SpanKind::InlineCode, 'C', std::regex("`[^`\\n]+`") });
        r.push_back({ SpanKind::Image, 'I', std::regex("!\\[[^\\]\\n]*\\]\\([^)\\n]*\\)") });
        r.push_back({ SpanKind::Link, 'W', std::regex("\\[\\[[^\\]\\n]+\\]\\]") });
        r.push_back({ SpanKind::Link, 'L', std::regex("\\[[^\\]\\n]*\\]\\([^)\\n]*\\)") });
        r.push_back({ SpanKind::Link, 'U', std::regex("<https?://[^>\\s]+>") });
        r.push_back({ SpanKind::InlineMath, 'N', std::regex("\\$[^$\\n]+\\$") });
        return r;
    }();
    return rules;
}

bool isEnabled(SpanKind kind, const PreprocessOptions& options)
{
    switch (kind)
    {
    case SpanKind::FencedCode:
    case SpanKind::InlineCode:
        return options.preserveCode;
    case SpanKind::Image:
    case SpanKind::Link:
        return options.preserveLinks;
    case SpanKind::MathBlock:
    case SpanKind::InlineMath:
        return options.preserveMath;
    }
    return false;
}

std::string makePlaceholder(char tag, std::size_t index)
{
    return utf32ToUtf8(std::u32string(1, MARKER_START)) + tag + std::to_string(index) +
           utf32ToUtf8(std::u32string(1, MARKER_END));
}

std::string protect(const std::string& text, const ProtectionRule& rule, std::vector<PreservedSpan>& spans)
{
    std::string out;
    out.reserve(text.size());

    std::size_t last = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), rule.pattern); it != std::sregex_iterator(); ++it)
    {
        const auto& m = *it;
        const auto pos = static_cast<std::size_t>(m.position(0));
        out.append(text, last, pos - last);

        PreservedSpan span{ rule.kind, m.str(0), makePlaceholder(rule.tag, spans.size()), pos };
        out += span.placeholder;
        spans.push_back(std::move(span));
        last = pos + static_cast<std::size_t>(m.length(0));
    }
    out.append(text, last, std::string::npos);
    return out;
}

// Full-width forms that carry structure (labels, headings, list bullets, numbering)
std::optional<char32_t> mapStructural(char32_t cp)
{
    switch (cp)
    {
    case 0xFF1A: return U':';
    case 0xFF1B: return U';';
    case 0xFF08: return U'(';
    case 0xFF09: return U')';
    case 0xFF0E: return U'.';
    case 0xFF03: return U'#';
    case 0xFF0A: return U'*';
    case 0xFF0D: return U'-';
    case 0xFF3B: return U'[';
    case 0xFF3D: return U']';
    case 0xFF5B: return U'{';
    case 0xFF5D: return U'}';
    default:
        break;
    }
    if (cp >= 0xFF10 && cp <= 0xFF19)
        return static_cast<char32_t>(U'0' + (cp - 0xFF10));
    if (cp >= 0xFF21 && cp <= 0xFF3A)
        return static_cast<char32_t>(U'A' + (cp - 0xFF21));
    if (cp >= 0xFF41 && cp <= 0xFF5A)
        return static_cast<char32_t>(U'a' + (cp - 0xFF41));
    return std::nullopt;
}

std::optional<char32_t> mapSentence(char32_t cp)
{
    switch (cp)
    {
    case 0xFF1F: return U'?';
    case 0xFF01: return U'!';
    case 0xFF0C: return U',';
    case 0x3002: return U'.';
    case 0x3001: return U',';
    default:
        return std::nullopt;
    }
}

std::optional<char32_t> mapQuote(char32_t cp)
{
    switch (cp)
    {
    case 0x201C:
    case 0x201D:
    case 0x201E:
    case 0x201F:
    case 0xFF02:
        return U'"';
    case 0x2018:
    case 0x2019:
    case 0x201A:
    case 0x201B:
    case 0xFF07:
        return U'\'';
    default:
        return std::nullopt;
    }
}

bool isMappedSpace(char32_t cp)
{
    return cp == 0x00A0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000;
}

bool isZeroWidth(char32_t cp) { return cp == 0x200B || cp == 0xFEFF; }

bool hasNonAscii(const std::string& text)
{
    return std::any_of(text.begin(), text.end(), [](char c) { return static_cast<unsigned char>(c) >= 0x80; });
}

// Applies a per-code-point mapping; std::nullopt keeps the code point, U'\0' drops it
template <typename Mapper>
std::string mapCodepoints(const std::string& text, Mapper&& mapper, std::size_t& mapped_count)
{
    if (!hasNonAscii(text))
        return text;

    std::u32string out;
    const std::u32string cps = utf8ToUtf32(text);
    out.reserve(cps.size());
    for (char32_t cp : cps)
    {
        if (auto replacement = mapper(cp))
        {
            ++mapped_count;
            if (*replacement != U'\0')
                out.push_back(*replacement);
        }
        else
        {
            out.push_back(cp);
        }
    }
    return utf32ToUtf8(out);
}

// "#text" and "##  text " both become "<hashes> text"
std::optional<std::string> normalizeHeadingLine(const std::string& line)
{
    std::size_t hashes = 0;
    while (hashes < line.size() && line[hashes] == '#')
        ++hashes;
    if (hashes == 0 || hashes > 6 || hashes == line.size())
        return std::nullopt;

    std::string rest = trim(std::string_view(line).substr(hashes));
    if (rest.empty() || rest.front() == '#')
        return std::nullopt;

    std::string normalized = line.substr(0, hashes) + " " + rest;
    if (normalized == line)
        return std::nullopt;
    return normalized;
}

std::string tidyLine(const std::string& line)
{
    std::size_t indent = 0;
    while (indent < line.size() && line[indent] == ' ')
        ++indent;

    std::string out = line.substr(0, indent);
    bool previous_space = false;
    for (std::size_t i = indent; i < line.size(); ++i)
    {
        const char c = line[i];
        if (c == ' ')
        {
            if (!previous_space)
                out.push_back(c);
            previous_space = true;
        }
        else
        {
            out.push_back(c);
            previous_space = false;
        }
    }
    while (out.size() > indent && out.back() == ' ')
        out.pop_back();
    if (out.size() == indent)
        out.clear();
    return out;
}

template <typename LineFn>
std::string mapLines(const std::string& text, LineFn&& fn)
{
    auto lines = splitLines(text);
    for (auto& line : lines)
        line = fn(line);
    return joinLines(lines, 0, lines.size());
}

std::size_t countChangedLines(const std::string& before, const std::string& after)
{
    const auto a = splitLines(before);
    const auto b = splitLines(after);
    const std::size_t common = std::min(a.size(), b.size());
    std::size_t changed = std::max(a.size(), b.size()) - common;
    for (std::size_t i = 0; i < common; ++i)
    {
        if (a[i] != b[i])
            ++changed;
    }
    return changed;
}

} // namespace

PreprocessResult FormatPreprocessor::normalize(const std::string& text, const PreprocessOptions& options) const
{
    PROFILE_SCOPE_FUNCTION();

    PreprocessResult result;
    result.original = text;
    result.statistics.originalLength = codepointCount(text);

    std::string working = text;
    auto step = [&](const char* name, std::string next) {
        if (next != working)
        {
            result.transformationsApplied.emplace_back(name);
            working = std::move(next);
        }
    };

    for (const auto& rule : protectionRules())
    {
        if (!isEnabled(rule.kind, options))
            continue;
        try
        {
            working = protect(working, rule, result.preservedSpans);
        }
        catch (const std::regex_error& ex)
        {
            // Span stays unprotected; the remaining passes still run
            PLOG_WARNING_(Diagnostics::kLogInstance)
                << "[FormatPreprocessor] protection=" << spanKindName(rule.kind) << " skipped: " << ex.what();
        }
    }
    if (!result.preservedSpans.empty())
        result.transformationsApplied.emplace_back("protect-spans");

    std::size_t mapped = 0;

    if (options.normalizeLineBreaks)
        step("line-breaks", collapse_newlines(normalize_line_endings(working), 3));

    if (options.normalizeWhitespace)
    {
        std::string spaced = mapCodepoints(
            working,
            [](char32_t cp) -> std::optional<char32_t> {
                if (isMappedSpace(cp))
                    return U' ';
                if (isZeroWidth(cp))
                    return U'\0';
                return std::nullopt;
            },
            mapped);
        step("whitespace", expand_tabs(spaced, 4));
    }

    if (options.normalizePunctuation || options.normalizeSentencePunctuation)
    {
        step("punctuation", mapCodepoints(
                                working,
                                [&options](char32_t cp) -> std::optional<char32_t> {
                                    if (options.normalizePunctuation)
                                    {
                                        if (auto m = mapStructural(cp))
                                            return m;
                                    }
                                    if (options.normalizeSentencePunctuation)
                                        return mapSentence(cp);
                                    return std::nullopt;
                                },
                                mapped));
    }

    if (options.standardizeQuotes)
        step("quotes", mapCodepoints(working, mapQuote, mapped));

    if (options.normalizeHeadings)
    {
        step("headings", mapLines(working, [](const std::string& line) {
                 return normalizeHeadingLine(line).value_or(line);
             }));
    }

    if (options.removeExtraSpaces)
        step("extra-spaces", mapLines(working, tidyLine));

    result.masked = working;
    result.processed = restore(working, result.preservedSpans);
    result.statistics.processedLength = codepointCount(result.processed);
    result.statistics.charactersNormalized = mapped;
    result.statistics.linesChanged = countChangedLines(text, result.processed);

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[FormatPreprocessor] spans=" << result.preservedSpans.size()
            << " steps=" << result.transformationsApplied.size()
            << " output=" << Diagnostics::Preview(result.processed);
    }
    return result;
}

std::string FormatPreprocessor::quickNormalize(const std::string& text) const
{
    std::size_t mapped = 0;
    std::string out = collapse_newlines(normalize_line_endings(text), 3);
    out = mapCodepoints(
        out,
        [](char32_t cp) -> std::optional<char32_t> {
            if (isMappedSpace(cp))
                return U' ';
            if (isZeroWidth(cp))
                return U'\0';
            return mapStructural(cp);
        },
        mapped);
    return expand_tabs(out, 4);
}

bool FormatPreprocessor::needsPreprocessing(const std::string& text) const
{
    if (text.find('\r') != std::string::npos || text.find('\t') != std::string::npos ||
        text.find("\n\n\n\n") != std::string::npos)
        return true;

    if (hasNonAscii(text))
    {
        for (char32_t cp : utf8ToUtf32(text))
        {
            if (isMappedSpace(cp) || isZeroWidth(cp) || mapStructural(cp) || mapQuote(cp))
                return true;
        }
    }

    for (const auto& line : splitLines(text))
    {
        if (normalizeHeadingLine(line))
            return true;
    }
    return false;
}

std::string FormatPreprocessor::restore(const std::string& text, const std::vector<PreservedSpan>& spans)
{
    std::string out = text;
    // Later spans may enclose placeholders of earlier ones
    for (auto it = spans.rbegin(); it != spans.rend(); ++it)
    {
        std::size_t pos = 0;
        while ((pos = out.find(it->placeholder, pos)) != std::string::npos)
        {
            out.replace(pos, it->placeholder.size(), it->original);
            pos += it->original.size();
        }
    }
    return out;
}

const char* FormatPreprocessor::spanKindName(SpanKind kind)
{
    switch (kind)
    {
    case SpanKind::FencedCode:
        return "fenced-code";
    case SpanKind::InlineCode:
        return "inline-code";
    case SpanKind::Image:
        return "image";
    case SpanKind::Link:
        return "link";
    case SpanKind::MathBlock:
        return "math-block";
    case SpanKind::InlineMath:
        return "inline-math";
    }
    return "span";
}

} // namespace processing
