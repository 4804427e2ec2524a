#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace processing
{

struct PreprocessOptions
{
    bool normalizeHeadings = true;              // "##Title" -> "## Title"
    bool normalizePunctuation = true;           // ： ； （ ） ＃ ＊ － ． and full-width digits/letters
    bool normalizeSentencePunctuation = false;  // ？ ！ ， 。 、
    bool standardizeQuotes = true;              // “ ” ‘ ’ „ ‚ -> " '
    bool normalizeWhitespace = true;            // NBSP, ideographic space, tabs, zero-width spaces
    bool normalizeLineBreaks = true;            // CRLF/CR -> LF, at most two blank lines
    bool removeExtraSpaces = true;              // trailing spaces, runs of inner spaces
    bool preserveCode = true;
    bool preserveLinks = true;
    bool preserveMath = true;
};

enum class SpanKind
{
    FencedCode,
    InlineCode,
    Image,
    Link,
    MathBlock,
    InlineMath
};

struct PreservedSpan
{
    SpanKind kind;
    std::string original;    // Verbatim text of the span
    std::string placeholder; // Token that stands in for it in masked text
    std::size_t offset = 0;  // Byte offset in the text at the moment it was protected
};

struct PreprocessStatistics
{
    std::size_t originalLength = 0;        // code points
    std::size_t processedLength = 0;       // code points
    std::size_t linesChanged = 0;
    std::size_t charactersNormalized = 0;  // mapped or dropped code points
};

struct PreprocessResult
{
    std::string processed;  // Normalized text with protected spans restored
    std::string masked;     // Normalized text with placeholders still in place
    std::string original;
    std::vector<std::string> transformationsApplied;
    std::vector<PreservedSpan> preservedSpans;
    PreprocessStatistics statistics;
};

/**
 * @brief Normalizes loosely formatted note text before recognition.
 *
 * Code, links, images and math are swapped for placeholder tokens first, so the
 * heading, punctuation and whitespace passes never touch them, and are restored
 * verbatim afterwards. Never fails: a protection pass that cannot run is skipped.
 */
class FormatPreprocessor
{
public:
    [[nodiscard]] PreprocessResult normalize(const std::string& text, const PreprocessOptions& options = {}) const;

    // Line endings, whitespace and structural punctuation only; no span protection
    [[nodiscard]] std::string quickNormalize(const std::string& text) const;

    [[nodiscard]] bool needsPreprocessing(const std::string& text) const;

    // Replaces placeholders with the spans they stand for, innermost last
    [[nodiscard]] static std::string restore(const std::string& text, const std::vector<PreservedSpan>& spans);

    [[nodiscard]] static const char* spanKindName(SpanKind kind);
};

} // namespace processing
