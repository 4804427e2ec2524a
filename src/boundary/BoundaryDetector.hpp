#pragma once

#include "../processing/LanguagePatterns.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boundary
{

enum class SectionKind
{
    Heading,
    Content,
    Separator
};

// Half-open line range [begin, end) into the input
struct LineSpan
{
    std::size_t begin = 0;
    std::size_t end = 0;
};

struct Section
{
    SectionKind kind = SectionKind::Content;
    int level = 0;    // 1-6 for headings, 0 otherwise
    std::string text; // Raw line text
    LineSpan span;
};

struct ParsedContent
{
    std::string question;
    std::string answer;
    std::string preamble; // Non-blank text before the question
    std::vector<Section> sections;
    std::optional<std::size_t> questionSection;
    std::optional<LineSpan> answerSpan;
    double confidence = 0.0;
    std::vector<std::string> warnings;
};

struct BoundaryOptions
{
    bool preserveFormatting = true; // Keep sub-heading markup inside the answer
    bool stripAnswerMarker = true;  // Drop a leading "A:" / "答案:" from the answer
};

struct CompletenessReport
{
    double coverage = 0.0;
    bool complete = false;
    std::optional<std::string> warning;
};

/**
 * @brief Structural question/answer split that does not rely on regex templates.
 *
 * The note is segmented line by line into headings, separators and content.
 * The question is the first heading, else the first labelled, bold or
 * question-like line. The answer greedily takes every following line until a
 * heading of equal or shallower level, a separator, a new question label or
 * the end of the note.
 */
class BoundaryDetector
{
public:
    static constexpr double kCompletenessThreshold = 0.9;

    explicit BoundaryDetector(const processing::LanguagePatternSets& languages, BoundaryOptions options = {});

    [[nodiscard]] ParsedContent analyze(std::string_view content) const;

    // One section per line; spans are contiguous and cover every line
    [[nodiscard]] std::vector<Section> segment(std::string_view content) const;

    // Whitespace-insensitive share of the note (structural markup excluded) present in question + answer
    [[nodiscard]] CompletenessReport validateCompleteness(std::string_view original, const ParsedContent& parsed) const;

    [[nodiscard]] const BoundaryOptions& options() const noexcept { return options_; }

    [[nodiscard]] static std::optional<int> headingLevel(std::string_view line);
    [[nodiscard]] static std::string headingText(std::string_view line);
    [[nodiscard]] static bool isSeparator(std::string_view line);

private:
    [[nodiscard]] std::string structuralText(std::string_view text) const;
    [[nodiscard]] double scoreConfidence(const ParsedContent& parsed, bool marked_question,
                                         bool has_structure) const;

    const processing::LanguagePatternSets& languages_;
    BoundaryOptions options_;
};

[[nodiscard]] const char* toString(SectionKind kind);

} // namespace boundary
