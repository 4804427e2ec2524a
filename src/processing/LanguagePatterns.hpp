#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

enum class Language
{
    Chinese,
    English,
    Japanese,
    Korean
};

// Marker and keyword tables for one language. Labels are stored without their colon;
// both ':' and the full-width '：' are accepted after them.
struct LanguagePatternSet
{
    Language language;
    std::string code; // "zh", "en", "ja", "ko"
    std::vector<std::string> questionLabels;
    std::vector<std::string> answerLabels;
    std::vector<std::string> separators;
    std::vector<std::string> questionWords;
    std::vector<std::string> instructionWords; // "请", "Explain", ... at the start of a prompt
    std::vector<std::string> questionPhrases;  // "是什么", "とは", ... anywhere in a prompt
    std::vector<std::string> punctuation;
};

struct LabelMatch
{
    std::string label;   // Label as listed in the table
    std::string content; // Text after the label and colon, trimmed
    Language language;
};

struct SmartSplit
{
    std::string question;
    std::string answer;
    double confidence = 0.0;
    Language language = Language::English;
};

class LanguagePatternSets
{
public:
    LanguagePatternSets();

    [[nodiscard]] const LanguagePatternSet& get(Language language) const;
    [[nodiscard]] const std::vector<LanguagePatternSet>& all() const noexcept { return sets_; }

    // Markers x2, question words x1, punctuation x0.5, plus script evidence. Defaults to English.
    [[nodiscard]] Language detectLanguage(std::string_view text) const;
    [[nodiscard]] std::map<Language, double> languageScores(std::string_view text) const;

    // Question mark, leading question or instruction word, question label or question phrase, any language
    [[nodiscard]] bool looksLikeQuestion(std::string_view text) const;

    // "问题：...", "Q: ...", "**Question:** ..." at the start of a line
    [[nodiscard]] std::optional<LabelMatch> matchQuestionLabel(std::string_view line) const;
    [[nodiscard]] std::optional<LabelMatch> matchAnswerLabel(std::string_view line) const;

    // Union over all languages, longest first
    [[nodiscard]] std::vector<std::string> allQuestionLabels() const;
    [[nodiscard]] std::vector<std::string> allAnswerLabels() const;

    // Keyword split: separator or answer-label line, then first question-like line, then first line/rest
    [[nodiscard]] SmartSplit smartSplit(std::string_view content) const;

    [[nodiscard]] static const char* code(Language language);
    [[nodiscard]] static std::optional<Language> fromCode(std::string_view code);

private:
    [[nodiscard]] std::optional<LabelMatch> matchLabel(std::string_view line, bool question) const;

    std::vector<LanguagePatternSet> sets_;
};

} // namespace processing
