#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace choice
{

struct ChoiceOption
{
    std::string id;      // Upper-case label, used to reference the option
    std::string label;   // Label as written
    std::string content;
    bool isCorrect = false;
};

struct OptionsParseResult
{
    bool success = false;
    std::vector<ChoiceOption> options;
    std::vector<std::string> warnings;
    std::optional<std::string> error;
};

struct CorrectAnswerResult
{
    bool success = false;
    std::vector<std::string> correctIds;
    bool isMultiple = false;
    std::vector<std::string> errors; // One entry per label that could not be resolved
};

struct ChoiceParseResult
{
    bool success = false;
    std::vector<ChoiceOption> options;
    std::vector<std::string> correctAnswers;
    bool isMultiple = false;
    std::optional<std::string> error;
    std::vector<std::string> warnings;
};

// Option-line and correct-answer syntax for multiple-choice fields.
//   A. text   A) text   A: text   A、text   A text   1. text   1) text
// Full-width punctuation is accepted wherever the half-width form is.
class ChoiceFieldParser
{
public:
    [[nodiscard]] static OptionsParseResult parseOptions(std::string_view text);
    [[nodiscard]] static CorrectAnswerResult parseCorrectAnswer(std::string_view text,
                                                                const std::vector<ChoiceOption>& options);
    [[nodiscard]] static ChoiceParseResult parseChoiceQuestion(std::string_view options_text,
                                                               std::string_view correct_text);

    [[nodiscard]] static std::optional<ChoiceOption> parseOptionLine(std::string_view line);
    [[nodiscard]] static std::vector<ChoiceOption> markCorrectAnswers(std::vector<ChoiceOption> options,
                                                                      const std::vector<std::string>& correct_ids);

    // Empty when the labels form A,B,C... or n,n+1,...; otherwise describes the break
    [[nodiscard]] static std::vector<std::string> sequenceWarnings(const std::vector<ChoiceOption>& options);
};

} // namespace choice
