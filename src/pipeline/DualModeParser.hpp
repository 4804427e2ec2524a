#pragma once

#include "../processing/FormatPreprocessor.hpp"
#include "../processing/TextProcessingTypes.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pipeline
{

class RecognitionPipeline;

enum class ParseMode
{
    Lenient, // Raw or imported notes: cascade loose patterns, preserve on failure
    Strict   // Already templated notes: the bound template must match
};

enum class ParseState
{
    Idle,
    Parsing,
    Succeeded,
    PreservedFallback, // Lenient only
    Failed             // Strict only
};

struct ParseError
{
    text_processing::IssueKind kind = text_processing::IssueKind::PatternMismatch;
    std::string message;
    std::string field; // Set for RequiredFieldEmpty and FieldMappingGap
};

struct ParseAttempt
{
    std::string strategy;
    std::string pattern;
    bool success = false;
    text_processing::FieldMap extractedFields;
    std::optional<std::string> error;
    std::chrono::system_clock::time_point timestamp;
};

// Everything needed to rebuild a card by hand once automatic recognition gave up
struct PreservedContent
{
    std::string originalContent;
    std::vector<ParseAttempt> attempts;
    std::string fallbackTemplateId;
    std::vector<std::string> repairSuggestions;
};

struct ParseResult
{
    bool success = false;
    text_processing::FieldMap fields; // Always carries "notes"
    double confidence = 0.0;
    std::string mode;                 // Loose pattern, pipeline strategy or "strict-template"
    ParseState state = ParseState::Idle;
    std::optional<ParseError> error;
    std::optional<PreservedContent> preserved;
    std::vector<std::string> warnings;
};

struct DualModeSettings
{
    std::size_t maxRegexInputBytes = 16384;
};

/**
 * @brief Lenient/strict policy wrapper around recognition.
 *
 * Lenient runs the attached recognition pipeline (when there is one) and then the
 * loose primary/fallback/simple cascade; if nothing matches it returns
 * success=false with a PreservedContent record. Strict only ever tries the bound
 * template and reports the first violated requirement. Neither mode retries and
 * neither mode throws.
 */
class DualModeParser
{
public:
    static constexpr const char* kClozeTemplate = "basic-cloze";
    static constexpr const char* kBasicTemplate = "basic-qa";
    static constexpr const char* kEmergencyTemplate = "emergency-basic";
    static constexpr std::size_t kLongNoteCodepoints = 500;

    explicit DualModeParser(const RecognitionPipeline* pipeline = nullptr, DualModeSettings settings = {});

    [[nodiscard]] ParseResult parse(const std::string& content, ParseMode mode,
                                    const text_processing::CardTemplate* tmpl = nullptr) const;

    [[nodiscard]] ParseResult parseLenient(const std::string& content,
                                           const text_processing::CardTemplate* tmpl = nullptr) const;
    [[nodiscard]] ParseResult parseStrict(const std::string& content, const text_processing::CardTemplate& tmpl) const;

    [[nodiscard]] static std::string selectFallbackTemplate(const std::string& content);
    [[nodiscard]] static std::vector<std::string> repairSuggestions(const std::string& content);
    [[nodiscard]] static bool containsClozeMarker(const std::string& content);

private:
    const RecognitionPipeline* pipeline_;
    DualModeSettings settings_;
    processing::FormatPreprocessor preprocessor_;
};

[[nodiscard]] const char* toString(ParseMode mode);
[[nodiscard]] const char* toString(ParseState state);

} // namespace pipeline
