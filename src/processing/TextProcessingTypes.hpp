#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace text_processing {

// Core data contracts shared by the recognition components.
// Everything here is a plain value type owned by the caller.

// Extracted card fields keyed by field name (question, answer, options, notes, ...)
using FieldMap = std::map<std::string, std::string>;

// Field that always carries the untouched note text on results leaving the pipeline
inline constexpr const char* kNotesField = "notes";

enum class ParseMethod
{
    Regex,       // A compiled pattern produced the fields
    Intelligent, // Structural analysis or heuristics produced the fields
    Hybrid       // Regex result cross-checked by structural analysis
};

enum class IssueKind
{
    PatternMismatch,   // No registered pattern matched
    LowConfidence,     // Matched, but below the acceptance threshold
    InvalidPattern,    // Regex syntax error or safety rejection
    FieldMappingGap,   // Field refers to a capture group the regex does not have
    TruncationRisk,    // Recovered text covers less than 90% of the note
    RequiredFieldEmpty // Strict mode: a required field matched empty
};

struct ParseIssue {
    IssueKind kind;
    std::string message;
};

// Template binding supplied by external template storage
struct CardTemplate {
    std::string id;
    std::string name;
    std::string regex;                        // ECMAScript syntax
    std::string flags;                        // "i" and "m" are honoured
    std::map<std::string, int> fieldMapping;  // field name -> capture group (0 = whole match)
    std::vector<std::string> requiredFields;  // empty: question/answer/front/back where mapped
};

// One row per strategy the pipeline executed
struct StrategyTrace {
    std::string strategy;
    bool succeeded = false;
    double confidence = 0.0;
    std::chrono::microseconds duration{ 0 };
    std::optional<std::string> reason;
};

// Result of the recognition pipeline. originalContent is set on every path.
struct EnhancedParseResult {
    bool success = false;
    FieldMap fields;
    double confidence = 0.0;
    ParseMethod method = ParseMethod::Intelligent;
    std::vector<std::string> warnings;
    std::string originalContent;

    std::string strategy;                     // Strategy that produced the fields
    std::vector<ParseIssue> issues;
    std::vector<StrategyTrace> attempts;
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                              // The actual result payload
    bool succeeded = true;                   // Whether the stage completed successfully
    std::optional<std::string> error;        // Error message if stage failed
    std::chrono::microseconds duration{ 0 }; // How long the stage took to execute
    std::string stage_name;                  // Name of the stage (for logging)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

[[nodiscard]] inline const char* toString(ParseMethod method)
{
    switch (method)
    {
    case ParseMethod::Regex:
        return "regex";
    case ParseMethod::Intelligent:
        return "intelligent";
    case ParseMethod::Hybrid:
        return "hybrid";
    }
    return "intelligent";
}

[[nodiscard]] inline const char* toString(IssueKind kind)
{
    switch (kind)
    {
    case IssueKind::PatternMismatch:
        return "PatternMismatch";
    case IssueKind::LowConfidence:
        return "LowConfidence";
    case IssueKind::InvalidPattern:
        return "InvalidPattern";
    case IssueKind::FieldMappingGap:
        return "FieldMappingGap";
    case IssueKind::TruncationRisk:
        return "TruncationRisk";
    case IssueKind::RequiredFieldEmpty:
        return "RequiredFieldEmpty";
    }
    return "PatternMismatch";
}

} // namespace text_processing
