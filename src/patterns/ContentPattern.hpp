#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace patterns
{

enum class PatternCategory
{
    Heading,
    Bold,
    QaPair,
    List,
    MultipleChoice,
    Cloze,
    Definition,
    FreeForm,
    Custom
};

// Declarative recognition rule. Regex syntax is ECMAScript as implemented by std::regex.
struct ContentPattern
{
    std::string id;
    std::string name;
    std::string description;
    std::string regex;
    std::string flags;                       // "i" case-insensitive, "m" multiline
    std::map<std::string, int> fieldMapping; // field name -> capture group (0 = whole match)
    int priority = 50;
    double baseConfidence = 0.8;
    PatternCategory category = PatternCategory::Custom;
    std::vector<std::string> examples;
    std::size_t captureGroups = 0;           // Filled in by the registry from the compiled regex
};

enum class ValidationErrorKind
{
    EmptyField,
    InvalidSyntax,
    FieldMappingGap,
    DuplicateGroup,
    DuplicateId,
    UnsafePattern,
    NotFound
};

struct ValidationError
{
    ValidationErrorKind kind;
    std::string message;
    std::vector<std::string> criticalIssues;
    std::vector<std::string> warnings;
    std::vector<std::string> suggestions;
};

struct RegistrationResult
{
    bool succeeded = false;
    std::string id;
    std::optional<ValidationError> error;
    std::vector<std::string> warnings;

    static RegistrationResult success(std::string pattern_id, std::vector<std::string> notes = {})
    {
        RegistrationResult r;
        r.succeeded = true;
        r.id = std::move(pattern_id);
        r.warnings = std::move(notes);
        return r;
    }

    static RegistrationResult failure(ValidationError err)
    {
        RegistrationResult r;
        r.succeeded = false;
        r.error = std::move(err);
        return r;
    }
};

[[nodiscard]] const char* toString(PatternCategory category);
[[nodiscard]] std::optional<PatternCategory> categoryFromString(const std::string& name);
[[nodiscard]] const char* toString(ValidationErrorKind kind);

} // namespace patterns
