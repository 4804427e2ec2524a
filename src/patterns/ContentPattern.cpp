#include "ContentPattern.hpp"

#include <array>
#include <utility>

namespace patterns
{

namespace
{

constexpr std::array<std::pair<PatternCategory, const char*>, 9> kCategoryNames{ {
    { PatternCategory::Heading, "heading" },
    { PatternCategory::Bold, "bold" },
    { PatternCategory::QaPair, "qa-pair" },
    { PatternCategory::List, "list" },
    { PatternCategory::MultipleChoice, "multiple-choice" },
    { PatternCategory::Cloze, "cloze" },
    { PatternCategory::Definition, "definition" },
    { PatternCategory::FreeForm, "free-form" },
    { PatternCategory::Custom, "custom" },
} };

} // namespace

const char* toString(PatternCategory category)
{
    for (const auto& [value, name] : kCategoryNames)
    {
        if (value == category)
            return name;
    }
    return "custom";
}

std::optional<PatternCategory> categoryFromString(const std::string& name)
{
    for (const auto& [value, label] : kCategoryNames)
    {
        if (name == label)
            return value;
    }
    return std::nullopt;
}

const char* toString(ValidationErrorKind kind)
{
    switch (kind)
    {
    case ValidationErrorKind::EmptyField:
        return "EmptyField";
    case ValidationErrorKind::InvalidSyntax:
        return "InvalidSyntax";
    case ValidationErrorKind::FieldMappingGap:
        return "FieldMappingGap";
    case ValidationErrorKind::DuplicateGroup:
        return "DuplicateGroup";
    case ValidationErrorKind::DuplicateId:
        return "DuplicateId";
    case ValidationErrorKind::UnsafePattern:
        return "UnsafePattern";
    case ValidationErrorKind::NotFound:
        return "NotFound";
    }
    return "InvalidSyntax";
}

} // namespace patterns
