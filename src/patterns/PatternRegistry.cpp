#include "PatternRegistry.hpp"

#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <set>

#include <plog/Log.h>

namespace patterns
{

namespace
{

bool hasId(const RegisteredPattern& entry, const std::string& id)
{
    return entry.pattern->id == id;
}

} // namespace

PatternRegistry::PatternRegistry(SafetyOptions safety)
    : validator_(std::move(safety))
{
}

std::optional<ValidationError> PatternRegistry::validateStructure(ContentPattern& pattern, CompiledRegex& compiled)
{
    if (pattern.id.empty())
        return ValidationError{ ValidationErrorKind::EmptyField, "Pattern id is empty", {}, {}, {} };
    if (pattern.regex.empty())
        return ValidationError{ ValidationErrorKind::EmptyField, "Pattern '" + pattern.id + "' has an empty regex",
                                {}, {}, {} };
    if (pattern.fieldMapping.empty())
        return ValidationError{ ValidationErrorKind::EmptyField,
                                "Pattern '" + pattern.id + "' maps no fields", {}, {},
                                { "Map at least one field, e.g. question=1" } };

    try
    {
        compiled = compileRegex(pattern.regex, pattern.flags);
    }
    catch (const std::regex_error& ex)
    {
        return ValidationError{ ValidationErrorKind::InvalidSyntax,
                                "Pattern '" + pattern.id + "' does not compile: " + ex.what(), {}, {}, {} };
    }

    pattern.captureGroups = compiled->mark_count();
    std::set<int> seen;
    for (const auto& [field, group] : pattern.fieldMapping)
    {
        if (group < 0 || static_cast<std::size_t>(group) > pattern.captureGroups)
        {
            return ValidationError{ ValidationErrorKind::FieldMappingGap,
                                    "Field '" + field + "' refers to group " + std::to_string(group) +
                                        " but the regex has " + std::to_string(pattern.captureGroups) +
                                        " capture group(s)",
                                    {}, {}, {} };
        }
        if (!seen.insert(group).second)
        {
            return ValidationError{ ValidationErrorKind::DuplicateGroup,
                                    "Capture group " + std::to_string(group) + " is mapped to more than one field",
                                    {}, {}, {} };
        }
    }
    return std::nullopt;
}

std::optional<ValidationError> PatternRegistry::screen(const ContentPattern& pattern,
                                                       std::vector<std::string>& warnings) const
{
    const PatternSafetyValidator validator(safetyOptions());
    SafetyReport report = validator.validate(pattern.regex, pattern.flags);
    if (report.isValid)
    {
        warnings = std::move(report.warnings);
        return std::nullopt;
    }

    ValidationError error{ ValidationErrorKind::UnsafePattern,
                           report.error.value_or("Pattern failed the safety screen"),
                           std::move(report.criticalIssues),
                           std::move(report.warnings),
                           std::move(report.suggestions) };
    if (error.message.rfind("Syntax error", 0) == 0)
        error.kind = ValidationErrorKind::InvalidSyntax;
    return error;
}

RegistrationResult PatternRegistry::reject(const std::string& id, ValidationError error)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::PatternRegistry,
        "Pattern rejected",
        (id.empty() ? std::string("<no id>") : id) + ": " + toString(error.kind) + ": " + error.message);
    return RegistrationResult::failure(std::move(error));
}

RegistrationResult PatternRegistry::add(ContentPattern pattern, bool custom)
{
    CompiledRegex compiled;
    if (auto error = validateStructure(pattern, compiled))
        return reject(pattern.id, std::move(*error));

    std::vector<std::string> warnings;
    if (custom)
    {
        if (auto error = screen(pattern, warnings))
            return reject(pattern.id, std::move(*error));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const RegisteredPattern& e) { return hasId(e, pattern.id); });
    if (it != entries_.end())
    {
        return reject(pattern.id, ValidationError{ ValidationErrorKind::DuplicateId,
                                                   "Pattern id '" + pattern.id + "' is already registered",
                                                   {}, {}, {} });
    }

    const std::string id = pattern.id;
    RegisteredPattern entry;
    entry.pattern = std::make_shared<const ContentPattern>(std::move(pattern));
    entry.regex = std::move(compiled);
    entry.sequence = next_sequence_++;
    entry.custom = custom;
    entries_.push_back(std::move(entry));

    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
            << "[PatternRegistry] registered id=" << id << " custom=" << (custom ? "true" : "false");
    }
    return RegistrationResult::success(id, std::move(warnings));
}

RegistrationResult PatternRegistry::registerPattern(ContentPattern pattern)
{
    return add(std::move(pattern), false);
}

RegistrationResult PatternRegistry::registerCustomPattern(ContentPattern pattern)
{
    return add(std::move(pattern), true);
}

RegistrationResult PatternRegistry::updatePattern(const std::string& id, ContentPattern pattern)
{
    pattern.id = id;
    bool custom = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const RegisteredPattern& e) { return hasId(e, id); });
        if (it == entries_.end())
        {
            return RegistrationResult::failure(ValidationError{ ValidationErrorKind::NotFound,
                                                                "No pattern with id '" + id + "'", {}, {}, {} });
        }
        custom = it->custom;
    }

    CompiledRegex compiled;
    if (auto error = validateStructure(pattern, compiled))
        return reject(id, std::move(*error));

    std::vector<std::string> warnings;
    if (custom)
    {
        if (auto error = screen(pattern, warnings))
            return reject(id, std::move(*error));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const RegisteredPattern& e) { return hasId(e, id); });
    if (it == entries_.end())
    {
        // Removed while we were validating
        return RegistrationResult::failure(ValidationError{ ValidationErrorKind::NotFound,
                                                            "No pattern with id '" + id + "'", {}, {}, {} });
    }
    it->pattern = std::make_shared<const ContentPattern>(std::move(pattern));
    it->regex = std::move(compiled);
    return RegistrationResult::success(id, std::move(warnings));
}

bool PatternRegistry::removePattern(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const RegisteredPattern& e) { return hasId(e, id); });
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    return true;
}

CompiledRegex PatternRegistry::compile(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_)
    {
        if (hasId(e, id))
            return e.regex;
    }
    return nullptr;
}

std::vector<RegisteredPattern> PatternRegistry::snapshot() const
{
    std::vector<RegisteredPattern> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = entries_;
    }
    std::sort(copy.begin(), copy.end(), [](const RegisteredPattern& a, const RegisteredPattern& b) {
        if (a.pattern->priority != b.pattern->priority)
            return a.pattern->priority > b.pattern->priority;
        return a.sequence < b.sequence;
    });
    return copy;
}

std::vector<ContentPattern> PatternRegistry::all() const
{
    std::vector<ContentPattern> out;
    for (const auto& e : snapshot())
        out.push_back(*e.pattern);
    return out;
}

std::optional<RegisteredPattern> PatternRegistry::entry(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_)
    {
        if (hasId(e, id))
            return e;
    }
    return std::nullopt;
}

std::optional<ContentPattern> PatternRegistry::find(const std::string& id) const
{
    if (auto e = entry(id))
        return *e->pattern;
    return std::nullopt;
}

bool PatternRegistry::contains(const std::string& id) const
{
    return entry(id).has_value();
}

bool PatternRegistry::isCustom(const std::string& id) const
{
    auto e = entry(id);
    return e && e->custom;
}

std::size_t PatternRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void PatternRegistry::setSafetyOptions(SafetyOptions options)
{
    std::lock_guard<std::mutex> lock(mutex_);
    validator_ = PatternSafetyValidator(std::move(options));
}

SafetyOptions PatternRegistry::safetyOptions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return validator_.options();
}

} // namespace patterns
