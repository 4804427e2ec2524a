#pragma once

#include "ContentPattern.hpp"
#include "PatternRegistry.hpp"
#include "../processing/TextProcessingTypes.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace patterns
{

struct PatternTestCase
{
    std::string name;
    std::string input;
    text_processing::FieldMap expectedFields; // Subset the match must produce
    bool shouldMatch = true;
};

// User-facing definition of a custom pattern, as stored and exchanged as JSON
struct CustomPatternConfig
{
    std::string name;
    std::string description;
    std::string regex;
    std::string flags;
    std::map<std::string, int> fieldMappings;
    int priority = 50;
    std::string category = "custom";
    std::vector<std::string> examples;
    std::vector<PatternTestCase> testCases;
};

struct ConfigValidation
{
    std::optional<ValidationError> error;
    std::vector<std::string> warnings;
    std::vector<std::string> suggestions;

    [[nodiscard]] bool isValid() const { return !error.has_value(); }
};

struct PatternTestResult
{
    bool matched = false;
    text_processing::FieldMap fields;
    std::chrono::microseconds executionTime{ 0 };
    std::optional<std::string> error;
};

struct TestCaseResult
{
    PatternTestCase testCase;
    bool passed = false;
    text_processing::FieldMap actualFields;
    std::optional<std::string> error;
    std::chrono::microseconds executionTime{ 0 };
};

struct TestRunSummary
{
    bool success = false;
    std::vector<TestCaseResult> results;
    std::size_t passed = 0;
    std::size_t failed = 0;
    std::chrono::microseconds averageExecutionTime{ 0 };
};

struct ImportRecordResult
{
    std::string id;
    std::string name;
    bool succeeded = false;
    std::vector<std::string> errors;
};

struct ImportResult
{
    bool success = false;
    std::size_t imported = 0;
    std::vector<ImportRecordResult> records;
    std::vector<std::string> errors; // Batch-level problems (malformed JSON, not an array)
};

/**
 * @brief Create/update/delete user-defined patterns on top of a PatternRegistry.
 *
 * Every create, update and import goes through validateConfig() and then the
 * registry's custom registration path, which runs the ReDoS screen. The manager
 * keeps the user-facing config (test cases, category name) next to the registry
 * entry so it can be listed and exported again.
 */
class CustomPatternManager
{
public:
    explicit CustomPatternManager(PatternRegistry& registry);

    RegistrationResult createPattern(const CustomPatternConfig& config);
    RegistrationResult updatePattern(const std::string& id, const CustomPatternConfig& config);
    bool deletePattern(const std::string& id);

    [[nodiscard]] std::optional<CustomPatternConfig> getPattern(const std::string& id) const;
    [[nodiscard]] std::vector<std::pair<std::string, CustomPatternConfig>> listPatterns() const;

    [[nodiscard]] ConfigValidation validateConfig(const CustomPatternConfig& config) const;

    // Screens and runs a config against one input without registering it
    [[nodiscard]] PatternTestResult testCustomPattern(const CustomPatternConfig& config,
                                                      const std::string& input) const;
    [[nodiscard]] TestRunSummary runTestCases(const std::string& id) const;

    [[nodiscard]] std::string exportJson() const;

    // Each record is validated on its own; malformed JSON changes nothing
    ImportResult importJson(const std::string& text, bool overwrite = false);
    ImportResult importFile(const std::string& path, bool overwrite = false);

    [[nodiscard]] static bool isValidFieldName(const std::string& name);

private:
    [[nodiscard]] std::string generateId(const std::string& name);
    [[nodiscard]] static ContentPattern toContentPattern(const std::string& id, const CustomPatternConfig& config);
    RegistrationResult registerConfig(const std::string& id, const CustomPatternConfig& config, bool replace);

    PatternRegistry& registry_;
    mutable std::mutex mutex_;
    std::map<std::string, CustomPatternConfig> configs_;
    std::uint64_t next_id_ = 1;
};

} // namespace patterns
