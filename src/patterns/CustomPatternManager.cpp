#include "CustomPatternManager.hpp"

#include "../processing/Diagnostics.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace patterns
{

namespace
{

json toJson(const std::string& id, const CustomPatternConfig& config)
{
    json tests = json::array();
    for (const auto& tc : config.testCases)
    {
        tests.push_back({ { "name", tc.name },
                          { "input", tc.input },
                          { "expectedFields", tc.expectedFields },
                          { "shouldMatch", tc.shouldMatch } });
    }
    return json{ { "id", id },
                 { "name", config.name },
                 { "description", config.description },
                 { "regex", config.regex },
                 { "flags", config.flags },
                 { "fieldMappings", config.fieldMappings },
                 { "priority", config.priority },
                 { "category", config.category },
                 { "examples", config.examples },
                 { "testCases", tests } };
}

// Throws json::exception on a wrongly typed member
CustomPatternConfig fromJson(const json& record)
{
    CustomPatternConfig config;
    config.name = record.value("name", std::string());
    config.description = record.value("description", std::string());
    config.regex = record.value("regex", std::string());
    config.flags = record.value("flags", std::string());
    config.priority = record.value("priority", 50);
    config.category = record.value("category", std::string("custom"));
    if (record.contains("fieldMappings"))
        config.fieldMappings = record.at("fieldMappings").get<std::map<std::string, int>>();
    if (record.contains("examples"))
        config.examples = record.at("examples").get<std::vector<std::string>>();
    if (record.contains("testCases"))
    {
        for (const auto& tc : record.at("testCases"))
        {
            PatternTestCase test;
            test.name = tc.value("name", std::string());
            test.input = tc.value("input", std::string());
            test.shouldMatch = tc.value("shouldMatch", true);
            if (tc.contains("expectedFields"))
                test.expectedFields = tc.at("expectedFields").get<text_processing::FieldMap>();
            config.testCases.push_back(std::move(test));
        }
    }
    return config;
}

std::string joinMessages(const std::vector<std::string>& messages)
{
    std::string out;
    for (const auto& m : messages)
    {
        if (!out.empty())
            out += "; ";
        out += m;
    }
    return out;
}

bool containsExpected(const text_processing::FieldMap& actual, const text_processing::FieldMap& expected)
{
    for (const auto& [field, value] : expected)
    {
        auto it = actual.find(field);
        if (it == actual.end() || it->second != value)
            return false;
    }
    return true;
}

text_processing::FieldMap extractFields(const std::smatch& m, const std::map<std::string, int>& mapping)
{
    text_processing::FieldMap fields;
    for (const auto& [field, group] : mapping)
    {
        const auto index = static_cast<std::size_t>(group);
        fields[field] = index < m.size() && m[index].matched ? processing::trim(m[index].str()) : "";
    }
    return fields;
}

} // namespace

CustomPatternManager::CustomPatternManager(PatternRegistry& registry)
    : registry_(registry)
{
}

bool CustomPatternManager::isValidFieldName(const std::string& name)
{
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name.front())) || name.front() == '_'))
        return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

ConfigValidation CustomPatternManager::validateConfig(const CustomPatternConfig& config) const
{
    ConfigValidation v;
    std::vector<std::string> errors;
    std::optional<ValidationErrorKind> kind;
    auto fail = [&](ValidationErrorKind k, std::string message) {
        if (!kind)
            kind = k;
        errors.push_back(std::move(message));
    };

    if (processing::trim(config.name).empty())
        fail(ValidationErrorKind::EmptyField, "Pattern name is empty");
    if (processing::trim(config.regex).empty())
        fail(ValidationErrorKind::EmptyField, "Regex is empty");
    if (config.fieldMappings.empty())
        fail(ValidationErrorKind::EmptyField, "Field mapping is empty");

    std::set<int> groups;
    std::vector<std::string> duplicates;
    for (const auto& [field, group] : config.fieldMappings)
    {
        if (!isValidFieldName(field))
            fail(ValidationErrorKind::EmptyField, "Invalid field name '" + field + "'");
        if (!groups.insert(group).second)
            duplicates.push_back(std::to_string(group));
    }
    if (!duplicates.empty())
        fail(ValidationErrorKind::DuplicateGroup, "Field mapping repeats capture group(s): " + joinMessages(duplicates));

    if (!processing::trim(config.regex).empty())
    {
        try
        {
            const std::size_t count = captureGroupCount(config.regex, config.flags);
            for (const auto& [field, group] : config.fieldMappings)
            {
                if (group < 0 || static_cast<std::size_t>(group) > count)
                {
                    fail(ValidationErrorKind::FieldMappingGap, "Field '" + field + "' refers to group " +
                                                                   std::to_string(group) + " but the regex has " +
                                                                   std::to_string(count));
                }
            }
        }
        catch (const std::regex_error& ex)
        {
            fail(ValidationErrorKind::InvalidSyntax, std::string("Regex syntax error: ") + ex.what());
        }
    }

    if (config.priority < 0 || config.priority > 100)
        v.warnings.emplace_back("Priority should be between 0 and 100");
    if (!categoryFromString(config.category))
        v.warnings.push_back("Unknown category '" + config.category + "', stored as custom");
    if (config.examples.empty())
        v.suggestions.emplace_back("Add examples so the pattern is easier to test and understand");
    if (config.testCases.empty())
        v.suggestions.emplace_back("Add test cases to verify the pattern");

    if (kind)
        v.error = ValidationError{ *kind, joinMessages(errors), {}, v.warnings, v.suggestions };
    return v;
}

ContentPattern CustomPatternManager::toContentPattern(const std::string& id, const CustomPatternConfig& config)
{
    ContentPattern p;
    p.id = id;
    p.name = config.name;
    p.description = config.description;
    p.regex = config.regex;
    p.flags = config.flags;
    p.fieldMapping = config.fieldMappings;
    p.priority = config.priority;
    p.category = categoryFromString(config.category).value_or(PatternCategory::Custom);
    p.examples = config.examples;
    return p;
}

std::string CustomPatternManager::generateId(const std::string& name)
{
    std::string slug;
    for (char c : processing::toLowerAscii(name))
    {
        const bool alnum = std::isalnum(static_cast<unsigned char>(c)) != 0;
        if (alnum)
            slug += c;
        else if (!slug.empty() && slug.back() != '_')
            slug += '_';
    }
    while (!slug.empty() && slug.back() == '_')
        slug.pop_back();
    if (slug.empty())
        slug = "pattern";

    std::string id;
    do
    {
        id = "custom_" + slug + "_" + std::to_string(next_id_++);
    } while (registry_.contains(id) || configs_.count(id) > 0);
    return id;
}

RegistrationResult CustomPatternManager::registerConfig(const std::string& id, const CustomPatternConfig& config,
                                                        bool replace)
{
    ConfigValidation validation = validateConfig(config);
    if (!validation.isValid())
        return RegistrationResult::failure(std::move(*validation.error));

    ContentPattern pattern = toContentPattern(id, config);
    RegistrationResult result = replace ? registry_.updatePattern(id, std::move(pattern))
                                        : registry_.registerCustomPattern(std::move(pattern));
    if (!result.succeeded)
        return result;

    result.warnings.insert(result.warnings.begin(), validation.warnings.begin(), validation.warnings.end());
    configs_[id] = config;
    PLOG_INFO_(processing::Diagnostics::kLogInstance)
        << "[CustomPatternManager] " << (replace ? "updated" : "created") << " id=" << id;
    return result;
}

RegistrationResult CustomPatternManager::createPattern(const CustomPatternConfig& config)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return registerConfig(generateId(config.name), config, false);
}

RegistrationResult CustomPatternManager::updatePattern(const std::string& id, const CustomPatternConfig& config)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (configs_.count(id) == 0)
    {
        return RegistrationResult::failure(ValidationError{ ValidationErrorKind::NotFound,
                                                            "No custom pattern with id '" + id + "'", {}, {}, {} });
    }
    return registerConfig(id, config, true);
}

bool CustomPatternManager::deletePattern(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(id);
    if (it == configs_.end())
        return false;
    configs_.erase(it);
    const bool removed = registry_.removePattern(id);
    PLOG_INFO_(processing::Diagnostics::kLogInstance) << "[CustomPatternManager] deleted id=" << id;
    return removed;
}

std::optional<CustomPatternConfig> CustomPatternManager::getPattern(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(id);
    if (it == configs_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::pair<std::string, CustomPatternConfig>> CustomPatternManager::listPatterns() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return { configs_.begin(), configs_.end() };
}

PatternTestResult CustomPatternManager::testCustomPattern(const CustomPatternConfig& config,
                                                          const std::string& input) const
{
    PatternTestResult result;
    ConfigValidation validation = validateConfig(config);
    if (!validation.isValid())
    {
        result.error = validation.error->message;
        return result;
    }

    std::vector<std::string> warnings;
    if (auto unsafe = registry_.screen(toContentPattern("test", config), warnings))
    {
        result.error = unsafe->message;
        return result;
    }

    using namespace std::chrono;
    const auto start = steady_clock::now();
    try
    {
        const CompiledRegex regex = compileRegex(config.regex, config.flags);
        std::smatch m;
        result.matched = std::regex_search(input, m, *regex);
        if (result.matched)
            result.fields = extractFields(m, config.fieldMappings);
    }
    catch (const std::regex_error& ex)
    {
        result.error = std::string("Regex engine error: ") + ex.what();
    }
    result.executionTime = duration_cast<microseconds>(steady_clock::now() - start);
    return result;
}

TestRunSummary CustomPatternManager::runTestCases(const std::string& id) const
{
    TestRunSummary summary;
    std::optional<CustomPatternConfig> config = getPattern(id);
    CompiledRegex regex = registry_.compile(id);
    if (!config || !regex)
        return summary;

    using namespace std::chrono;
    microseconds total{ 0 };
    for (const auto& tc : config->testCases)
    {
        TestCaseResult r;
        r.testCase = tc;
        const auto start = steady_clock::now();
        try
        {
            std::smatch m;
            const bool matched = std::regex_search(tc.input, m, *regex);
            if (matched)
                r.actualFields = extractFields(m, config->fieldMappings);
            r.passed = matched == tc.shouldMatch && (!matched || containsExpected(r.actualFields, tc.expectedFields));
        }
        catch (const std::regex_error& ex)
        {
            r.error = ex.what();
        }
        r.executionTime = duration_cast<microseconds>(steady_clock::now() - start);
        total += r.executionTime;
        if (r.passed)
            ++summary.passed;
        else
            ++summary.failed;
        summary.results.push_back(std::move(r));
    }
    if (!summary.results.empty())
        summary.averageExecutionTime = total / static_cast<long>(summary.results.size());
    summary.success = summary.failed == 0;
    return summary;
}

std::string CustomPatternManager::exportJson() const
{
    json out = json::array();
    for (const auto& [id, config] : listPatterns())
        out.push_back(toJson(id, config));
    return out.dump(2);
}

ImportResult CustomPatternManager::importJson(const std::string& text, bool overwrite)
{
    ImportResult result;
    json data;
    try
    {
        data = json::parse(text);
    }
    catch (const json::parse_error& ex)
    {
        result.errors.push_back(std::string("JSON parse error: ") + ex.what());
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Import, "Custom pattern import failed", ex.what());
        return result;
    }
    if (!data.is_array())
    {
        result.errors.emplace_back("Import data must be a JSON array of patterns");
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : data)
    {
        ImportRecordResult rec;
        try
        {
            if (!record.is_object())
                throw std::invalid_argument("record is not an object");

            CustomPatternConfig config = fromJson(record);
            rec.name = config.name;
            const std::string wanted = record.value("id", std::string());
            const bool exists = !wanted.empty() && registry_.contains(wanted);

            RegistrationResult reg;
            if (exists && !overwrite)
            {
                rec.id = wanted;
                rec.errors.push_back("Pattern '" + wanted + "' already exists");
            }
            else if (exists && configs_.count(wanted) == 0)
            {
                rec.id = wanted;
                rec.errors.push_back("Pattern '" + wanted + "' is built in and cannot be replaced");
            }
            else
            {
                rec.id = wanted.empty() ? generateId(config.name) : wanted;
                reg = registerConfig(rec.id, config, exists);
                if (reg.succeeded)
                    rec.succeeded = true;
                else if (reg.error)
                    rec.errors.push_back(reg.error->message);
            }
        }
        catch (const std::exception& ex)
        {
            rec.errors.push_back(std::string("Malformed record: ") + ex.what());
        }

        if (rec.succeeded)
            ++result.imported;
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Import, "Custom pattern not imported",
                                                (rec.id.empty() ? rec.name : rec.id) + ": " + joinMessages(rec.errors));
        result.records.push_back(std::move(rec));
    }

    result.success = result.imported > 0 || data.empty();
    PLOG_INFO_(processing::Diagnostics::kLogInstance)
        << "[CustomPatternManager] import records=" << result.records.size() << " imported=" << result.imported;
    return result;
}

ImportResult CustomPatternManager::importFile(const std::string& path, bool overwrite)
{
    std::ifstream in(path);
    if (!in)
    {
        ImportResult result;
        result.errors.push_back("Cannot open " + path);
        return result;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return importJson(ss.str(), overwrite);
}

} // namespace patterns
