#include "DualModeParser.hpp"
#include "RecognitionPipeline.hpp"
#include "Strategies.hpp"

#include "../patterns/RegexCompiler.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <plog/Log.h>

namespace pipeline
{

using processing::Diagnostics;
using processing::TraceLine;
using text_processing::CardTemplate;
using text_processing::FieldMap;
using text_processing::IssueKind;

namespace
{

struct LoosePattern
{
    const char* name;
    const char* source;
    double baseConfidence;
    std::regex regex;
};

const std::vector<LoosePattern>& loosePatterns()
{
    static const std::vector<LoosePattern> patterns = [] {
        std::vector<LoosePattern> list;
        auto add = [&](const char* name, const char* source, double base) {
            list.push_back({ name, source, base, std::regex(source, std::regex::ECMAScript) });
        };
        // Question and answer split by an explicit divider line
        add("primary", R"re(^([\s\S]+?)\n[ \t]*---div---[ \t]*\n+([\s\S]+)$)re", 0.9);
        // First line, a blank line, then the rest
        add("fallback", R"re(^([^\n]+)\n[ \t]*\n+([\s\S]+)$)re", 0.7);
        add("simple", R"re(^([^\n]+)(?:\n+([\s\S]*))?$)re", 0.5);
        return list;
    }();
    return patterns;
}

double looseConfidence(double base, const FieldMap& fields)
{
    const auto length = [&](const char* name) {
        auto it = fields.find(name);
        return it == fields.end() ? std::size_t{ 0 } : processing::codepointCount(it->second);
    };
    const std::size_t question = length("question");
    const std::size_t answer = length("answer");

    double confidence = base;
    if (question > 0 && answer > 0)
        confidence += 0.1;
    if (question > 5)
        confidence += 0.05;
    if (answer > 10)
        confidence += 0.05;
    return std::min(1.0, confidence);
}

std::vector<std::string> qualityWarnings(const FieldMap& fields, const std::string& content)
{
    std::vector<std::string> warnings;
    const auto length = [&](const char* a, const char* b) {
        auto it = fields.find(a);
        if (it == fields.end())
            it = fields.find(b);
        return it == fields.end() ? std::size_t{ 0 } : processing::codepointCount(it->second);
    };
    if (length("question", "front") < 3)
        warnings.emplace_back("Question is very short; consider expanding it");
    if (length("answer", "back") < 5)
        warnings.emplace_back("Answer is very short; consider expanding it");
    if (content.find("TODO") != std::string::npos)
        warnings.emplace_back("Note contains a TODO marker");
    return warnings;
}

ParseResult failStrict(const std::string& original, IssueKind kind, std::string message, std::string field = {})
{
    PLOG_WARNING_(Diagnostics::kLogInstance) << TraceLine("DualModeParser")
                                                    .add("mode", "strict")
                                                    .add("status", "failed")
                                                    .add("kind", text_processing::toString(kind))
                                                    .add("reason", message)
                                                    .str();
    ParseResult result;
    result.state = ParseState::Failed;
    result.mode = "strict-template";
    result.fields[text_processing::kNotesField] = original;
    result.error = ParseError{ kind, std::move(message), std::move(field) };
    return result;
}

} // namespace

DualModeParser::DualModeParser(const RecognitionPipeline* pipeline, DualModeSettings settings)
    : pipeline_(pipeline)
    , settings_(settings)
{
}

ParseResult DualModeParser::parse(const std::string& content, ParseMode mode, const CardTemplate* tmpl) const
{
    if (mode == ParseMode::Strict)
    {
        if (!tmpl)
            return failStrict(content, IssueKind::PatternMismatch, "Strict parsing needs a bound template");
        return parseStrict(content, *tmpl);
    }
    return parseLenient(content, tmpl);
}

ParseResult DualModeParser::parseLenient(const std::string& content, const CardTemplate* tmpl) const
{
    PROFILE_SCOPE_CUSTOM("DualModeParser::parseLenient");
    std::vector<ParseAttempt> attempts;

    if (pipeline_)
    {
        const auto recognized = pipeline_->parse(content, tmpl);
        ParseAttempt attempt;
        attempt.strategy = "pipeline";
        attempt.pattern = recognized.strategy;
        attempt.timestamp = std::chrono::system_clock::now();
        const bool accepted = recognized.success && recognized.strategy != RecognitionPipeline::kProtectiveStrategy;
        attempt.success = accepted;
        if (accepted)
        {
            attempt.extractedFields = recognized.fields;
            ParseResult result;
            result.success = true;
            result.fields = recognized.fields;
            result.confidence = recognized.confidence;
            result.mode = "pipeline:" + recognized.strategy;
            result.state = ParseState::Succeeded;
            result.warnings = recognized.warnings;
            return result;
        }
        attempt.error = "Recognition fell back to the first-line split";
        attempts.push_back(std::move(attempt));
    }

    const std::string text = processing::trim(preprocessor_.quickNormalize(content));
    for (const auto& loose : loosePatterns())
    {
        ParseAttempt attempt;
        attempt.strategy = std::string("lenient-") + loose.name;
        attempt.pattern = loose.source;
        attempt.timestamp = std::chrono::system_clock::now();

        if (text.size() > settings_.maxRegexInputBytes)
        {
            attempt.error = "Note exceeds the regex input limit";
            attempts.push_back(std::move(attempt));
            continue;
        }

        std::smatch match;
        bool matched = false;
        try
        {
            matched = std::regex_search(text, match, loose.regex);
        }
        catch (const std::regex_error& e)
        {
            attempt.error = std::string("Regex error: ") + e.what();
            attempts.push_back(std::move(attempt));
            continue;
        }

        const std::string question = matched ? processing::trim(match[1].str()) : std::string();
        if (question.empty())
        {
            attempt.error = "Pattern did not match";
            attempts.push_back(std::move(attempt));
            continue;
        }

        FieldMap fields{ { "question", question }, { "answer", processing::trim(match[2].str()) } };
        const double confidence = looseConfidence(loose.baseConfidence, fields);
        std::vector<std::string> warnings = qualityWarnings(fields, content);
        fields = alignToTemplate(std::move(fields), tmpl);

        attempt.success = true;
        attempt.extractedFields = fields;

        ParseResult result;
        result.success = true;
        result.fields = std::move(fields);
        result.fields[text_processing::kNotesField] = content;
        result.confidence = confidence;
        result.mode = loose.name;
        result.state = ParseState::Succeeded;
        result.warnings = std::move(warnings);

        if (Diagnostics::IsVerbose())
        {
            PLOG_INFO_(Diagnostics::kLogInstance) << TraceLine("DualModeParser")
                                                         .add("mode", "lenient")
                                                         .add("pattern", loose.name)
                                                         .add("status", "ok")
                                                         .add("confidence", confidence)
                                                         .str();
        }
        return result;
    }

    PLOG_WARNING_(Diagnostics::kLogInstance) << TraceLine("DualModeParser")
                                                    .add("mode", "lenient")
                                                    .add("status", "preserved")
                                                    .add("attempts", static_cast<double>(attempts.size()))
                                                    .preview("input", content)
                                                    .str();

    PreservedContent preserved;
    preserved.originalContent = content;
    preserved.attempts = std::move(attempts);
    preserved.fallbackTemplateId = selectFallbackTemplate(content);
    preserved.repairSuggestions = repairSuggestions(content);

    ParseResult result;
    result.state = ParseState::PreservedFallback;
    result.fields[text_processing::kNotesField] = content;
    result.error = ParseError{ IssueKind::PatternMismatch, "Could not recognise the note; the text has been preserved", {} };
    result.preserved = std::move(preserved);
    return result;
}

ParseResult DualModeParser::parseStrict(const std::string& content, const CardTemplate& tmpl) const
{
    PROFILE_SCOPE_CUSTOM("DualModeParser::parseStrict");

    patterns::CompiledRegex regex;
    try
    {
        regex = patterns::compileRegex(tmpl.regex, tmpl.flags);
    }
    catch (const std::regex_error& e)
    {
        return failStrict(content, IssueKind::InvalidPattern,
                          "Template '" + tmpl.id + "' has an invalid regex: " + e.what());
    }

    for (const auto& [field, group] : tmpl.fieldMapping)
    {
        if (group < 0 || static_cast<std::size_t>(group) > regex->mark_count())
        {
            return failStrict(content, IssueKind::FieldMappingGap,
                              "Field '" + field + "' maps to capture group " + std::to_string(group) +
                                  ", which the template regex does not have",
                              field);
        }
    }

    if (content.size() > settings_.maxRegexInputBytes)
        return failStrict(content, IssueKind::PatternMismatch, "Note exceeds the regex input limit");

    std::smatch match;
    try
    {
        if (!std::regex_search(content, match, *regex))
            return failStrict(content, IssueKind::PatternMismatch,
                              "Note does not match template '" + tmpl.id + "'");
    }
    catch (const std::regex_error& e)
    {
        return failStrict(content, IssueKind::InvalidPattern,
                          "Template '" + tmpl.id + "' failed while matching: " + e.what());
    }

    FieldMap fields = extractTemplateFields(match, tmpl);
    const auto missing = emptyRequiredFields(fields, tmpl);
    if (!missing.empty())
    {
        return failStrict(content, IssueKind::RequiredFieldEmpty, "Required field '" + missing.front() + "' is empty",
                          missing.front());
    }

    ParseResult result;
    result.success = true;
    result.fields = std::move(fields);
    result.fields[text_processing::kNotesField] = content;
    result.confidence = 1.0;
    result.mode = "strict-template";
    result.state = ParseState::Succeeded;
    return result;
}

bool DualModeParser::containsClozeMarker(const std::string& content)
{
    std::size_t pos = content.find("{{c");
    while (pos != std::string::npos)
    {
        std::size_t i = pos + 3;
        const std::size_t digits = i;
        while (i < content.size() && std::isdigit(static_cast<unsigned char>(content[i])))
            ++i;
        if (i > digits && content.compare(i, 2, "::") == 0)
            return true;
        pos = content.find("{{c", pos + 1);
    }
    return false;
}

std::string DualModeParser::selectFallbackTemplate(const std::string& content)
{
    if (containsClozeMarker(content))
        return kClozeTemplate;
    if (processing::codepointCount(content) > kLongNoteCodepoints)
        return kBasicTemplate;
    return kEmergencyTemplate;
}

std::vector<std::string> DualModeParser::repairSuggestions(const std::string& content)
{
    std::vector<std::string> suggestions;
    if (processing::trim(content).empty())
    {
        suggestions.emplace_back("The note is empty; write a question and an answer");
        return suggestions;
    }
    if (content.find('\n') != std::string::npos && content.find("\n\n") == std::string::npos)
        suggestions.emplace_back("Use a blank line between fields");
    if (content.find("---div---") == std::string::npos)
        suggestions.emplace_back("Separate fields with a ---div--- line");
    if (content.rfind("## ", 0) != 0 && content.find("\n## ") == std::string::npos)
        suggestions.emplace_back("Start the question with a '## ' heading");
    return suggestions;
}

const char* toString(ParseMode mode)
{
    return mode == ParseMode::Strict ? "strict" : "lenient";
}

const char* toString(ParseState state)
{
    switch (state)
    {
    case ParseState::Idle:
        return "idle";
    case ParseState::Parsing:
        return "parsing";
    case ParseState::Succeeded:
        return "succeeded";
    case ParseState::PreservedFallback:
        return "preserved-fallback";
    case ParseState::Failed:
        return "failed";
    }
    return "idle";
}

} // namespace pipeline
