#include "Strategies.hpp"

#include "../processing/MarkerFuzzyMatcher.hpp"
#include "../processing/TextUtils.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

namespace pipeline
{

using text_processing::CardTemplate;
using text_processing::FieldMap;
using text_processing::IssueKind;
using text_processing::ParseMethod;

namespace
{

bool hasText(const FieldMap& fields, const char* name)
{
    auto it = fields.find(name);
    return it != fields.end() && !processing::trim(it->second).empty();
}

struct TemplateRun
{
    std::optional<StrategyOutcome> failure;
    FieldMap fields;
    double coverage = 0.0;
};

TemplateRun runTemplate(patterns::RegexCache& cache, const std::string& source, const std::string& flags,
                        const CardTemplate& tmpl, const StrategyContext& ctx)
{
    TemplateRun run;
    if (ctx.content.size() > ctx.maxRegexInputBytes)
    {
        run.failure = StrategyOutcome::failed("Note is larger than the regex input limit", IssueKind::LowConfidence);
        return run;
    }

    patterns::CompiledRegex regex;
    try
    {
        regex = cache.get(source, flags);
    }
    catch (const std::regex_error& ex)
    {
        run.failure = StrategyOutcome::failed(std::string("Template regex does not compile: ") + ex.what(),
                                              IssueKind::InvalidPattern);
        return run;
    }

    for (const auto& [field, group] : tmpl.fieldMapping)
    {
        if (group < 0 || static_cast<std::size_t>(group) > regex->mark_count())
        {
            run.failure = StrategyOutcome::failed("Field '" + field + "' has no capture group " + std::to_string(group),
                                                  IssueKind::FieldMappingGap);
            return run;
        }
    }

    std::smatch m;
    if (!std::regex_search(ctx.content, m, *regex))
    {
        run.failure = StrategyOutcome::failed("Template regex did not match", IssueKind::PatternMismatch);
        return run;
    }
    run.fields = extractTemplateFields(m, tmpl);
    run.coverage = patterns::PatternMatcher::coverage(m[0].str(), ctx.content);
    return run;
}

StrategyOutcome fromMatch(const patterns::MatchCandidate& best, const CardTemplate* tmpl)
{
    FieldMap fields = alignToTemplate(best.fields, tmpl);
    const bool complete = !fields.empty() && std::all_of(fields.begin(), fields.end(), [&](const auto& kv) {
        return kv.first == "correct" || !processing::trim(kv.second).empty();
    });

    StrategyOutcome outcome = complete ? StrategyOutcome::ok(std::move(fields), best.confidence, ParseMethod::Regex)
                                       : StrategyOutcome::partial(std::move(fields), best.confidence, ParseMethod::Regex,
                                                                  { "Pattern '" + best.pattern->id +
                                                                    "' matched with empty fields" });
    outcome.patternId = best.pattern->id;
    return outcome;
}

constexpr const char* kAnswerStoppedMessage =
    "Answer stopped at a following question label; the rest of the note is outside the card";

// A question label line inside the answer starts the next card. Returns true when the answer was cut there.
bool stopAtNextQuestion(patterns::MatchCandidate& candidate, const processing::LanguagePatternSets& languages)
{
    auto it = candidate.fields.find("answer");
    if (it == candidate.fields.end())
        return false;

    const std::string_view answer = it->second;
    std::size_t line_start = answer.find('\n');
    while (line_start != std::string_view::npos)
    {
        ++line_start;
        const std::size_t line_end = answer.find('\n', line_start);
        const std::string_view line =
            answer.substr(line_start, line_end == std::string_view::npos ? std::string_view::npos : line_end - line_start);
        if (languages.matchQuestionLabel(line))
        {
            it->second = processing::trim(answer.substr(0, line_start));
            return true;
        }
        line_start = line_end;
    }
    return false;
}

void flagStoppedAnswer(StrategyOutcome& outcome)
{
    outcome.warnings.emplace_back(kAnswerStoppedMessage);
    outcome.issues.push_back({ IssueKind::TruncationRisk, kAnswerStoppedMessage });
    outcome.confidence *= 0.8;
}

} // namespace

std::vector<std::string> requiredFieldsFor(const CardTemplate& tmpl)
{
    if (!tmpl.requiredFields.empty())
        return tmpl.requiredFields;

    std::vector<std::string> required;
    for (const char* name : { "question", "answer", "front", "back" })
    {
        if (tmpl.fieldMapping.count(name) > 0)
            required.emplace_back(name);
    }
    return required;
}

FieldMap extractTemplateFields(const std::smatch& match, const CardTemplate& tmpl)
{
    FieldMap fields;
    for (const auto& [field, group] : tmpl.fieldMapping)
    {
        const auto index = static_cast<std::size_t>(group);
        fields[field] = index < match.size() && match[index].matched ? processing::trim(match[index].str()) : "";
    }
    return fields;
}

std::vector<std::string> emptyRequiredFields(const FieldMap& fields, const CardTemplate& tmpl)
{
    std::vector<std::string> missing;
    for (const auto& name : requiredFieldsFor(tmpl))
    {
        if (!hasText(fields, name.c_str()))
            missing.push_back(name);
    }
    return missing;
}

FieldMap alignToTemplate(FieldMap fields, const CardTemplate* tmpl)
{
    if (!tmpl || tmpl->fieldMapping.empty())
        return fields;

    auto rename = [&](const char* from, const char* to) {
        if (tmpl->fieldMapping.count(from) == 0 && tmpl->fieldMapping.count(to) > 0 && fields.count(from) > 0 &&
            fields.count(to) == 0)
        {
            fields[to] = std::move(fields[from]);
            fields.erase(from);
        }
    };
    rename("question", "front");
    rename("answer", "back");
    return fields;
}

std::string relaxRegex(const std::string& source)
{
    std::string out;
    out.reserve(source.size());
    bool prev_quantifier = false;

    for (std::size_t i = 0; i < source.size(); ++i)
    {
        const char c = source[i];
        if (c == '\\')
        {
            out += c;
            if (i + 1 < source.size())
                out += source[++i];
            prev_quantifier = false;
            continue;
        }
        if (c == '[')
        {
            std::size_t j = i + 1;
            if (j < source.size() && source[j] == '^')
                ++j;
            if (j < source.size() && source[j] == ']')
                ++j;
            while (j < source.size() && source[j] != ']')
                j += source[j] == '\\' ? 2 : 1;
            const std::size_t end = std::min(j, source.size() - 1);
            out.append(source, i, end - i + 1);
            i = end;
            prev_quantifier = false;
            continue;
        }
        if (c == '(' && i + 2 < source.size() && source[i + 1] == '?' && (source[i + 2] == '=' || source[i + 2] == '!'))
        {
            // Skip the whole lookahead, nested groups included
            int depth = 0;
            std::size_t j = i;
            for (; j < source.size(); ++j)
            {
                if (source[j] == '\\')
                {
                    ++j;
                    continue;
                }
                if (source[j] == '(')
                    ++depth;
                else if (source[j] == ')' && --depth == 0)
                    break;
            }
            i = j;
            prev_quantifier = false;
            continue;
        }
        if (c == '(')
        {
            out += c;
            if (i + 1 < source.size() && source[i + 1] == '?')
                out += source[++i];
            prev_quantifier = false;
            continue;
        }
        if (c == '?' && prev_quantifier)
        {
            prev_quantifier = false;
            continue;
        }
        out += c;
        prev_quantifier = c == '*' || c == '+' || c == '?' || c == '}';
    }
    return out;
}

// strict-regex

StrictRegexStrategy::StrictRegexStrategy(patterns::RegexCache& cache)
    : cache_(cache)
{
}

StrategyOutcome StrictRegexStrategy::execute(const StrategyContext& ctx) const
{
    if (!ctx.cardTemplate || ctx.cardTemplate->regex.empty())
        return StrategyOutcome::failed("No template bound", IssueKind::PatternMismatch);

    const CardTemplate& tmpl = *ctx.cardTemplate;
    TemplateRun run = runTemplate(cache_, tmpl.regex, tmpl.flags, tmpl, ctx);
    if (run.failure)
        return std::move(*run.failure);

    const std::vector<std::string> missing = emptyRequiredFields(run.fields, tmpl);
    StrategyOutcome outcome;
    if (missing.empty())
    {
        outcome = StrategyOutcome::ok(std::move(run.fields), 0.7 + 0.3 * run.coverage, ParseMethod::Regex);
    }
    else
    {
        outcome = StrategyOutcome::partial(std::move(run.fields), 0.4, ParseMethod::Regex,
                                           { "Required field '" + missing.front() + "' matched empty" });
        outcome.issues.push_back({ IssueKind::RequiredFieldEmpty, "Required field '" + missing.front() + "' is empty" });
    }
    outcome.patternId = tmpl.id;
    return outcome;
}

// multi-pattern

MultiPatternStrategy::MultiPatternStrategy(const patterns::PatternMatcher& matcher)
    : matcher_(matcher)
{
}

StrategyOutcome MultiPatternStrategy::execute(const StrategyContext& ctx) const
{
    if (ctx.content.size() > ctx.maxRegexInputBytes)
        return StrategyOutcome::failed("Note is larger than the regex input limit", IssueKind::LowConfidence);

    patterns::MultiMatchResult result = matcher_.match(ctx.content);
    if (!result.best)
    {
        return StrategyOutcome::failed("No registered pattern matched (" + std::to_string(result.attempts) + " tried)",
                                       IssueKind::PatternMismatch);
    }
    patterns::MatchCandidate best = *result.best;
    const bool stopped = stopAtNextQuestion(best, matcher_.languages());
    StrategyOutcome outcome = fromMatch(best, ctx.cardTemplate);
    if (stopped)
        flagStoppedAnswer(outcome);
    return outcome;
}

// boundary

BoundaryStrategy::BoundaryStrategy(const boundary::BoundaryDetector& detector)
    : detector_(detector)
{
}

StrategyOutcome BoundaryStrategy::execute(const StrategyContext& ctx) const
{
    boundary::ParsedContent parsed = detector_.analyze(ctx.content);
    if (parsed.question.empty())
        return StrategyOutcome::failed("No question found by structural analysis", IssueKind::PatternMismatch);

    FieldMap fields{ { "question", parsed.question }, { "answer", parsed.answer } };
    fields = alignToTemplate(std::move(fields), ctx.cardTemplate);

    StrategyOutcome outcome = parsed.answer.empty()
                                  ? StrategyOutcome::partial(std::move(fields), parsed.confidence,
                                                             ParseMethod::Intelligent, {})
                                  : StrategyOutcome::ok(std::move(fields), parsed.confidence, ParseMethod::Intelligent);
    outcome.warnings.insert(outcome.warnings.end(), parsed.warnings.begin(), parsed.warnings.end());

    boundary::CompletenessReport report = detector_.validateCompleteness(ctx.content, parsed);
    if (report.warning)
    {
        outcome.warnings.push_back(*report.warning);
        outcome.issues.push_back({ IssueKind::TruncationRisk, *report.warning });
    }
    return outcome;
}

// hybrid

HybridStrategy::HybridStrategy(const patterns::PatternMatcher& matcher, const boundary::BoundaryDetector& detector)
    : matcher_(matcher)
    , detector_(detector)
{
}

StrategyOutcome HybridStrategy::execute(const StrategyContext& ctx) const
{
    if (ctx.content.size() > ctx.maxRegexInputBytes)
        return StrategyOutcome::failed("Note is larger than the regex input limit", IssueKind::LowConfidence);

    std::optional<patterns::MatchCandidate> best = matcher_.matchBest(ctx.content);
    if (!best)
        return StrategyOutcome::failed("No regex result to cross-check", IssueKind::PatternMismatch);

    const bool stopped = stopAtNextQuestion(*best, matcher_.languages());
    boundary::ParsedContent structural = detector_.analyze(ctx.content);
    boundary::ParsedContent from_regex;
    auto q = best->fields.find("question");
    auto a = best->fields.find("answer");
    from_regex.question = q != best->fields.end() ? q->second : std::string();
    from_regex.answer = a != best->fields.end() ? a->second : std::string();
    if (from_regex.question.empty() && from_regex.answer.empty())
    {
        // Single-field patterns (cloze) cover the note through their one field
        for (const auto& [field, value] : best->fields)
            from_regex.answer += value + "\n";
    }

    const boundary::CompletenessReport regex_cov = detector_.validateCompleteness(ctx.content, from_regex);
    const boundary::CompletenessReport structural_cov = detector_.validateCompleteness(ctx.content, structural);

    StrategyOutcome outcome = fromMatch(*best, ctx.cardTemplate);
    outcome.method = ParseMethod::Hybrid;

    if (regex_cov.coverage + 1e-9 < structural_cov.coverage)
    {
        const std::string message = "Regex result covers less of the note than the structural split (" +
                                    std::to_string(static_cast<int>(regex_cov.coverage * 100)) + "% vs " +
                                    std::to_string(static_cast<int>(structural_cov.coverage * 100)) + "%)";
        outcome.warnings.push_back(message);
        outcome.issues.push_back({ IssueKind::TruncationRisk, message });
        outcome.confidence *= 0.8;
    }
    else if (!structural.question.empty() && structural.question == from_regex.question)
    {
        // Both analyses agree on the question
        outcome.confidence = std::min(1.0, std::max(outcome.confidence, structural.confidence) + 0.1);
    }
    if (regex_cov.warning)
        outcome.warnings.push_back(*regex_cov.warning);
    if (stopped)
        flagStoppedAnswer(outcome);
    return outcome;
}

// relaxed-regex

RelaxedRegexStrategy::RelaxedRegexStrategy(patterns::RegexCache& cache)
    : cache_(cache)
{
}

StrategyOutcome RelaxedRegexStrategy::execute(const StrategyContext& ctx) const
{
    if (!ctx.cardTemplate || ctx.cardTemplate->regex.empty())
        return StrategyOutcome::failed("No template bound", IssueKind::PatternMismatch);

    const CardTemplate& tmpl = *ctx.cardTemplate;
    const std::string source = relaxRegex(tmpl.regex);
    std::string flags = tmpl.flags;
    if (flags.find('i') == std::string::npos)
        flags += 'i';
    if (source == tmpl.regex && flags == tmpl.flags)
        return StrategyOutcome::failed("Template regex has nothing to relax", IssueKind::PatternMismatch);

    TemplateRun run = runTemplate(cache_, source, flags, tmpl, ctx);
    if (run.failure)
        return std::move(*run.failure);

    const std::vector<std::string> missing = emptyRequiredFields(run.fields, tmpl);
    StrategyOutcome outcome =
        missing.empty()
            ? StrategyOutcome::ok(std::move(run.fields), kConfidence, ParseMethod::Regex)
            : StrategyOutcome::partial(std::move(run.fields), kConfidence * 0.5, ParseMethod::Regex,
                                       { "Required field '" + missing.front() + "' matched empty" });
    outcome.warnings.emplace_back("Matched with a relaxed version of the template regex");
    outcome.patternId = tmpl.id;
    return outcome;
}

// keyword-heuristic

KeywordHeuristicStrategy::KeywordHeuristicStrategy(const processing::LanguagePatternSets& languages)
    : KeywordHeuristicStrategy(languages, std::make_unique<processing::MarkerFuzzyMatcher>())
{
}

KeywordHeuristicStrategy::KeywordHeuristicStrategy(const processing::LanguagePatternSets& languages,
                                                   std::unique_ptr<processing::IFuzzyMatcher> fuzzy)
    : languages_(languages)
    , fuzzy_(std::move(fuzzy))
{
}

KeywordHeuristicStrategy::~KeywordHeuristicStrategy() = default;

StrategyOutcome KeywordHeuristicStrategy::execute(const StrategyContext& ctx) const
{
    if (processing::trim(ctx.content).empty())
        return StrategyOutcome::failed("Note is empty", IssueKind::PatternMismatch);

    processing::SmartSplit split = languages_.smartSplit(ctx.content);
    std::vector<std::string> warnings;
    double confidence = 0.0;

    if (split.confidence >= 0.8)
    {
        confidence = 0.5;
    }
    else
    {
        // Look for a misspelled answer marker ("Anwser:") before settling for a weaker split
        const std::vector<std::string> lines = processing::splitLines(ctx.content);
        const std::vector<std::string> labels = languages_.allAnswerLabels();
        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            std::size_t colon = lines[i].find(':');
            std::size_t colon_len = 1;
            const std::size_t wide = lines[i].find("\xEF\xBC\x9A"); // ：
            if (wide != std::string::npos && (colon == std::string::npos || wide < colon))
            {
                colon = wide;
                colon_len = 3;
            }
            if (colon == std::string::npos || colon == 0 || colon > 24)
                continue;

            const std::string marker = processing::trim(std::string_view(lines[i]).substr(0, colon));
            if (processing::codepointCount(marker) < 3)
                continue;
            auto hit = fuzzy_->findBestMatch(marker, labels, kMarkerSimilarity);
            if (!hit || hit->score >= 1.0)
                continue;

            std::vector<std::string> question_lines(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(i));
            if (auto label = languages_.matchQuestionLabel(question_lines.front()))
                question_lines.front() = label->content;
            split.question = processing::trim(processing::joinLines(question_lines, 0, question_lines.size()));
            std::vector<std::string> answer_lines(lines.begin() + static_cast<std::ptrdiff_t>(i), lines.end());
            answer_lines.front() = lines[i].substr(colon + colon_len);
            split.answer = processing::trim(processing::joinLines(answer_lines, 0, answer_lines.size()));
            warnings.push_back("Read '" + marker + "' as the answer marker '" + hit->matched + "'");
            confidence = 0.45;
            break;
        }

        if (confidence == 0.0)
        {
            if (split.confidence >= 0.6)
                confidence = 0.4;
            else if (split.confidence >= 0.4)
                confidence = 0.3;
            else
                confidence = 0.2;
        }
    }

    warnings.push_back(std::string("Keyword split, language ") + processing::LanguagePatternSets::code(split.language));
    FieldMap fields{ { "question", split.question }, { "answer", split.answer } };
    fields = alignToTemplate(std::move(fields), ctx.cardTemplate);

    if (split.question.empty() || split.answer.empty())
        return StrategyOutcome::partial(std::move(fields), confidence, ParseMethod::Intelligent, std::move(warnings));

    StrategyOutcome outcome = StrategyOutcome::ok(std::move(fields), confidence, ParseMethod::Intelligent);
    outcome.warnings = std::move(warnings);
    return outcome;
}

} // namespace pipeline
