#include "PatternMatcher.hpp"

#include "../processing/Diagnostics.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <regex>

#include <plog/Log.h>

namespace patterns
{

namespace
{

constexpr double kScoreEpsilon = 1e-9;

std::size_t fieldLength(const text_processing::FieldMap& fields, const char* name)
{
    auto it = fields.find(name);
    return it == fields.end() ? 0 : processing::codepointCount(it->second);
}

} // namespace

PatternMatcher::PatternMatcher(const PatternRegistry& registry, const processing::LanguagePatternSets& languages)
    : registry_(registry)
    , languages_(languages)
{
}

double PatternMatcher::coverage(std::string_view matched, std::string_view content)
{
    const std::size_t total = processing::countNonWhitespace(content);
    if (total == 0)
        return 0.0;
    const double ratio = static_cast<double>(processing::countNonWhitespace(matched)) / static_cast<double>(total);
    return std::min(1.0, ratio);
}

double PatternMatcher::confidenceFor(const ContentPattern& pattern, const text_processing::FieldMap& fields,
                                     double cov) const
{
    double confidence = pattern.baseConfidence * cov;

    const std::size_t q_len = fieldLength(fields, "question");
    const std::size_t a_len = fieldLength(fields, "answer");
    if (q_len > 5)
        confidence += 0.1;
    if (a_len > 10)
        confidence += 0.1;

    auto q = fields.find("question");
    if (q != fields.end() && !q->second.empty() && languages_.looksLikeQuestion(q->second))
        confidence += 0.1;

    if (q_len > 0 && a_len > 0)
    {
        const double ratio = static_cast<double>(q_len) / static_cast<double>(q_len + a_len);
        if (ratio >= 0.1 && ratio <= 0.5)
            confidence += 0.05;
    }
    return std::clamp(confidence, 0.0, 1.0);
}

double PatternMatcher::compositeScore(const MatchCandidate& candidate)
{
    double score = candidate.confidence * 0.4 + candidate.coverage * 0.3 + candidate.pattern->priority / 100.0 * 0.3;

    const bool has_question = candidate.fields.count("question") > 0;
    const std::size_t q_len = fieldLength(candidate.fields, "question");
    const std::size_t a_len = fieldLength(candidate.fields, "answer");
    if (q_len > 5)
        score += 0.1;
    if (a_len > 10)
        score += 0.1;
    if (has_question && q_len < 3)
        score -= 0.2;
    if (a_len > 5000)
        score -= 0.1;
    return score;
}

std::optional<MatchCandidate> PatternMatcher::evaluate(const RegisteredPattern& entry, const std::string& content) const
{
    std::smatch m;
    if (!std::regex_search(content, m, *entry.regex))
        return std::nullopt;

    MatchCandidate candidate;
    candidate.pattern = entry.pattern;
    candidate.sequence = entry.sequence;
    candidate.groups.reserve(m.size());
    for (std::size_t i = 0; i < m.size(); ++i)
        candidate.groups.push_back(m[i].matched ? m[i].str() : std::string());

    for (const auto& [field, group] : entry.pattern->fieldMapping)
    {
        const auto index = static_cast<std::size_t>(group);
        candidate.fields[field] = index < candidate.groups.size() ? processing::trim(candidate.groups[index]) : "";
    }

    candidate.coverage = coverage(candidate.groups.front(), content);
    candidate.confidence = confidenceFor(*entry.pattern, candidate.fields, candidate.coverage);
    candidate.score = compositeScore(candidate);
    return candidate;
}

MultiMatchResult PatternMatcher::match(std::string_view content) const
{
    PROFILE_SCOPE_FUNCTION();

    using namespace std::chrono;
    const auto start = steady_clock::now();
    MultiMatchResult result;

    const std::string text = processing::trim(content);
    if (text.empty())
    {
        result.elapsed = duration_cast<microseconds>(steady_clock::now() - start);
        return result;
    }

    for (const auto& entry : registry_.snapshot())
    {
        ++result.attempts;
        std::optional<MatchCandidate> candidate;
        try
        {
            candidate = evaluate(entry, text);
        }
        catch (const std::regex_error& ex)
        {
            result.errors.push_back(entry.pattern->id + ": " + ex.what());
            PLOG_WARNING_(processing::Diagnostics::kLogInstance)
                << "[PatternMatcher] pattern=" << entry.pattern->id << " gave up: " << ex.what();
            continue;
        }
        if (!candidate)
            continue;

        // Snapshot order is priority desc then registration, so only a strictly better score displaces
        if (!result.best || candidate->score > result.best->score + kScoreEpsilon)
            result.best = *candidate;
        result.all.push_back(std::move(*candidate));
    }

    std::stable_sort(result.all.begin(), result.all.end(), [](const MatchCandidate& a, const MatchCandidate& b) {
        return a.score > b.score + kScoreEpsilon;
    });
    result.elapsed = duration_cast<microseconds>(steady_clock::now() - start);

    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
            << "[PatternMatcher] attempts=" << result.attempts << " matched=" << result.all.size()
            << " best=" << (result.best ? result.best->pattern->id : std::string("none"))
            << " duration=" << result.elapsed.count() << "us";
    }
    return result;
}

std::optional<MatchCandidate> PatternMatcher::matchBest(std::string_view content) const
{
    return match(content).best;
}

std::optional<MatchCandidate> PatternMatcher::testPattern(const std::string& id, std::string_view content) const
{
    auto entry = registry_.entry(id);
    if (!entry)
        return std::nullopt;
    const std::string text = processing::trim(content);
    if (text.empty())
        return std::nullopt;
    try
    {
        return evaluate(*entry, text);
    }
    catch (const std::regex_error& ex)
    {
        PLOG_WARNING_(processing::Diagnostics::kLogInstance)
            << "[PatternMatcher] pattern=" << id << " gave up: " << ex.what();
        return std::nullopt;
    }
}

} // namespace patterns
