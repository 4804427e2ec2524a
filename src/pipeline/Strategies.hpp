#pragma once

#include "IParseStrategy.hpp"

#include "../boundary/BoundaryDetector.hpp"
#include "../patterns/PatternMatcher.hpp"
#include "../patterns/RegexCompiler.hpp"
#include "../processing/IFuzzyMatcher.hpp"
#include "../processing/LanguagePatterns.hpp"

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace pipeline
{

// Template helpers shared by the strategies and the dual-mode parser

// Fields named by the template, or question/answer/front/back where the template maps them
[[nodiscard]] std::vector<std::string> requiredFieldsFor(const text_processing::CardTemplate& tmpl);

// Field -> trimmed capture text for every mapping of the template
[[nodiscard]] text_processing::FieldMap extractTemplateFields(const std::smatch& match,
                                                              const text_processing::CardTemplate& tmpl);

// Names of required fields that are missing or blank
[[nodiscard]] std::vector<std::string> emptyRequiredFields(const text_processing::FieldMap& fields,
                                                           const text_processing::CardTemplate& tmpl);

// Renames question/answer to front/back when the bound template only knows the latter
[[nodiscard]] text_processing::FieldMap alignToTemplate(text_processing::FieldMap fields,
                                                        const text_processing::CardTemplate* tmpl);

// Drops lookaheads and turns lazy quantifiers greedy
[[nodiscard]] std::string relaxRegex(const std::string& source);

class StrictRegexStrategy : public IParseStrategy
{
public:
    explicit StrictRegexStrategy(patterns::RegexCache& cache);

    [[nodiscard]] std::string name() const override { return "strict-regex"; }
    [[nodiscard]] StrategyOutcome execute(const StrategyContext& context) const override;

private:
    patterns::RegexCache& cache_;
};

class MultiPatternStrategy : public IParseStrategy
{
public:
    explicit MultiPatternStrategy(const patterns::PatternMatcher& matcher);

    [[nodiscard]] std::string name() const override { return "multi-pattern"; }
    [[nodiscard]] StrategyOutcome execute(const StrategyContext& context) const override;

private:
    const patterns::PatternMatcher& matcher_;
};

class BoundaryStrategy : public IParseStrategy
{
public:
    explicit BoundaryStrategy(const boundary::BoundaryDetector& detector);

    [[nodiscard]] std::string name() const override { return "boundary"; }
    [[nodiscard]] StrategyOutcome execute(const StrategyContext& context) const override;

private:
    const boundary::BoundaryDetector& detector_;
};

// Regex match cross-checked against the structural split
class HybridStrategy : public IParseStrategy
{
public:
    HybridStrategy(const patterns::PatternMatcher& matcher, const boundary::BoundaryDetector& detector);

    [[nodiscard]] std::string name() const override { return "hybrid"; }
    [[nodiscard]] StrategyOutcome execute(const StrategyContext& context) const override;

private:
    const patterns::PatternMatcher& matcher_;
    const boundary::BoundaryDetector& detector_;
};

class RelaxedRegexStrategy : public IParseStrategy
{
public:
    static constexpr double kConfidence = 0.6;

    explicit RelaxedRegexStrategy(patterns::RegexCache& cache);

    [[nodiscard]] std::string name() const override { return "relaxed-regex"; }
    [[nodiscard]] StrategyOutcome execute(const StrategyContext& context) const override;

private:
    patterns::RegexCache& cache_;
};

// Language-aware marker split, with misspelled markers recognised by fuzzy matching
class KeywordHeuristicStrategy : public IParseStrategy
{
public:
    static constexpr double kMarkerSimilarity = 0.8;

    explicit KeywordHeuristicStrategy(const processing::LanguagePatternSets& languages);
    KeywordHeuristicStrategy(const processing::LanguagePatternSets& languages,
                             std::unique_ptr<processing::IFuzzyMatcher> fuzzy);
    ~KeywordHeuristicStrategy() override;

    [[nodiscard]] std::string name() const override { return "keyword-heuristic"; }
    [[nodiscard]] StrategyOutcome execute(const StrategyContext& context) const override;

private:
    const processing::LanguagePatternSets& languages_;
    std::unique_ptr<processing::IFuzzyMatcher> fuzzy_;
};

} // namespace pipeline
