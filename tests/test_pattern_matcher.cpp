#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <memory>
#include <string>

#include "patterns/BuiltinPatterns.hpp"
#include "patterns/PatternMatcher.hpp"
#include "patterns/PatternRegistry.hpp"
#include "processing/LanguagePatterns.hpp"

using namespace patterns;
using Catch::Matchers::WithinAbs;

namespace
{
struct Fixture
{
    PatternRegistry registry;
    processing::LanguagePatternSets languages;
    PatternMatcher matcher{ registry, languages };

    Fixture() { registerBuiltinPatterns(registry); }
};

ContentPattern makePattern(const std::string& id, const std::string& regex, int priority)
{
    ContentPattern p;
    p.id = id;
    p.regex = regex;
    p.fieldMapping = { { "question", 1 } };
    p.priority = priority;
    return p;
}
} // namespace

TEST_CASE("PatternMatcher - heading question and answer", "[matcher]")
{
    Fixture f;
    auto result = f.matcher.match("## What is X?\n\nX is Y.");

    REQUIRE(result.best.has_value());
    REQUIRE(result.best->pattern->id == "h2-qa");
    REQUIRE(result.best->fields.at("question") == "What is X?");
    REQUIRE(result.best->fields.at("answer") == "X is Y.");
    REQUIRE(result.best->confidence >= 0.9);
    REQUIRE_THAT(result.best->coverage, WithinAbs(1.0, 1e-9));
    REQUIRE(result.attempts == static_cast<int>(builtinPatterns().size()));
    REQUIRE(result.all.size() > 1);
    REQUIRE(result.all.front().pattern->id == "h2-qa");
    REQUIRE(result.errors.empty());
}

TEST_CASE("PatternMatcher - Chinese labels", "[matcher]")
{
    Fixture f;
    auto best = f.matcher.matchBest("问题：什么是递归？\n\n答案：函数调用自身。");

    REQUIRE(best.has_value());
    REQUIRE(best->pattern->id == "chinese-qa");
    REQUIRE(best->fields.at("question") == "什么是递归？");
    REQUIRE(best->fields.at("answer") == "函数调用自身。");
}

TEST_CASE("PatternMatcher - Q/A labels", "[matcher]")
{
    Fixture f;
    auto best = f.matcher.matchBest("Q: What is Y?\nA: Y is Z.");

    REQUIRE(best.has_value());
    REQUIRE(best->pattern->id == "qa-pair");
    REQUIRE(best->fields.at("question") == "What is Y?");
    REQUIRE(best->fields.at("answer") == "Y is Z.");
}

TEST_CASE("PatternMatcher - selection is deterministic", "[matcher]")
{
    Fixture f;
    const std::string note = "What is recursion?\nA function that calls itself.";

    auto first = f.matcher.match(note);
    auto second = f.matcher.match(note);
    REQUIRE(first.best.has_value());
    REQUIRE(second.best.has_value());
    REQUIRE(first.best->pattern->id == second.best->pattern->id);
    REQUIRE(first.all.size() == second.all.size());
    for (std::size_t i = 0; i < first.all.size(); ++i)
        REQUIRE(first.all[i].pattern->id == second.all[i].pattern->id);
}

TEST_CASE("PatternMatcher - equal scores go to the earlier registration", "[matcher]")
{
    PatternRegistry registry;
    processing::LanguagePatternSets languages;
    PatternMatcher matcher(registry, languages);

    REQUIRE(registry.registerPattern(makePattern("first", "^([a-z]+)$", 50)).succeeded);
    REQUIRE(registry.registerPattern(makePattern("second", "^([a-z]+)$", 50)).succeeded);

    auto result = matcher.match("hello");
    REQUIRE(result.best->pattern->id == "first");
    REQUIRE(result.all.size() == 2);
}

TEST_CASE("PatternMatcher - nothing matches", "[matcher]")
{
    PatternRegistry registry;
    processing::LanguagePatternSets languages;
    PatternMatcher matcher(registry, languages);
    REQUIRE(registry.registerPattern(makePattern("digits", "^(\\d+)$", 50)).succeeded);

    SECTION("No candidate is not an error")
    {
        auto result = matcher.match("abc");
        REQUIRE_FALSE(result.best.has_value());
        REQUIRE(result.all.empty());
        REQUIRE(result.attempts == 1);
        REQUIRE(result.errors.empty());
    }

    SECTION("Blank content is not evaluated")
    {
        auto result = matcher.match("  \n ");
        REQUIRE_FALSE(result.best.has_value());
        REQUIRE(result.attempts == 0);
    }

    SECTION("testPattern")
    {
        REQUIRE(matcher.testPattern("digits", " 42 ").has_value());
        REQUIRE(matcher.testPattern("digits", " 42 ")->fields.at("question") == "42");
        REQUIRE_FALSE(matcher.testPattern("digits", "x").has_value());
        REQUIRE_FALSE(matcher.testPattern("unknown", "42").has_value());
    }
}

TEST_CASE("PatternMatcher - coverage and scoring", "[matcher]")
{
    SECTION("Coverage counts non-whitespace code points")
    {
        REQUIRE_THAT(PatternMatcher::coverage("ab", "ab cd"), WithinAbs(0.5, 1e-9));
        REQUIRE_THAT(PatternMatcher::coverage("问题", "问题 答案"), WithinAbs(0.5, 1e-9));
        REQUIRE_THAT(PatternMatcher::coverage("x", "   "), WithinAbs(0.0, 1e-9));
    }

    SECTION("Confidence is clamped to one")
    {
        PatternRegistry registry;
        processing::LanguagePatternSets languages;
        PatternMatcher matcher(registry, languages);

        ContentPattern p;
        p.baseConfidence = 0.95;
        text_processing::FieldMap fields{ { "question", "What is recursion?" },
                                          { "answer", "A function that calls itself." } };
        REQUIRE_THAT(matcher.confidenceFor(p, fields, 1.0), WithinAbs(1.0, 1e-9));
        // Base confidence scaled by coverage, no bonuses
        text_processing::FieldMap tiny{ { "question", "ab" } };
        REQUIRE_THAT(matcher.confidenceFor(p, tiny, 0.5), WithinAbs(0.95 * 0.5, 1e-9));
    }

    SECTION("Very short questions are penalised")
    {
        auto pattern = std::make_shared<const ContentPattern>(makePattern("p", "(x)", 100));
        MatchCandidate shortQ;
        shortQ.pattern = pattern;
        shortQ.confidence = 1.0;
        shortQ.coverage = 1.0;
        shortQ.fields["question"] = "ab";
        // 0.4 + 0.3 + 0.3 - 0.2
        REQUIRE_THAT(PatternMatcher::compositeScore(shortQ), WithinAbs(0.8, 1e-9));
    }
}
