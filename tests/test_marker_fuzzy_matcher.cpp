#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <memory>
#include <string>
#include <vector>

#include "processing/MarkerFuzzyMatcher.hpp"
#include "processing/NFKCTextNormalizer.hpp"

using namespace processing;
using Catch::Matchers::WithinAbs;

namespace
{
class IdentityNormalizer : public ITextNormalizer
{
public:
    std::string normalize(const std::string& text) const override { return text; }
};
} // namespace

TEST_CASE("NFKCTextNormalizer - width, case and trimming", "[fuzzy][normalizer]")
{
    SECTION("Full-width letters fold to lower-case ASCII")
    {
        NFKCTextNormalizer normalizer;
        REQUIRE(normalizer.normalize("ＡＮＳＷＥＲ") == "answer");
        REQUIRE(normalizer.caseFold());
    }

    SECTION("Case is kept when folding is off")
    {
        NFKCTextNormalizer normalizer(false);
        REQUIRE(normalizer.normalize("ＡＢＣ") == "ABC");
    }

    SECTION("Surrounding whitespace is trimmed")
    {
        NFKCTextNormalizer normalizer;
        REQUIRE(normalizer.normalize("  Question  ") == "question");
        REQUIRE(normalizer.normalize("").empty());
    }

    SECTION("Full-width colon becomes ASCII")
    {
        NFKCTextNormalizer normalizer;
        REQUIRE(normalizer.normalize("答案：") == "答案:");
    }

    SECTION("normalizeAll keeps order and empty entries")
    {
        NFKCTextNormalizer normalizer;
        const auto out = normalizer.normalizeAll({ "Ｑ", "", " Answer " });
        REQUIRE(out == std::vector<std::string>{ "q", "", "answer" });
        REQUIRE(normalizer.equivalent("ＡＮＳ", "ans"));
        REQUIRE_FALSE(normalizer.equivalent("ans", "answer"));
    }
}

TEST_CASE("MarkerFuzzyMatcher - similarity", "[fuzzy]")
{
    MarkerFuzzyMatcher matcher;

    SECTION("Identical markers score 1.0")
    {
        REQUIRE_THAT(matcher.similarity("Answer", "Answer"), WithinAbs(1.0, 0.001));
        REQUIRE_THAT(matcher.similarity("答案", "答案"), WithinAbs(1.0, 0.001));
    }

    SECTION("Case and width variants compare equal")
    {
        REQUIRE_THAT(matcher.similarity("QUESTION", "question"), WithinAbs(1.0, 0.001));
        REQUIRE_THAT(matcher.similarity("ＡＮＳＷＥＲ", "answer"), WithinAbs(1.0, 0.001));
    }

    SECTION("Transposed letters stay above the marker threshold")
    {
        REQUIRE(matcher.similarity("Anwser", "Answer") > 0.8);
        REQUIRE(matcher.similarity("Anwser", "Answer") < 1.0);
    }

    SECTION("Empty strings score zero")
    {
        REQUIRE_THAT(matcher.similarity("", "Answer"), WithinAbs(0.0, 0.001));
    }

    SECTION("Partial ratio finds a marker inside a longer string")
    {
        REQUIRE(matcher.similarity("answer", "the answer is", MatchAlgorithm::PartialRatio) > 0.95);
    }
}

TEST_CASE("MarkerFuzzyMatcher - findBestMatch", "[fuzzy]")
{
    MarkerFuzzyMatcher matcher;
    const std::vector<std::string> candidates = { "Question", "Answer", "Solution" };

    SECTION("Misspelled label resolves to the closest candidate")
    {
        auto hit = matcher.findBestMatch("Qustion", candidates, 0.8);
        REQUIRE(hit.has_value());
        REQUIRE(hit->matched == "Question");
        REQUIRE(hit->algorithm == MatchAlgorithm::Ratio);
    }

    SECTION("Nothing above the threshold")
    {
        REQUIRE_FALSE(matcher.findBestMatch("xyz", candidates, 0.8).has_value());
    }

    SECTION("Empty input")
    {
        REQUIRE(matcher.findMatches("", candidates, 0.1).empty());
        REQUIRE(matcher.findMatches("Answer", {}, 0.1).empty());
    }

    SECTION("Matches are sorted best first")
    {
        auto matches = matcher.findMatches("Answer", { "Anwser", "Answer" }, 0.5);
        REQUIRE(matches.size() == 2);
        REQUIRE(matches[0].matched == "Answer");
        REQUIRE(matches[0].score >= matches[1].score);
    }
}

TEST_CASE("MarkerFuzzyMatcher - injected normalizer", "[fuzzy]")
{
    MarkerFuzzyMatcher matcher(std::make_unique<IdentityNormalizer>());
    REQUIRE(matcher.similarity("ABC", "abc") < 0.5);

    MarkerFuzzyMatcher fallback(nullptr);
    REQUIRE_THAT(fallback.similarity("ABC", "abc"), WithinAbs(1.0, 0.001));
}
