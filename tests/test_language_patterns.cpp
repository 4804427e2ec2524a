#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <algorithm>
#include <string>

#include "processing/LanguagePatterns.hpp"

using namespace processing;
using Catch::Matchers::WithinAbs;

TEST_CASE("LanguagePatternSets - detectLanguage", "[language]")
{
    LanguagePatternSets sets;

    SECTION("Chinese")
    {
        REQUIRE(sets.detectLanguage("问题：什么是递归？") == Language::Chinese);
    }

    SECTION("English")
    {
        REQUIRE(sets.detectLanguage("What is recursion?") == Language::English);
    }

    SECTION("Japanese needs kana")
    {
        REQUIRE(sets.detectLanguage("再帰とは何ですか？") == Language::Japanese);
    }

    SECTION("Korean")
    {
        REQUIRE(sets.detectLanguage("재귀란 무엇입니까?") == Language::Korean);
    }

    SECTION("No evidence defaults to English")
    {
        REQUIRE(sets.detectLanguage("") == Language::English);
        REQUIRE(sets.detectLanguage("12345") == Language::English);
    }

    SECTION("Scores weight labels over words")
    {
        auto scores = sets.languageScores("Q: x");
        REQUIRE_THAT(scores.at(Language::English), WithinAbs(2.5, 1e-9));
    }
}

TEST_CASE("LanguagePatternSets - looksLikeQuestion", "[language]")
{
    LanguagePatternSets sets;

    REQUIRE(sets.looksLikeQuestion("What is X?"));
    REQUIRE(sets.looksLikeQuestion("Explain recursion"));
    REQUIRE(sets.looksLikeQuestion("什么是递归"));
    REQUIRE(sets.looksLikeQuestion("递归是什么"));
    REQUIRE(sets.looksLikeQuestion("Q: anything"));
    REQUIRE(sets.looksLikeQuestion("the sky is blue？"));

    REQUIRE_FALSE(sets.looksLikeQuestion(""));
    REQUIRE_FALSE(sets.looksLikeQuestion("The sky is blue."));
    REQUIRE_FALSE(sets.looksLikeQuestion("Isolation matters"));
}

TEST_CASE("LanguagePatternSets - label matching", "[language]")
{
    LanguagePatternSets sets;

    SECTION("Chinese question label with full-width colon")
    {
        auto match = sets.matchQuestionLabel("问题：什么是递归？");
        REQUIRE(match.has_value());
        REQUIRE(match->label == "问题");
        REQUIRE(match->content == "什么是递归？");
        REQUIRE(match->language == Language::Chinese);
    }

    SECTION("Longest label wins")
    {
        auto match = sets.matchAnswerLabel("Answer: 42");
        REQUIRE(match.has_value());
        REQUIRE(match->label == "Answer");
        REQUIRE(match->content == "42");
    }

    SECTION("Bold labels, colon inside or outside")
    {
        auto inside = sets.matchQuestionLabel("**Question:** What?");
        REQUIRE(inside.has_value());
        REQUIRE(inside->content == "What?");

        auto outside = sets.matchQuestionLabel("**Question**: What?");
        REQUIRE(outside.has_value());
        REQUIRE(outside->content == "What?");
    }

    SECTION("Space before the colon is tolerated")
    {
        auto match = sets.matchQuestionLabel("Q : x");
        REQUIRE(match.has_value());
        REQUIRE(match->content == "x");
    }

    SECTION("A label needs a colon")
    {
        REQUIRE_FALSE(sets.matchQuestionLabel("Question without colon").has_value());
        REQUIRE_FALSE(sets.matchAnswerLabel("Apple: a fruit").has_value());
    }

    SECTION("Chinese answer label")
    {
        auto match = sets.matchAnswerLabel("答案：函数调用自身。");
        REQUIRE(match.has_value());
        REQUIRE(match->label == "答案");
        REQUIRE(match->content == "函数调用自身。");
    }
}

TEST_CASE("LanguagePatternSets - smartSplit", "[language]")
{
    LanguagePatternSets sets;

    SECTION("Answer label splits with high confidence")
    {
        auto split = sets.smartSplit("What is X\nAnswer: X is Y");
        REQUIRE(split.question == "What is X");
        REQUIRE(split.answer == "X is Y");
        REQUIRE_THAT(split.confidence, WithinAbs(0.8, 1e-9));
    }

    SECTION("Separator line splits")
    {
        auto split = sets.smartSplit("Question text\n---\nAnswer text");
        REQUIRE(split.question == "Question text");
        REQUIRE(split.answer == "Answer text");
        REQUIRE_THAT(split.confidence, WithinAbs(0.8, 1e-9));
    }

    SECTION("Question-like line")
    {
        auto split = sets.smartSplit("Explain X\nIt is Y");
        REQUIRE(split.question == "Explain X");
        REQUIRE(split.answer == "It is Y");
        REQUIRE_THAT(split.confidence, WithinAbs(0.6, 1e-9));
    }

    SECTION("First line and the rest")
    {
        auto split = sets.smartSplit("Line one\nLine two");
        REQUIRE(split.question == "Line one");
        REQUIRE(split.answer == "Line two");
        REQUIRE_THAT(split.confidence, WithinAbs(0.4, 1e-9));
    }

    SECTION("Single line")
    {
        auto split = sets.smartSplit("single");
        REQUIRE(split.question == "single");
        REQUIRE(split.answer.empty());
        REQUIRE_THAT(split.confidence, WithinAbs(0.2, 1e-9));
    }
}

TEST_CASE("LanguagePatternSets - tables and codes", "[language]")
{
    LanguagePatternSets sets;

    REQUIRE(sets.all().size() == 4);
    REQUIRE(sets.get(Language::Japanese).code == "ja");

    auto answers = sets.allAnswerLabels();
    REQUIRE(std::find(answers.begin(), answers.end(), "Answer") != answers.end());
    REQUIRE(std::find(answers.begin(), answers.end(), "答案") != answers.end());
    REQUIRE(std::count(answers.begin(), answers.end(), "A") == 1);

    REQUIRE(std::string(LanguagePatternSets::code(Language::Korean)) == "ko");
    REQUIRE(LanguagePatternSets::fromCode("zh") == Language::Chinese);
    REQUIRE_FALSE(LanguagePatternSets::fromCode("fr").has_value());
}
