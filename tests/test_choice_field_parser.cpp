#include <catch2/catch_test_macros.hpp>
#include <string>

#include "choice/ChoiceFieldParser.hpp"

using namespace choice;

TEST_CASE("ChoiceFieldParser - single correct answer", "[choice]")
{
    auto result = ChoiceFieldParser::parseChoiceQuestion("A. Paris\nB. London\nC. Berlin", "B");

    REQUIRE(result.success);
    REQUIRE(result.options.size() == 3);
    REQUIRE_FALSE(result.options[0].isCorrect);
    REQUIRE(result.options[1].isCorrect);
    REQUIRE_FALSE(result.options[2].isCorrect);
    REQUIRE(result.options[1].content == "London");
    REQUIRE(result.correctAnswers == std::vector<std::string>{ "B" });
    REQUIRE_FALSE(result.isMultiple);
    REQUIRE(result.warnings.empty());
}

TEST_CASE("ChoiceFieldParser - option line syntax", "[choice]")
{
    SECTION("Accepted label forms")
    {
        for (const std::string line : { "A. text", "A) text", "A: text", "A、text", "A text", "A．text", "A：text" })
        {
            INFO(line);
            auto option = ChoiceFieldParser::parseOptionLine(line);
            REQUIRE(option.has_value());
            REQUIRE(option->id == "A");
            REQUIRE(option->content == "text");
        }
    }

    SECTION("Numbers and lower-case letters")
    {
        auto numbered = ChoiceFieldParser::parseOptionLine("12) twelve");
        REQUIRE(numbered.has_value());
        REQUIRE(numbered->id == "12");

        auto lower = ChoiceFieldParser::parseOptionLine("b) beta");
        REQUIRE(lower.has_value());
        REQUIRE(lower->id == "B");
        REQUIRE(lower->label == "b");
    }

    SECTION("Ordinary sentences are not options")
    {
        REQUIRE_FALSE(ChoiceFieldParser::parseOptionLine("Apple pie").has_value());
        REQUIRE_FALSE(ChoiceFieldParser::parseOptionLine("1 apple").has_value());
        REQUIRE_FALSE(ChoiceFieldParser::parseOptionLine("b beta").has_value());
        REQUIRE_FALSE(ChoiceFieldParser::parseOptionLine("- item").has_value());
        REQUIRE_FALSE(ChoiceFieldParser::parseOptionLine("").has_value());
    }
}

TEST_CASE("ChoiceFieldParser - parseOptions", "[choice]")
{
    SECTION("Stray lines and duplicates become warnings")
    {
        auto result = ChoiceFieldParser::parseOptions("A. one\nnot an option\nB. two\nB. again\nC.");
        REQUIRE(result.success);
        REQUIRE(result.options.size() == 2);
        REQUIRE(result.warnings.size() == 3);
    }

    SECTION("Gaps in the sequence are reported")
    {
        auto letters = ChoiceFieldParser::parseOptions("A. one\nC. three");
        REQUIRE(letters.success);
        REQUIRE(letters.warnings == std::vector<std::string>{ "Option labels are not contiguous: expected B, found C" });

        auto numbers = ChoiceFieldParser::parseOptions("1. one\n2. two\n4. four");
        REQUIRE(numbers.warnings == std::vector<std::string>{ "Option numbers are not contiguous: expected 3, found 4" });

        auto mixed = ChoiceFieldParser::parseOptions("A. one\n2. two");
        REQUIRE(mixed.warnings.size() == 1);
    }

    SECTION("No options")
    {
        auto empty = ChoiceFieldParser::parseOptions("  ");
        REQUIRE_FALSE(empty.success);
        REQUIRE(empty.error == "Options are empty");

        auto none = ChoiceFieldParser::parseOptions("just prose\nmore prose");
        REQUIRE_FALSE(none.success);
        REQUIRE(none.error == "No option lines found");
    }
}

TEST_CASE("ChoiceFieldParser - correct answers", "[choice]")
{
    const auto options = ChoiceFieldParser::parseOptions("A. one\nB. two\nC. three\nD. four").options;

    SECTION("Several answers in one token or separated")
    {
        for (const std::string text : { "AC", "A, C", "A;C", "a c", "A，C", "A、C", "A. C." })
        {
            INFO(text);
            auto result = ChoiceFieldParser::parseCorrectAnswer(text, options);
            REQUIRE(result.success);
            REQUIRE(result.correctIds == std::vector<std::string>{ "A", "C" });
            REQUIRE(result.isMultiple);
        }
    }

    SECTION("Repeated labels count once")
    {
        auto result = ChoiceFieldParser::parseCorrectAnswer("B, B", options);
        REQUIRE(result.success);
        REQUIRE(result.correctIds.size() == 1);
        REQUIRE_FALSE(result.isMultiple);
    }

    SECTION("Unknown label is an error")
    {
        auto result = ChoiceFieldParser::parseCorrectAnswer("E", options);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errors == std::vector<std::string>{ "Option E does not exist" });
    }

    SECTION("Unreadable label")
    {
        auto result = ChoiceFieldParser::parseCorrectAnswer("A1", options);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errors.size() == 1);
    }

    SECTION("Empty answer")
    {
        auto result = ChoiceFieldParser::parseCorrectAnswer("", options);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errors == std::vector<std::string>{ "Correct answer is empty" });
    }

    SECTION("Numbered options")
    {
        const auto numbered = ChoiceFieldParser::parseOptions("1. one\n2. two\n3. three").options;
        auto result = ChoiceFieldParser::parseCorrectAnswer("1、3", numbered);
        REQUIRE(result.success);
        REQUIRE(result.correctIds == std::vector<std::string>{ "1", "3" });
    }
}

TEST_CASE("ChoiceFieldParser - errors surface through parseChoiceQuestion", "[choice]")
{
    auto result = ChoiceFieldParser::parseChoiceQuestion("A. Paris\nB. London", "C");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == "Option C does not exist");
    REQUIRE(result.options.size() == 2);
    REQUIRE(result.correctAnswers.empty());

    auto marked = ChoiceFieldParser::markCorrectAnswers(result.options, { "A" });
    REQUIRE(marked[0].isCorrect);
    REQUIRE_FALSE(marked[1].isCorrect);
}
