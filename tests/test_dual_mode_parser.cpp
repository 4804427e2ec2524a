#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <string>

#include "patterns/BuiltinPatterns.hpp"
#include "patterns/PatternRegistry.hpp"
#include "pipeline/DualModeParser.hpp"
#include "pipeline/RecognitionPipeline.hpp"
#include "processing/LanguagePatterns.hpp"

using namespace pipeline;
using Catch::Matchers::WithinAbs;
using text_processing::CardTemplate;
using text_processing::IssueKind;

namespace
{
CardTemplate headingTemplate()
{
    CardTemplate tmpl;
    tmpl.id = "heading";
    tmpl.regex = R"(^## (.+)\n\n([\s\S]*)$)";
    tmpl.fieldMapping = { { "question", 1 }, { "answer", 2 } };
    return tmpl;
}
} // namespace

TEST_CASE("DualModeParser - lenient cascade", "[dual_mode]")
{
    DualModeParser parser;

    SECTION("Divider line")
    {
        const std::string note = "What is X?\n---div---\nX is Y, the answer.";
        auto result = parser.parse(note, ParseMode::Lenient);
        REQUIRE(result.success);
        REQUIRE(result.state == ParseState::Succeeded);
        REQUIRE(result.mode == "primary");
        REQUIRE(result.fields.at("question") == "What is X?");
        REQUIRE(result.fields.at("answer") == "X is Y, the answer.");
        REQUIRE(result.fields.at("notes") == note);
        REQUIRE_THAT(result.confidence, WithinAbs(1.0, 1e-9));
        REQUIRE_FALSE(result.error.has_value());
    }

    SECTION("Blank line between question and answer")
    {
        auto result = parser.parse("Question line\n\nAnswer text", ParseMode::Lenient);
        REQUIRE(result.mode == "fallback");
        REQUIRE(result.fields.at("answer") == "Answer text");
        REQUIRE_THAT(result.confidence, WithinAbs(0.9, 1e-9));
    }

    SECTION("First line and the rest")
    {
        auto result = parser.parse("Short\nanswer", ParseMode::Lenient);
        REQUIRE(result.mode == "simple");
        REQUIRE(result.fields.at("question") == "Short");
        REQUIRE(result.fields.at("answer") == "answer");
        REQUIRE_THAT(result.confidence, WithinAbs(0.6, 1e-9));
    }

    SECTION("Single line gets quality warnings")
    {
        auto result = parser.parse("Just one TODO", ParseMode::Lenient);
        REQUIRE(result.success);
        REQUIRE(result.fields.at("answer").empty());
        REQUIRE(result.warnings.size() == 2);
        REQUIRE_THAT(result.confidence, WithinAbs(0.55, 1e-9));
    }

    SECTION("Input is quick-normalised first")
    {
        auto result = parser.parse("Q：x\r\n\r\nanswer here!", ParseMode::Lenient);
        REQUIRE(result.mode == "fallback");
        REQUIRE(result.fields.at("question") == "Q:x");
        REQUIRE(result.fields.at("notes") == "Q：x\r\n\r\nanswer here!");
    }

    SECTION("Front/back template")
    {
        CardTemplate tmpl;
        tmpl.fieldMapping = { { "front", 1 }, { "back", 2 } };
        auto result = parser.parseLenient("Front\n\nBack side", &tmpl);
        REQUIRE(result.fields.at("front") == "Front");
        REQUIRE(result.fields.at("back") == "Back side");
    }
}

TEST_CASE("DualModeParser - preserved fallback", "[dual_mode]")
{
    SECTION("Empty note")
    {
        DualModeParser parser;
        auto result = parser.parse("", ParseMode::Lenient);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.state == ParseState::PreservedFallback);
        REQUIRE(result.fields.at("notes").empty());
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->kind == IssueKind::PatternMismatch);
        REQUIRE(result.preserved.has_value());
        REQUIRE(result.preserved->fallbackTemplateId == "emergency-basic");
        REQUIRE(result.preserved->attempts.size() == 3);
        REQUIRE(result.preserved->repairSuggestions ==
                std::vector<std::string>{ "The note is empty; write a question and an answer" });
    }

    SECTION("Oversized cloze note is preserved for the cloze template")
    {
        DualModeSettings settings;
        settings.maxRegexInputBytes = 10;
        DualModeParser parser(nullptr, settings);
        const std::string note = "The capital of France is {{c1::Paris}}.";
        auto result = parser.parse(note, ParseMode::Lenient);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.preserved->originalContent == note);
        REQUIRE(result.preserved->fallbackTemplateId == "basic-cloze");
        for (const auto& attempt : result.preserved->attempts)
        {
            REQUIRE_FALSE(attempt.success);
            REQUIRE(attempt.error.has_value());
        }
    }
}

TEST_CASE("DualModeParser - lenient with a recognition pipeline", "[dual_mode]")
{
    patterns::PatternRegistry registry;
    patterns::registerBuiltinPatterns(registry);
    processing::LanguagePatternSets languages;
    RecognitionPipeline recognizer(registry, languages);
    DualModeParser parser(&recognizer);

    SECTION("Recognised by the pipeline")
    {
        auto result = parser.parse("## What is X?\n\nX is Y.", ParseMode::Lenient);
        REQUIRE(result.success);
        REQUIRE(result.mode == "pipeline:multi-pattern");
        REQUIRE(result.fields.at("question") == "What is X?");
        REQUIRE(result.fields.at("notes") == "## What is X?\n\nX is Y.");
    }

    SECTION("Empty note still ends preserved")
    {
        auto result = parser.parse("", ParseMode::Lenient);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.preserved->fallbackTemplateId == "emergency-basic");
        REQUIRE(result.preserved->attempts.size() == 4);
        REQUIRE(result.preserved->attempts.front().strategy == "pipeline");
    }
}

TEST_CASE("DualModeParser - strict mode", "[dual_mode]")
{
    DualModeParser parser;
    const CardTemplate tmpl = headingTemplate();

    SECTION("Template match")
    {
        auto result = parser.parse("## Q\n\nA", ParseMode::Strict, &tmpl);
        REQUIRE(result.success);
        REQUIRE(result.mode == "strict-template");
        REQUIRE(result.state == ParseState::Succeeded);
        REQUIRE_THAT(result.confidence, WithinAbs(1.0, 1e-9));
        REQUIRE(result.fields.at("question") == "Q");
        REQUIRE(result.fields.at("answer") == "A");
        REQUIRE(result.fields.at("notes") == "## Q\n\nA");
    }

    SECTION("Required field empty")
    {
        auto result = parser.parseStrict("## Q\n\n", tmpl);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.state == ParseState::Failed);
        REQUIRE(result.error->kind == IssueKind::RequiredFieldEmpty);
        REQUIRE(result.error->field == "answer");
        REQUIRE(result.fields.at("notes") == "## Q\n\n");
        REQUIRE_FALSE(result.preserved.has_value());
    }

    SECTION("Mapping to a missing group")
    {
        CardTemplate gap = tmpl;
        gap.fieldMapping["answer"] = 3;
        auto result = parser.parseStrict("## Q\n\nA", gap);
        REQUIRE(result.error->kind == IssueKind::FieldMappingGap);
        REQUIRE(result.error->field == "answer");
    }

    SECTION("Invalid regex")
    {
        CardTemplate broken = tmpl;
        broken.regex = "(";
        REQUIRE(parser.parseStrict("x", broken).error->kind == IssueKind::InvalidPattern);
    }

    SECTION("No match")
    {
        auto result = parser.parseStrict("plain text", tmpl);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error->kind == IssueKind::PatternMismatch);
    }

    SECTION("No template bound")
    {
        auto result = parser.parse("## Q\n\nA", ParseMode::Strict);
        REQUIRE(result.state == ParseState::Failed);
        REQUIRE(result.error->kind == IssueKind::PatternMismatch);
    }

    SECTION("Input over the regex limit")
    {
        DualModeSettings settings;
        settings.maxRegexInputBytes = 4;
        DualModeParser small(nullptr, settings);
        REQUIRE(small.parseStrict("## Q\n\nA", tmpl).error->kind == IssueKind::PatternMismatch);
    }
}

TEST_CASE("DualModeParser - fallback template and repair hints", "[dual_mode]")
{
    REQUIRE(DualModeParser::containsClozeMarker("a {{c12::b}} c"));
    REQUIRE_FALSE(DualModeParser::containsClozeMarker("{{c::b}}"));
    REQUIRE_FALSE(DualModeParser::containsClozeMarker("{{cx"));

    REQUIRE(DualModeParser::selectFallbackTemplate("{{c1::x}}") == "basic-cloze");
    REQUIRE(DualModeParser::selectFallbackTemplate(std::string(501, 'a')) == "basic-qa");
    REQUIRE(DualModeParser::selectFallbackTemplate(std::string(500, 'a')) == "emergency-basic");

    REQUIRE(DualModeParser::repairSuggestions("a\nb").size() == 3);
    REQUIRE(DualModeParser::repairSuggestions("## Q\n\nA\n---div---\nB").empty());
    REQUIRE(DualModeParser::repairSuggestions("single line") ==
            std::vector<std::string>{ "Separate fields with a ---div--- line", "Start the question with a '## ' heading" });

    REQUIRE(std::string(toString(ParseMode::Strict)) == "strict");
    REQUIRE(std::string(toString(ParseState::PreservedFallback)) == "preserved-fallback");
}
