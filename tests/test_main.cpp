// Catch2WithMain provides main()

#include <catch2/catch_test_macros.hpp>

#include "patterns/BuiltinPatterns.hpp"
#include "patterns/PatternRegistry.hpp"
#include "pipeline/RecognitionPipeline.hpp"
#include "processing/LanguagePatterns.hpp"

TEST_CASE("Smoke test - a heading note becomes a card", "[smoke]")
{
    patterns::PatternRegistry registry;
    patterns::registerBuiltinPatterns(registry);
    processing::LanguagePatternSets languages;
    pipeline::RecognitionPipeline recognizer(registry, languages);

    auto result = recognizer.parse("## Question\n\nAnswer");
    REQUIRE(result.success);
    REQUIRE(result.fields.at("answer") == "Answer");
}
