#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>

#include "processing/Diagnostics.hpp"

using namespace processing;

TEST_CASE("Diagnostics - Preview", "[diagnostics]")
{
    Diagnostics::SetMaxPreview(160);

    SECTION("Control characters are escaped")
    {
        REQUIRE(Diagnostics::Preview("Q: a\nA: b\t!") == "Q: a\\nA: b\\t!");
        REQUIRE(Diagnostics::Preview(std::string("x\x01y")) == "x?y");
    }

    SECTION("Long text is cut with the full size appended")
    {
        Diagnostics::SetMaxPreview(10);
        const std::string text(25, 'a');
        REQUIRE(Diagnostics::Preview(text) == "aaaaaaaaaa... (25 bytes)");
    }

    SECTION("Multi-byte sequences are never split")
    {
        Diagnostics::SetMaxPreview(8);
        // Three 3-byte characters; only two fit in 8 bytes
        REQUIRE(Diagnostics::Preview("答案是") == "答案... (9 bytes)");
    }

    SECTION("Budget has a floor")
    {
        Diagnostics::SetMaxPreview(2);
        REQUIRE(Diagnostics::MaxPreview() == 8);
    }

    Diagnostics::SetMaxPreview(160);
}

TEST_CASE("TraceLine - key=value formatting", "[diagnostics]")
{
    const std::string line = TraceLine("RecognitionPipeline")
                                 .add("stage", "multi-pattern")
                                 .add("status", "ok")
                                 .duration(std::chrono::microseconds(412))
                                 .add("confidence", 0.85)
                                 .flag("fallback", false)
                                 .add("pattern", "")
                                 .str();
    REQUIRE(line ==
            "[RecognitionPipeline] stage=multi-pattern status=ok duration=412us confidence=0.85 fallback=false pattern=-");

    Diagnostics::SetMaxPreview(160);
    REQUIRE(TraceLine("DualModeParser").preview("input", "a\nb").str() == "[DualModeParser] input=a\\nb");
}
