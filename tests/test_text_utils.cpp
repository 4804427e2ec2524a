#include <catch2/catch_test_macros.hpp>
#include <string>

#include "processing/TextNormalizer.hpp"
#include "processing/TextUtils.hpp"

using namespace processing;

TEST_CASE("TextUtils - trim strips ASCII and Unicode whitespace", "[text_utils]")
{
    SECTION("ASCII edges")
    {
        REQUIRE(trim("  hello \t\n") == "hello");
        REQUIRE(trim("") == "");
        REQUIRE(trim(" \n\t ") == "");
    }

    SECTION("Ideographic space and NBSP")
    {
        REQUIRE(trim("\xE3\x80\x80问题\xE3\x80\x80") == "问题");
        REQUIRE(trim("\xC2\xA0text\xC2\xA0") == "text");
    }

    SECTION("Inner whitespace is kept")
    {
        REQUIRE(trim("  a  b  ") == "a  b");
    }
}

TEST_CASE("TextUtils - code point counting", "[text_utils]")
{
    REQUIRE(codepointCount("abc") == 3);
    REQUIRE(codepointCount("问题") == 2);
    REQUIRE(codepointCount("") == 0);

    REQUIRE(countNonWhitespace("a b\nc") == 3);
    REQUIRE(countNonWhitespace("什么 是\n递归") == 5);
    REQUIRE(countNonWhitespace(" \n\t") == 0);
}

TEST_CASE("TextUtils - splitLines and joinLines round trip", "[text_utils]")
{
    const std::string text = "first\n\nthird\n";
    auto lines = splitLines(text);
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0] == "first");
    REQUIRE(lines[1].empty());
    REQUIRE(lines[3].empty());
    REQUIRE(joinLines(lines, 0, lines.size()) == text);
    REQUIRE(joinLines(lines, 2, 3) == "third");
    REQUIRE(joinLines(lines, 1, 100) == "\nthird\n");
}

TEST_CASE("TextUtils - UTF-8 conversion", "[text_utils]")
{
    SECTION("Round trip keeps CJK text")
    {
        const std::string text = "答案：函数调用自身。";
        REQUIRE(utf32ToUtf8(utf8ToUtf32(text)) == text);
    }

    SECTION("Invalid bytes become replacement characters")
    {
        auto cps = utf8ToUtf32("a\xFF" "b");
        REQUIRE(cps.size() == 3);
        REQUIRE(cps[1] == char32_t{ 0xFFFD });
    }
}

TEST_CASE("TextUtils - prefix helpers", "[text_utils]")
{
    REQUIRE(startsWith("Question: x", "Question"));
    REQUIRE_FALSE(startsWith("Q", "Question"));
    REQUIRE(endsWith("note.md", ".md"));
    REQUIRE(startsWithIgnoreCase("QUESTION: x", "question"));
    REQUIRE(toLowerAscii("AbC") == "abc");
}

TEST_CASE("TextNormalizer - normalize_line_endings", "[text_utils][normalizer]")
{
    REQUIRE(normalize_line_endings("Line 1\r\nLine 2\r\nLine 3") == "Line 1\nLine 2\nLine 3");
    REQUIRE(normalize_line_endings("Line 1\rLine 2") == "Line 1\nLine 2");
    REQUIRE(normalize_line_endings("Line 1\r\nLine 2\nLine 3\rLine 4") == "Line 1\nLine 2\nLine 3\nLine 4");
    REQUIRE(normalize_line_endings("问题\r\n答案") == "问题\n答案");
    REQUIRE(normalize_line_endings("") == "");
}

TEST_CASE("TextNormalizer - collapse_newlines caps blank runs", "[text_utils][normalizer]")
{
    REQUIRE(collapse_newlines("a\n\n\n\n\nb") == "a\n\n\nb");
    REQUIRE(collapse_newlines("a\n\nb") == "a\n\nb");
    REQUIRE(collapse_newlines("a\n\n\nb", 2) == "a\n\nb");
}

TEST_CASE("TextNormalizer - expand_tabs", "[text_utils][normalizer]")
{
    REQUIRE(expand_tabs("a\tb") == "a    b");
    REQUIRE(expand_tabs("a\tb", 2) == "a  b");
    REQUIRE(expand_tabs("plain") == "plain");
}
