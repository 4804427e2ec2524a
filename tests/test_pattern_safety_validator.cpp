#include <catch2/catch_test_macros.hpp>
#include <string>

#include "patterns/PatternSafetyValidator.hpp"

using namespace patterns;

TEST_CASE("PatternSafetyValidator - static rejections", "[safety]")
{
    PatternSafetyValidator validator;

    SECTION("Empty pattern")
    {
        auto report = validator.validate("");
        REQUIRE_FALSE(report.isValid);
        REQUIRE(report.error == "Pattern is empty");
    }

    SECTION("Pattern over the length limit")
    {
        auto report = validator.validate(std::string(1001, 'a'));
        REQUIRE_FALSE(report.isValid);
        REQUIRE(report.error == "Pattern is longer than 1000 characters");
    }

    SECTION("Lookbehind is refused before compiling")
    {
        auto report = validator.validate("(?<=a)b");
        REQUIRE_FALSE(report.isValid);
        REQUIRE(report.error == "Lookbehind assertions are not supported");
    }

    SECTION("Syntax errors are reported")
    {
        auto report = validator.validate("(abc");
        REQUIRE_FALSE(report.isValid);
        REQUIRE(report.error.has_value());
        REQUIRE(report.error->rfind("Syntax error: ", 0) == 0);
    }

    SECTION("Backreferences are refused by default")
    {
        auto report = validator.validate("(a)\\1");
        REQUIRE_FALSE(report.isValid);
        REQUIRE(report.error == "Backreferences are not allowed");
        REQUIRE(report.risk == RiskLevel::Medium);
    }

    SECTION("Lookahead can be switched off")
    {
        SafetyOptions options;
        options.allowLookahead = false;
        PatternSafetyValidator strict(options);
        auto report = strict.validate("a(?=b)");
        REQUIRE_FALSE(report.isValid);
        REQUIRE(report.error == "Lookahead assertions are disabled");
    }

    SECTION("Complexity ceiling")
    {
        SafetyOptions options;
        options.maxComplexity = 10;
        PatternSafetyValidator strict(options);
        auto report = strict.validate("(a)(b)(c)(d)");
        REQUIRE_FALSE(report.isValid);
        REQUIRE(report.complexityScore == 13);
        REQUIRE(report.error == "Pattern is too complex (score 13 > 10)");
    }
}

TEST_CASE("PatternSafetyValidator - nested quantifiers are critical", "[safety]")
{
    PatternSafetyValidator validator;

    for (const std::string pattern : { "(a+)+", "(a*)*", "(x+y)+" })
    {
        auto report = validator.validate(pattern);
        INFO(pattern);
        REQUIRE_FALSE(report.isValid);
        REQUIRE(report.risk == RiskLevel::Critical);
        REQUIRE(report.error == "Catastrophic backtracking risk");
        REQUIRE_FALSE(report.criticalIssues.empty());
        REQUIRE_FALSE(report.suggestions.empty());
    }
}

TEST_CASE("PatternSafetyValidator - ordinary note patterns pass", "[safety]")
{
    PatternSafetyValidator validator;

    SECTION("Heading question with a free answer")
    {
        auto report = validator.validate(R"(^## (.+)\n([\s\S]*)$)");
        REQUIRE(report.isValid);
        REQUIRE_FALSE(report.error.has_value());
        REQUIRE(report.risk == RiskLevel::Low);
        REQUIRE(report.complexityScore == 20);
        REQUIRE(report.complexity == ComplexityLevel::Medium);
        REQUIRE(report.failedTests.empty());
    }

    SECTION("Quantified alternation is high risk but still accepted when fast")
    {
        auto report = validator.validate("(a|b)+");
        REQUIRE(report.isValid);
        REQUIRE(report.risk == RiskLevel::High);
        REQUIRE_FALSE(report.warnings.empty());
    }

    SECTION("Backreferences pass when allowed")
    {
        SafetyOptions options;
        options.allowBackreferences = true;
        PatternSafetyValidator permissive(options);
        REQUIRE(permissive.validate("(a)\\1").isValid);
    }
}

TEST_CASE("PatternSafetyValidator - adversarial inputs catch slow patterns", "[safety][redos]")
{
    SafetyOptions options;
    options.timeoutPerTest = std::chrono::milliseconds(50);
    PatternSafetyValidator validator(options);

    auto report = validator.validate("(a|aa)+$");
    REQUIRE_FALSE(report.isValid);
    REQUIRE(report.risk == RiskLevel::Critical);
    REQUIRE(report.error == "Matching exceeded the time budget; possible ReDoS");
    REQUIRE(report.failedTests.size() == 1);
}

TEST_CASE("PatternSafetyValidator - structure and scoring", "[safety]")
{
    SECTION("Counts")
    {
        auto st = PatternSafetyValidator::analyze(R"(^(?:Q|Question):\s*([^\n]+)$)");
        REQUIRE(st.groups == 2);
        REQUIRE(st.alternations == 1);
        REQUIRE(st.characterClasses == 1);
        REQUIRE(st.quantifiers == 2);
        REQUIRE(st.criticalIssues.empty());
    }

    SECTION("Escaped parentheses are not groups")
    {
        auto st = PatternSafetyValidator::analyze(R"(\(a\)+)");
        REQUIRE(st.groups == 0);
        REQUIRE(st.criticalIssues.empty());
    }

    SECTION("Large counted ranges are flagged")
    {
        auto st = PatternSafetyValidator::analyze("a{1,5000}");
        REQUIRE(st.mediumWarnings.size() == 1);
    }

    SECTION("Braces around non-digits are literal")
    {
        auto st = PatternSafetyValidator::analyze("a{é}");
        REQUIRE(st.quantifiers == 0);
        auto ranged = PatternSafetyValidator::analyze("a{1,é}");
        REQUIRE(ranged.quantifiers == 0);
        REQUIRE(ranged.criticalIssues.empty());
    }

    SECTION("Competing wildcards are flagged")
    {
        auto st = PatternSafetyValidator::analyze("(.*)=(.*)");
        REQUIRE(st.mediumWarnings.size() == 1);
    }

    SECTION("Score formula")
    {
        const std::string pattern = "abc";
        REQUIRE(PatternSafetyValidator::complexityScore(pattern, PatternSafetyValidator::analyze(pattern)) == 0);
        const std::string grouped = "(a+)";
        // 0.4 + 5 + 3
        REQUIRE(PatternSafetyValidator::complexityScore(grouped, PatternSafetyValidator::analyze(grouped)) == 8);
    }

    SECTION("Level thresholds")
    {
        REQUIRE(PatternSafetyValidator::complexityLevel(19) == ComplexityLevel::Low);
        REQUIRE(PatternSafetyValidator::complexityLevel(20) == ComplexityLevel::Medium);
        REQUIRE(PatternSafetyValidator::complexityLevel(50) == ComplexityLevel::High);
        REQUIRE(PatternSafetyValidator::complexityLevel(80) == ComplexityLevel::Dangerous);
        REQUIRE(std::string(PatternSafetyValidator::toString(ComplexityLevel::Dangerous)) == "dangerous");
        REQUIRE(std::string(PatternSafetyValidator::toString(RiskLevel::Critical)) == "critical");
    }

    SECTION("Adversarial table")
    {
        REQUIRE(PatternSafetyValidator::adversarialInputs().size() == 12);
    }
}
