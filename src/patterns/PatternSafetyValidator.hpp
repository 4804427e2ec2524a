#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace patterns
{

enum class RiskLevel
{
    Low,
    Medium,
    High,
    Critical
};

enum class ComplexityLevel
{
    Low,       // score < 20
    Medium,    // score < 50
    High,      // score < 80
    Dangerous
};

struct SafetyOptions
{
    std::size_t maxLength = 1000;
    int maxComplexity = 100;
    bool allowLookahead = true;
    bool allowBackreferences = false;
    std::chrono::milliseconds timeoutPerTest{ 1000 };
};

// Counts gathered by a single pass over the pattern source
struct PatternStructure
{
    int quantifiers = 0;
    int groups = 0;
    int characterClasses = 0;
    int alternations = 0;
    int lookaheads = 0;
    int lookbehinds = 0;
    int backreferences = 0;
    std::vector<std::string> criticalIssues;
    std::vector<std::string> highWarnings;
    std::vector<std::string> mediumWarnings;
};

struct SafetyReport
{
    bool isValid = false;
    std::optional<std::string> error;
    std::vector<std::string> warnings;
    std::vector<std::string> criticalIssues;
    std::vector<std::string> suggestions;
    std::vector<std::string> failedTests;
    RiskLevel risk = RiskLevel::Low;
    ComplexityLevel complexity = ComplexityLevel::Low;
    int complexityScore = 0;
    std::chrono::microseconds maxExecutionTime{ 0 };
    std::chrono::microseconds averageExecutionTime{ 0 };
};

/**
 * @brief ReDoS and complexity screen for user-supplied patterns.
 *
 * Static checks run first (length, lookbehind, syntax, complexity score, nested
 * quantifier shapes, lookahead/backreference policy). Patterns that pass are run
 * against adversarial inputs on a worker thread with a hard wall-clock budget per
 * input. A worker that overruns is detached; std::regex offers no way to interrupt it.
 */
class PatternSafetyValidator
{
public:
    explicit PatternSafetyValidator(SafetyOptions options = {});

    [[nodiscard]] SafetyReport validate(const std::string& pattern, const std::string& flags = "") const;

    [[nodiscard]] const SafetyOptions& options() const noexcept { return options_; }

    [[nodiscard]] static PatternStructure analyze(const std::string& pattern);
    [[nodiscard]] static int complexityScore(const std::string& pattern, const PatternStructure& structure);
    [[nodiscard]] static ComplexityLevel complexityLevel(int score);
    [[nodiscard]] static std::vector<std::string> securityAdvice(const PatternStructure& structure);

    struct AdversarialInput
    {
        std::string name;
        std::string value;
    };
    [[nodiscard]] static const std::vector<AdversarialInput>& adversarialInputs();

    [[nodiscard]] static const char* toString(RiskLevel risk);
    [[nodiscard]] static const char* toString(ComplexityLevel level);

private:
    SafetyOptions options_;
};

} // namespace patterns
