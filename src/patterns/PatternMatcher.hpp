#pragma once

#include "PatternRegistry.hpp"
#include "../processing/LanguagePatterns.hpp"
#include "../processing/TextProcessingTypes.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patterns
{

struct MatchCandidate
{
    std::shared_ptr<const ContentPattern> pattern;
    std::vector<std::string> groups;   // groups[0] is the whole match
    text_processing::FieldMap fields;  // Trimmed capture text per mapped field
    double confidence = 0.0;           // [0, 1]
    double coverage = 0.0;             // Non-whitespace share of the content the match spans
    double score = 0.0;                // Composite used for selection, not clamped
    std::uint64_t sequence = 0;
};

struct MultiMatchResult
{
    std::optional<MatchCandidate> best; // Empty when nothing matched; not an error
    std::vector<MatchCandidate> all;    // Best first
    int attempts = 0;                   // Patterns evaluated
    std::chrono::microseconds elapsed{ 0 };
    std::vector<std::string> errors;    // Patterns that threw at match time
};

/**
 * @brief Applies every registered pattern and picks the best candidate.
 *
 * Patterns are evaluated in priority order. The candidate with the highest
 * composite score wins; equal scores go to the higher priority, then to the
 * pattern registered first, so the choice is stable for a given registry.
 */
class PatternMatcher
{
public:
    PatternMatcher(const PatternRegistry& registry, const processing::LanguagePatternSets& languages);

    [[nodiscard]] MultiMatchResult match(std::string_view content) const;
    [[nodiscard]] std::optional<MatchCandidate> matchBest(std::string_view content) const;

    // Evaluates a single registered pattern; empty when the id is unknown or it does not match
    [[nodiscard]] std::optional<MatchCandidate> testPattern(const std::string& id, std::string_view content) const;

    // Non-whitespace code points of matched / of content
    [[nodiscard]] static double coverage(std::string_view matched, std::string_view content);

    [[nodiscard]] double confidenceFor(const ContentPattern& pattern, const text_processing::FieldMap& fields,
                                       double coverage) const;
    [[nodiscard]] static double compositeScore(const MatchCandidate& candidate);

    [[nodiscard]] const processing::LanguagePatternSets& languages() const { return languages_; }

private:
    // Throws std::regex_error when the engine gives up on the input
    [[nodiscard]] std::optional<MatchCandidate> evaluate(const RegisteredPattern& entry,
                                                         const std::string& content) const;

    const PatternRegistry& registry_;
    const processing::LanguagePatternSets& languages_;
};

} // namespace patterns
