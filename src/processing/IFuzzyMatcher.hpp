#pragma once

#include <optional>
#include <string>
#include <vector>

namespace processing
{

enum class MatchAlgorithm
{
    Ratio,          // Levenshtein-based ratio
    PartialRatio,   // Best matching substring ("answer" inside "the answer is")
    TokenSortRatio, // Order-independent tokens
    TokenSetRatio   // Set-based tokens
};

struct MatchResult
{
    double score;             // Similarity in [0.0, 1.0]
    std::string matched;      // Candidate as supplied by the caller
    MatchAlgorithm algorithm;
};

/**
 * @brief Approximate string matching used to recognise misspelled Q/A labels.
 *
 * Implementations normalise both sides before scoring so that width and case
 * variants ("ＱＵＥＳＴＩＯＮ", "question") compare equal.
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Best candidate whose score reaches the threshold.
     * @return std::nullopt when nothing reaches the threshold
     */
    [[nodiscard]] virtual std::optional<MatchResult> findBestMatch(const std::string& query,
                                                                   const std::vector<std::string>& candidates,
                                                                   double threshold,
                                                                   MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    // All candidates reaching the threshold, best first
    [[nodiscard]] virtual std::vector<MatchResult> findMatches(const std::string& query,
                                                               const std::vector<std::string>& candidates,
                                                               double threshold,
                                                               MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    [[nodiscard]] virtual double similarity(const std::string& s1, const std::string& s2,
                                            MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;
};

} // namespace processing
