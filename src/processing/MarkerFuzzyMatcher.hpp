#pragma once

#include "IFuzzyMatcher.hpp"
#include "ITextNormalizer.hpp"
#include <memory>

namespace processing
{

/**
 * @brief rapidfuzz-backed matcher for short label strings ("Question", "答案", "Q").
 *
 * Both sides go through NFKC + case folding, then rapidfuzz scores (0-100)
 * are scaled to [0.0, 1.0].
 *
 * Example:
 * @code
 * MarkerFuzzyMatcher matcher;
 * auto hit = matcher.findBestMatch("Qustion", {"Question", "Answer"}, 0.8);
 * // hit->matched == "Question"
 * @endcode
 */
class MarkerFuzzyMatcher : public IFuzzyMatcher
{
public:
    MarkerFuzzyMatcher();
    explicit MarkerFuzzyMatcher(std::unique_ptr<ITextNormalizer> normalizer);
    ~MarkerFuzzyMatcher() override;

    [[nodiscard]] std::optional<MatchResult> findBestMatch(const std::string& query,
                                                           const std::vector<std::string>& candidates,
                                                           double threshold,
                                                           MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    [[nodiscard]] std::vector<MatchResult> findMatches(const std::string& query,
                                                       const std::vector<std::string>& candidates, double threshold,
                                                       MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    [[nodiscard]] double similarity(const std::string& s1, const std::string& s2,
                                    MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

private:
    std::unique_ptr<ITextNormalizer> normalizer_;

    [[nodiscard]] double score(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const;
};

} // namespace processing
