#include "MarkerFuzzyMatcher.hpp"
#include "NFKCTextNormalizer.hpp"
#include <rapidfuzz/fuzz.hpp>
#include <algorithm>

namespace processing
{

MarkerFuzzyMatcher::MarkerFuzzyMatcher()
    : normalizer_(std::make_unique<NFKCTextNormalizer>(true))
{
}

MarkerFuzzyMatcher::MarkerFuzzyMatcher(std::unique_ptr<ITextNormalizer> normalizer)
    : normalizer_(normalizer ? std::move(normalizer) : std::make_unique<NFKCTextNormalizer>(true))
{
}

MarkerFuzzyMatcher::~MarkerFuzzyMatcher() = default;

std::optional<MatchResult> MarkerFuzzyMatcher::findBestMatch(const std::string& query,
                                                             const std::vector<std::string>& candidates,
                                                             double threshold, MatchAlgorithm algorithm) const
{
    auto matches = findMatches(query, candidates, threshold, algorithm);
    if (matches.empty())
        return std::nullopt;
    return matches.front();
}

std::vector<MatchResult> MarkerFuzzyMatcher::findMatches(const std::string& query,
                                                         const std::vector<std::string>& candidates,
                                                         double threshold, MatchAlgorithm algorithm) const
{
    std::vector<MatchResult> results;
    if (candidates.empty() || query.empty())
        return results;

    const std::string normalized_query = normalizer_->normalize(query);
    if (normalized_query.empty())
        return results;

    const std::vector<std::string> normalized = normalizer_->normalizeAll(candidates);
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        if (normalized[i].empty())
            continue;

        double s = score(normalized_query, normalized[i], algorithm);
        if (s >= threshold)
            results.push_back(MatchResult{ s, candidates[i], algorithm });
    }

    // Equal scores keep candidate order
    std::stable_sort(results.begin(), results.end(),
                     [](const MatchResult& a, const MatchResult& b) { return a.score > b.score; });
    return results;
}

double MarkerFuzzyMatcher::similarity(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const
{
    if (s1.empty() || s2.empty())
        return 0.0;
    return score(normalizer_->normalize(s1), normalizer_->normalize(s2), algorithm);
}

double MarkerFuzzyMatcher::score(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const
{
    double rapidfuzz_score = 0.0;
    switch (algorithm)
    {
    case MatchAlgorithm::PartialRatio:
        rapidfuzz_score = rapidfuzz::fuzz::partial_ratio(s1, s2);
        break;
    case MatchAlgorithm::TokenSortRatio:
        rapidfuzz_score = rapidfuzz::fuzz::token_sort_ratio(s1, s2);
        break;
    case MatchAlgorithm::TokenSetRatio:
        rapidfuzz_score = rapidfuzz::fuzz::token_set_ratio(s1, s2);
        break;
    case MatchAlgorithm::Ratio:
    default:
        rapidfuzz_score = rapidfuzz::fuzz::ratio(s1, s2);
        break;
    }
    return rapidfuzz_score / 100.0;
}

} // namespace processing
