#pragma once

#include "IParseStrategy.hpp"

#include "../processing/FormatPreprocessor.hpp"
#include "../processing/TextProcessingTypes.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace patterns
{
class PatternRegistry;
}

namespace processing
{
class LanguagePatternSets;
}

namespace pipeline
{

struct PipelineSettings
{
    double acceptanceThreshold = 0.5;
    std::vector<std::string> strategies = { "strict-regex", "multi-pattern", "boundary",
                                            "hybrid",       "relaxed-regex", "keyword-heuristic" };
    std::size_t maxRegexInputBytes = 16384;
    std::size_t templateCacheSize = 64;
    bool preprocess = true;
    processing::PreprocessOptions preprocessOptions;
};

/**
 * @brief Top-level recognizer: runs the strategy chain and always returns a result.
 *
 * Each strategy runs inside run_stage, so an exception escaping a strategy is a
 * failed stage, not a failed call. The first outcome above the acceptance
 * threshold wins; otherwise the best successful outcome is used; otherwise a
 * first-line/remainder split is returned. Every exit path stores the untouched
 * note under fields["notes"] and in originalContent.
 */
class RecognitionPipeline
{
public:
    static constexpr double kProtectiveConfidence = 0.3;
    static constexpr const char* kProtectiveStrategy = "protective-fallback";

    RecognitionPipeline(const patterns::PatternRegistry& registry, const processing::LanguagePatternSets& languages,
                        PipelineSettings settings = {});
    ~RecognitionPipeline();

    RecognitionPipeline(const RecognitionPipeline&) = delete;
    RecognitionPipeline& operator=(const RecognitionPipeline&) = delete;

    [[nodiscard]] text_processing::EnhancedParseResult parse(const std::string& content,
                                                             const text_processing::CardTemplate* tmpl = nullptr) const;
    [[nodiscard]] text_processing::EnhancedParseResult parseWithPipeline(
        const std::string& content, const text_processing::CardTemplate& tmpl) const;

    // Replaces the chain; names come from IParseStrategy::name()
    void setStrategies(std::vector<std::unique_ptr<IParseStrategy>> strategies);
    void addStrategy(std::unique_ptr<IParseStrategy> strategy, std::optional<std::size_t> position = std::nullopt);
    [[nodiscard]] std::vector<std::string> strategyNames() const;

    // Built-in strategy by name, nullptr when unknown
    [[nodiscard]] std::unique_ptr<IParseStrategy> makeStrategy(const std::string& name) const;

    void setAcceptanceThreshold(double threshold);
    [[nodiscard]] const PipelineSettings& settings() const;

    // First non-blank line / remainder split used when every strategy failed
    [[nodiscard]] static text_processing::EnhancedParseResult protectiveResult(
        const std::string& original, const text_processing::CardTemplate* tmpl = nullptr);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pipeline
