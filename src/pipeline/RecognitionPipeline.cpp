#include "RecognitionPipeline.hpp"
#include "Strategies.hpp"

#include "../boundary/BoundaryDetector.hpp"
#include "../patterns/PatternMatcher.hpp"
#include "../patterns/PatternRegistry.hpp"
#include "../patterns/RegexCompiler.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/LanguagePatterns.hpp"
#include "../processing/StageRunner.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>

#include <plog/Log.h>

namespace pipeline
{

using processing::Diagnostics;
using processing::TraceLine;
using text_processing::EnhancedParseResult;
using text_processing::IssueKind;

namespace
{

void logInput(const std::string& input, const text_processing::CardTemplate* tmpl)
{
    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << TraceLine("RecognitionPipeline")
                                                     .add("stage", "input")
                                                     .add("template", tmpl ? tmpl->id : std::string("none"))
                                                     .preview("raw", input)
                                                     .str();
    }
}

void logStrategy(const text_processing::StageResult<StrategyOutcome>& stage, const std::string& name)
{
    if (!Diagnostics::IsVerbose())
        return;

    TraceLine line("RecognitionPipeline");
    line.add("stage", name);
    if (!stage.succeeded)
    {
        line.add("status", "error").duration(stage.duration).add("reason", stage.error.value_or("unknown"));
        PLOG_ERROR_(Diagnostics::kLogInstance) << line.str();
        return;
    }

    const StrategyOutcome& outcome = stage.result;
    line.add("status", toString(outcome.kind)).duration(stage.duration);
    if (outcome.succeeded())
        line.add("confidence", outcome.confidence);
    else
        line.add("reason", outcome.reason);
    if (!outcome.patternId.empty())
        line.add("pattern", outcome.patternId);
    PLOG_INFO_(Diagnostics::kLogInstance) << line.str();
}

void logCompletion(const EnhancedParseResult& result)
{
    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << TraceLine("RecognitionPipeline")
                                                     .add("stage", "complete")
                                                     .add("strategy", result.strategy)
                                                     .flag("success", result.success)
                                                     .add("confidence", result.confidence)
                                                     .add("method", text_processing::toString(result.method))
                                                     .str();
    }
}

} // namespace

struct RecognitionPipeline::Impl
{
    Impl(const patterns::PatternRegistry& reg, const processing::LanguagePatternSets& langs, PipelineSettings s)
        : registry(reg)
        , languages(langs)
        , settings(std::move(s))
        , matcher(reg, langs)
        , detector(langs)
        , cache(settings.templateCacheSize)
    {
    }

    // Replaces placeholders in every field and seals the result with the untouched note
    EnhancedParseResult seal(StrategyOutcome outcome, const std::string& strategy, const std::string& original,
                             const std::vector<processing::PreservedSpan>& spans) const
    {
        EnhancedParseResult result;
        result.success = true;
        result.confidence = outcome.confidence;
        result.method = outcome.method;
        result.strategy = strategy;
        result.warnings = std::move(outcome.warnings);
        for (auto& [field, value] : outcome.fields)
            result.fields[field] = spans.empty() ? std::move(value) : processing::FormatPreprocessor::restore(value, spans);
        result.fields[text_processing::kNotesField] = original;
        result.originalContent = original;
        return result;
    }

    const patterns::PatternRegistry& registry;
    const processing::LanguagePatternSets& languages;
    PipelineSettings settings;
    patterns::PatternMatcher matcher;
    boundary::BoundaryDetector detector;
    mutable patterns::RegexCache cache;
    processing::FormatPreprocessor preprocessor;
    std::vector<std::unique_ptr<IParseStrategy>> strategies;
};

RecognitionPipeline::RecognitionPipeline(const patterns::PatternRegistry& registry,
                                         const processing::LanguagePatternSets& languages, PipelineSettings settings)
    : impl_(std::make_unique<Impl>(registry, languages, std::move(settings)))
{
    for (const auto& name : impl_->settings.strategies)
    {
        if (auto strategy = makeStrategy(name))
        {
            impl_->strategies.push_back(std::move(strategy));
        }
        else
        {
            PLOG_WARNING_(Diagnostics::kLogInstance)
                << TraceLine("RecognitionPipeline").add("stage", "configure").add("skipped", name).str();
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Unknown recognition strategy",
                                                name);
        }
    }
}

RecognitionPipeline::~RecognitionPipeline() = default;

std::unique_ptr<IParseStrategy> RecognitionPipeline::makeStrategy(const std::string& name) const
{
    if (name == "strict-regex")
        return std::make_unique<StrictRegexStrategy>(impl_->cache);
    if (name == "multi-pattern")
        return std::make_unique<MultiPatternStrategy>(impl_->matcher);
    if (name == "boundary")
        return std::make_unique<BoundaryStrategy>(impl_->detector);
    if (name == "hybrid")
        return std::make_unique<HybridStrategy>(impl_->matcher, impl_->detector);
    if (name == "relaxed-regex")
        return std::make_unique<RelaxedRegexStrategy>(impl_->cache);
    if (name == "keyword-heuristic")
        return std::make_unique<KeywordHeuristicStrategy>(impl_->languages);
    return nullptr;
}

void RecognitionPipeline::setStrategies(std::vector<std::unique_ptr<IParseStrategy>> strategies)
{
    strategies.erase(std::remove(strategies.begin(), strategies.end(), nullptr), strategies.end());
    impl_->strategies = std::move(strategies);
}

void RecognitionPipeline::addStrategy(std::unique_ptr<IParseStrategy> strategy, std::optional<std::size_t> position)
{
    if (!strategy)
        return;
    auto& list = impl_->strategies;
    const std::size_t at = std::min(position.value_or(list.size()), list.size());
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(at), std::move(strategy));
}

std::vector<std::string> RecognitionPipeline::strategyNames() const
{
    std::vector<std::string> names;
    for (const auto& s : impl_->strategies)
        names.push_back(s->name());
    return names;
}

void RecognitionPipeline::setAcceptanceThreshold(double threshold)
{
    impl_->settings.acceptanceThreshold = std::clamp(threshold, 0.0, 1.0);
}

const PipelineSettings& RecognitionPipeline::settings() const
{
    return impl_->settings;
}

EnhancedParseResult RecognitionPipeline::protectiveResult(const std::string& original,
                                                          const text_processing::CardTemplate* tmpl)
{
    EnhancedParseResult result;
    result.originalContent = original;
    result.strategy = kProtectiveStrategy;
    result.method = text_processing::ParseMethod::Intelligent;
    result.fields[text_processing::kNotesField] = original;

    std::vector<std::string> lines;
    for (const auto& line : processing::splitLines(original))
    {
        if (!processing::trim(line).empty())
            lines.push_back(line);
    }
    if (lines.empty())
    {
        result.success = false;
        result.confidence = 0.0;
        result.warnings.emplace_back("Note is empty; nothing to recognise");
        result.issues.push_back({ IssueKind::PatternMismatch, "Note is empty" });
        return result;
    }

    text_processing::FieldMap fields{ { "question", processing::trim(lines.front()) },
                                      { "answer", processing::trim(processing::joinLines(lines, 1, lines.size())) } };
    for (auto& [field, value] : alignToTemplate(std::move(fields), tmpl))
        result.fields[field] = std::move(value);

    result.success = true;
    result.confidence = kProtectiveConfidence;
    result.warnings.emplace_back("No strategy recognised the note; the first line was used as the question");
    result.warnings.emplace_back("The original text is preserved in the notes field");
    return result;
}

EnhancedParseResult RecognitionPipeline::parseWithPipeline(const std::string& content,
                                                           const text_processing::CardTemplate& tmpl) const
{
    return parse(content, &tmpl);
}

EnhancedParseResult RecognitionPipeline::parse(const std::string& content, const text_processing::CardTemplate* tmpl) const
{
    PROFILE_SCOPE_CUSTOM("RecognitionPipeline::parse");
    logInput(content, tmpl);

    std::string text = content;
    std::vector<processing::PreservedSpan> spans;
    std::vector<std::string> notes;
    if (impl_->settings.preprocess)
    {
        auto pre = processing::run_stage<processing::PreprocessResult>("preprocess", [&]() {
            return impl_->preprocessor.normalize(content, impl_->settings.preprocessOptions);
        });
        if (pre.succeeded)
        {
            text = std::move(pre.result.masked);
            spans = std::move(pre.result.preservedSpans);
        }
        else
        {
            notes.push_back("Preprocessing failed; recognising the raw text");
        }
    }

    const StrategyContext ctx{ text, content, tmpl, impl_->settings.maxRegexInputBytes };
    std::vector<text_processing::StrategyTrace> traces;
    std::vector<text_processing::ParseIssue> issues;
    std::optional<StrategyOutcome> best;
    std::string best_name;

    auto finish = [&](EnhancedParseResult result) {
        result.attempts = std::move(traces);
        result.issues.insert(result.issues.begin(), issues.begin(), issues.end());
        result.warnings.insert(result.warnings.begin(), notes.begin(), notes.end());
        logCompletion(result);
        return result;
    };

    for (const auto& strategy : impl_->strategies)
    {
        const std::string name = strategy->name();
        auto stage = processing::run_stage<StrategyOutcome>(name, [&]() { return strategy->execute(ctx); });
        logStrategy(stage, name);

        StrategyOutcome outcome = stage.succeeded
                                      ? std::move(stage.result)
                                      : StrategyOutcome::failed("Strategy raised: " + stage.error.value_or("unknown"),
                                                                IssueKind::PatternMismatch);

        text_processing::StrategyTrace trace;
        trace.strategy = name;
        trace.succeeded = outcome.succeeded();
        trace.confidence = outcome.confidence;
        trace.duration = stage.duration;
        if (!outcome.succeeded())
            trace.reason = outcome.reason;
        traces.push_back(std::move(trace));

        for (auto& issue : outcome.issues)
            issues.push_back({ issue.kind, name + ": " + issue.message });
        outcome.issues.clear();

        if (!outcome.succeeded())
            continue;

        if (outcome.confidence > impl_->settings.acceptanceThreshold)
            return finish(impl_->seal(std::move(outcome), name, content, spans));

        issues.push_back({ IssueKind::LowConfidence,
                           name + ": confidence " + std::to_string(outcome.confidence) + " is below the threshold" });
        if (!best || outcome.confidence > best->confidence)
        {
            best = std::move(outcome);
            best_name = name;
        }
    }

    if (best)
    {
        EnhancedParseResult result = impl_->seal(std::move(*best), best_name, content, spans);
        result.warnings.emplace_back("No strategy reached the acceptance threshold; using the best partial result");
        return finish(std::move(result));
    }

    PLOG_WARNING_(Diagnostics::kLogInstance)
        << TraceLine("RecognitionPipeline").add("stage", "fallback").add("status", "protective").preview("input", content).str();
    return finish(protectiveResult(content, tmpl));
}

} // namespace pipeline
