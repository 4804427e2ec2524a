#pragma once

#include "../processing/TextProcessingTypes.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pipeline
{

enum class OutcomeKind
{
    Ok,      // Fields recovered with the strategy's full confidence
    Partial, // Something was recovered but fields are missing or suspect
    Failed   // Nothing usable; reason says why
};

// Value every strategy returns instead of throwing
struct StrategyOutcome
{
    OutcomeKind kind = OutcomeKind::Failed;
    text_processing::FieldMap fields;
    double confidence = 0.0;
    text_processing::ParseMethod method = text_processing::ParseMethod::Intelligent;
    std::vector<std::string> warnings;
    std::vector<text_processing::ParseIssue> issues;
    std::string reason;
    std::string patternId; // Pattern or template that produced the fields, if any

    [[nodiscard]] bool succeeded() const { return kind != OutcomeKind::Failed; }

    static StrategyOutcome ok(text_processing::FieldMap f, double c, text_processing::ParseMethod m)
    {
        StrategyOutcome o;
        o.kind = OutcomeKind::Ok;
        o.fields = std::move(f);
        o.confidence = c;
        o.method = m;
        return o;
    }

    static StrategyOutcome partial(text_processing::FieldMap f, double c, text_processing::ParseMethod m,
                                   std::vector<std::string> w)
    {
        StrategyOutcome o = ok(std::move(f), c, m);
        o.kind = OutcomeKind::Partial;
        o.warnings = std::move(w);
        return o;
    }

    static StrategyOutcome failed(std::string why, text_processing::IssueKind issue)
    {
        StrategyOutcome o;
        o.kind = OutcomeKind::Failed;
        o.issues.push_back({ issue, why });
        o.reason = std::move(why);
        return o;
    }
};

struct StrategyContext
{
    const std::string& content;                          // Preprocessed text, protected spans still masked
    const std::string& original;                         // Untouched note text
    const text_processing::CardTemplate* cardTemplate;   // Null when no template is bound
    std::size_t maxRegexInputBytes;
};

// One link of the recognition chain
class IParseStrategy
{
public:
    virtual ~IParseStrategy() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // Must not throw for ordinary input; the pipeline still converts escaping exceptions into a failed stage
    [[nodiscard]] virtual StrategyOutcome execute(const StrategyContext& context) const = 0;
};

[[nodiscard]] inline const char* toString(OutcomeKind kind)
{
    switch (kind)
    {
    case OutcomeKind::Ok:
        return "ok";
    case OutcomeKind::Partial:
        return "partial";
    case OutcomeKind::Failed:
        return "failed";
    }
    return "failed";
}

} // namespace pipeline
