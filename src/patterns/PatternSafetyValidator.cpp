#include "PatternSafetyValidator.hpp"
#include "RegexCompiler.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <limits>
#include <memory>
#include <regex>
#include <system_error>
#include <thread>

namespace patterns
{

namespace
{

struct Quantifier
{
    bool present = false;
    bool unbounded = false;
    long min = 1;
    long max = 1;
    std::size_t length = 0;
};

bool allDigits(const std::string& text)
{
    return std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

// Reads a quantifier ("*", "+", "?", "{n}", "{n,}", "{n,m}", each optionally lazy) at pos
Quantifier readQuantifier(const std::string& p, std::size_t pos)
{
    Quantifier q;
    if (pos >= p.size())
        return q;

    const char c = p[pos];
    std::size_t len = 0;
    if (c == '*' || c == '+')
    {
        q.present = true;
        q.unbounded = true;
        q.min = c == '+' ? 1 : 0;
        q.max = std::numeric_limits<long>::max();
        len = 1;
    }
    else if (c == '?')
    {
        q.present = true;
        q.min = 0;
        q.max = 1;
        len = 1;
    }
    else if (c == '{')
    {
        const std::size_t close = p.find('}', pos);
        if (close == std::string::npos)
            return q;
        const std::string body = p.substr(pos + 1, close - pos - 1);
        const std::size_t comma = body.find(',');
        const std::string lo = body.substr(0, comma);
        if (lo.empty() || !allDigits(lo))
            return q;
        q.present = true;
        q.min = std::stol(lo.substr(0, 9));
        if (comma == std::string::npos)
        {
            q.max = q.min;
        }
        else
        {
            const std::string hi = body.substr(comma + 1);
            if (hi.empty())
            {
                q.unbounded = true;
                q.max = std::numeric_limits<long>::max();
            }
            else if (allDigits(hi))
            {
                q.max = std::stol(hi.substr(0, 9));
            }
            else
            {
                q.present = false;
                return q;
            }
        }
        len = close - pos + 1;
    }

    if (q.present && pos + len < p.size() && p[pos + len] == '?')
        ++len;
    q.length = len;
    return q;
}

struct Frame
{
    bool hasUnbounded = false;
    bool hasAlternation = false;
    bool lookaround = false;
};

void addOnce(std::vector<std::string>& list, const std::string& message)
{
    if (std::find(list.begin(), list.end(), message) == list.end())
        list.push_back(message);
}

struct TimedRun
{
    bool finished = false;
    std::chrono::microseconds elapsed{ 0 };
    std::optional<std::string> error;
};

TimedRun searchWithBudget(const CompiledRegex& regex, const std::string& input, std::chrono::milliseconds budget)
{
    using namespace std::chrono;

    TimedRun run;
    auto promise = std::make_shared<std::promise<microseconds>>();
    auto future = promise->get_future();

    try
    {
        std::thread worker([regex, input, promise]() {
            PROFILE_THREAD_NAME("pattern-safety");
            try
            {
                const auto start = steady_clock::now();
                std::smatch match;
                std::regex_search(input, match, *regex);
                promise->set_value(duration_cast<microseconds>(steady_clock::now() - start));
            }
            catch (const std::exception&)
            {
                promise->set_exception(std::current_exception());
            }
        });
        worker.detach();
    }
    catch (const std::system_error& ex)
    {
        run.error = std::string("could not start test thread: ") + ex.what();
        return run;
    }

    if (future.wait_for(budget) != std::future_status::ready)
    {
        run.elapsed = duration_cast<microseconds>(budget);
        run.error = "exceeded " + std::to_string(budget.count()) + "ms budget";
        return run;
    }

    try
    {
        run.elapsed = future.get();
        run.finished = true;
    }
    catch (const std::regex_error& ex)
    {
        run.error = std::string("regex engine error: ") + ex.what();
    }
    catch (const std::exception& ex)
    {
        run.error = ex.what();
    }
    return run;
}

} // namespace

PatternSafetyValidator::PatternSafetyValidator(SafetyOptions options)
    : options_(std::move(options))
{
}

PatternStructure PatternSafetyValidator::analyze(const std::string& p)
{
    PatternStructure s;
    std::vector<Frame> frames(1);
    int lookaround_depth = 0;
    int unbounded_wildcards = 0;
    bool reported_large = false;

    auto applyQuantifier = [&](std::size_t& i, bool wildcard) {
        Quantifier q = readQuantifier(p, i);
        if (!q.present)
            return;
        ++s.quantifiers;
        if (q.unbounded)
        {
            frames.back().hasUnbounded = true;
            if (wildcard)
                ++unbounded_wildcards;
        }
        if (!reported_large && (q.min > 100 || (!q.unbounded && q.max > 1000)))
        {
            s.mediumWarnings.push_back("Large repetition range; bounded counters above 1000 are slow to match");
            reported_large = true;
        }
        i += q.length;
    };

    std::size_t i = 0;
    while (i < p.size())
    {
        const char c = p[i];
        if (c == '\\')
        {
            if (i + 1 < p.size() && p[i + 1] >= '1' && p[i + 1] <= '9')
                ++s.backreferences;
            i += 2;
            applyQuantifier(i, false);
        }
        else if (c == '[')
        {
            ++s.characterClasses;
            std::size_t j = i + 1;
            if (j < p.size() && p[j] == '^')
                ++j;
            if (j < p.size() && p[j] == ']')
                ++j;
            while (j < p.size() && p[j] != ']')
                j += p[j] == '\\' ? 2 : 1;
            i = std::min(j + 1, p.size());
            applyQuantifier(i, false);
        }
        else if (c == '(')
        {
            ++s.groups;
            Frame frame;
            std::size_t prefix = 1;
            if (i + 1 < p.size() && p[i + 1] == '?')
            {
                const char kind = i + 2 < p.size() ? p[i + 2] : '\0';
                if (kind == '=' || kind == '!')
                {
                    ++s.lookaheads;
                    frame.lookaround = true;
                    prefix = 3;
                }
                else if (kind == '<' && i + 3 < p.size() && (p[i + 3] == '=' || p[i + 3] == '!'))
                {
                    ++s.lookbehinds;
                    frame.lookaround = true;
                    prefix = 4;
                }
                else
                {
                    prefix = 3;
                }
            }
            if (frame.lookaround)
            {
                if (lookaround_depth > 0)
                    addOnce(s.highWarnings, "Nested lookaround assertions");
                ++lookaround_depth;
            }
            frames.push_back(frame);
            i += prefix;
        }
        else if (c == ')')
        {
            ++i;
            if (frames.size() < 2)
                continue; // Unbalanced; the compiler reports it

            Frame closed = frames.back();
            frames.pop_back();
            if (closed.lookaround)
                --lookaround_depth;

            Quantifier q = readQuantifier(p, i);
            if (q.present)
            {
                ++s.quantifiers;
                const bool repeats = q.unbounded || q.max > 1;
                if (q.unbounded && closed.hasUnbounded)
                    addOnce(s.criticalIssues,
                            "Nested quantifier: a repeated group contains an unbounded quantifier, as in (a+)+");
                else if (repeats && closed.hasUnbounded)
                    addOnce(s.highWarnings, "Counted repetition of a group that contains a quantifier");
                if (repeats && closed.hasAlternation)
                    addOnce(s.highWarnings, "Quantified alternation; overlapping branches backtrack heavily");
                i += q.length;
            }
            frames.back().hasUnbounded = frames.back().hasUnbounded || closed.hasUnbounded || q.unbounded;
        }
        else if (c == '|')
        {
            ++s.alternations;
            frames.back().hasAlternation = true;
            ++i;
        }
        else if (c == '^' || c == '$')
        {
            ++i;
        }
        else
        {
            ++i;
            applyQuantifier(i, c == '.');
        }
    }

    if (unbounded_wildcards >= 2)
        s.mediumWarnings.push_back("Several unbounded wildcards (.* or .+) compete for the same text");
    if (s.lookaheads > 0)
        s.mediumWarnings.push_back(std::to_string(s.lookaheads) + " lookahead assertion(s) add matching cost");
    if (s.backreferences > 0)
        s.mediumWarnings.push_back(std::to_string(s.backreferences) + " backreference(s) add matching cost");
    return s;
}

int PatternSafetyValidator::complexityScore(const std::string& pattern, const PatternStructure& st)
{
    const double score = static_cast<double>(pattern.size()) * 0.1 + st.quantifiers * 5.0 + st.groups * 3.0 +
                         st.characterClasses * 2.0 + st.alternations * 4.0 +
                         (st.lookaheads + st.lookbehinds) * 10.0 + st.backreferences * 8.0;
    return static_cast<int>(std::lround(score));
}

ComplexityLevel PatternSafetyValidator::complexityLevel(int score)
{
    if (score < 20)
        return ComplexityLevel::Low;
    if (score < 50)
        return ComplexityLevel::Medium;
    if (score < 80)
        return ComplexityLevel::High;
    return ComplexityLevel::Dangerous;
}

std::vector<std::string> PatternSafetyValidator::securityAdvice(const PatternStructure& st)
{
    std::vector<std::string> advice;
    if (!st.criticalIssues.empty())
        advice.emplace_back("Do not repeat a group that already contains + or *; use a single quantifier such as a+");
    if (!st.highWarnings.empty())
        advice.emplace_back("Make alternation branches mutually exclusive or anchor the repeated part");
    if (st.quantifiers > 6 || st.groups > 6)
        advice.emplace_back("Split the expression into several simpler patterns");
    if (st.lookaheads > 0 || st.lookbehinds > 0)
        advice.emplace_back("Lookaround assertions are costly; prefer explicit delimiters");
    if (st.backreferences > 0)
        advice.emplace_back("Backreferences are not allowed in custom patterns; match the text explicitly");
    return advice;
}

const std::vector<PatternSafetyValidator::AdversarialInput>& PatternSafetyValidator::adversarialInputs()
{
    static const std::vector<AdversarialInput> inputs = [] {
        auto repeat = [](const std::string& unit, std::size_t count) {
            std::string out;
            out.reserve(unit.size() * count);
            for (std::size_t i = 0; i < count; ++i)
                out += unit;
            return out;
        };
        return std::vector<AdversarialInput>{
            { "short", "abc123" },
            { "medium", repeat("a", 50) + repeat("b", 50) },
            { "long", repeat("x", 1000) },
            { "repeated-unit", repeat("abcabc", 100) },
            { "partial-match", repeat("a", 100) + "X" },
            { "no-match", repeat("z", 100) },
            { "empty", "" },
            { "punctuation", "!@#$%^&*()[]{}|\\:\";'<>?,./" },
            { "mixed-runs", repeat("a", 50) + repeat("b", 50) + "X" },
            { "alternating", repeat("ab", 50) + "X" },
            { "nested-runs", repeat("a", 30) + repeat("b", 30) + repeat("c", 30) + "X" },
            { "multiline", "## " + repeat("q", 40) + "\n\n" + repeat("answer line\n", 40) },
        };
    }();
    return inputs;
}

SafetyReport PatternSafetyValidator::validate(const std::string& pattern, const std::string& flags) const
{
    PROFILE_SCOPE_FUNCTION();

    SafetyReport report;
    if (pattern.empty())
    {
        report.error = "Pattern is empty";
        return report;
    }
    if (pattern.size() > options_.maxLength)
    {
        report.error = "Pattern is longer than " + std::to_string(options_.maxLength) + " characters";
        return report;
    }

    const PatternStructure st = analyze(pattern);
    report.criticalIssues = st.criticalIssues;
    report.warnings = st.highWarnings;
    report.warnings.insert(report.warnings.end(), st.mediumWarnings.begin(), st.mediumWarnings.end());
    report.suggestions = securityAdvice(st);
    report.complexityScore = complexityScore(pattern, st);
    report.complexity = complexityLevel(report.complexityScore);
    if (!st.criticalIssues.empty())
        report.risk = RiskLevel::Critical;
    else if (!st.highWarnings.empty())
        report.risk = RiskLevel::High;
    else if (!st.mediumWarnings.empty())
        report.risk = RiskLevel::Medium;

    if (st.lookbehinds > 0)
    {
        report.error = "Lookbehind assertions are not supported";
        return report;
    }

    CompiledRegex compiled;
    try
    {
        compiled = compileRegex(pattern, flags);
    }
    catch (const std::regex_error& ex)
    {
        report.error = std::string("Syntax error: ") + ex.what();
        return report;
    }

    if (report.complexityScore > options_.maxComplexity)
    {
        report.error = "Pattern is too complex (score " + std::to_string(report.complexityScore) + " > " +
                       std::to_string(options_.maxComplexity) + ")";
        return report;
    }
    if (report.risk == RiskLevel::Critical)
    {
        report.error = "Catastrophic backtracking risk";
        return report;
    }
    if (!options_.allowLookahead && st.lookaheads > 0)
    {
        report.error = "Lookahead assertions are disabled";
        return report;
    }
    if (!options_.allowBackreferences && st.backreferences > 0)
    {
        report.error = "Backreferences are not allowed";
        return report;
    }

    std::chrono::microseconds total{ 0 };
    std::size_t runs = 0;
    for (const auto& input : adversarialInputs())
    {
        TimedRun run = searchWithBudget(compiled, input.value, options_.timeoutPerTest);
        report.maxExecutionTime = std::max(report.maxExecutionTime, run.elapsed);
        total += run.elapsed;
        ++runs;
        if (!run.finished)
        {
            report.failedTests.push_back(input.name + " (" + run.error.value_or("failed") + ")");
            // Further inputs would only pile up more stuck workers
            break;
        }
    }
    if (runs > 0)
        report.averageExecutionTime = total / static_cast<long>(runs);

    if (!report.failedTests.empty())
    {
        report.risk = RiskLevel::Critical;
        report.criticalIssues.push_back("Adversarial input test failed: " + report.failedTests.front());
        report.error = "Matching exceeded the time budget; possible ReDoS";
        return report;
    }

    const auto half_budget = std::chrono::duration_cast<std::chrono::microseconds>(options_.timeoutPerTest) / 2;
    if (report.risk == RiskLevel::High && report.maxExecutionTime > half_budget)
    {
        report.error = "High-risk pattern is slow on adversarial input";
        return report;
    }

    report.isValid = true;
    return report;
}

const char* PatternSafetyValidator::toString(RiskLevel risk)
{
    switch (risk)
    {
    case RiskLevel::Low:
        return "low";
    case RiskLevel::Medium:
        return "medium";
    case RiskLevel::High:
        return "high";
    case RiskLevel::Critical:
        return "critical";
    }
    return "low";
}

const char* PatternSafetyValidator::toString(ComplexityLevel level)
{
    switch (level)
    {
    case ComplexityLevel::Low:
        return "low";
    case ComplexityLevel::Medium:
        return "medium";
    case ComplexityLevel::High:
        return "high";
    case ComplexityLevel::Dangerous:
        return "dangerous";
    }
    return "low";
}

} // namespace patterns
