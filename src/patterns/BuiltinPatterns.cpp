#include "BuiltinPatterns.hpp"
#include "PatternRegistry.hpp"

#include "../utils/ErrorReporter.hpp"

namespace patterns
{

namespace
{

ContentPattern make(std::string id, std::string name, std::string description, std::string regex,
                    std::map<std::string, int> mapping, int priority, double base_confidence,
                    PatternCategory category, std::vector<std::string> examples, std::string flags = "")
{
    ContentPattern p;
    p.id = std::move(id);
    p.name = std::move(name);
    p.description = std::move(description);
    p.regex = std::move(regex);
    p.flags = std::move(flags);
    p.fieldMapping = std::move(mapping);
    p.priority = priority;
    p.baseConfidence = base_confidence;
    p.category = category;
    p.examples = std::move(examples);
    return p;
}

// All rules are anchored to the whole (trimmed) note. std::regex is byte oriented,
// so non-ASCII punctuation is spelled as alternation, never inside [...].
std::vector<ContentPattern> buildPatterns()
{
    std::vector<ContentPattern> list;

    list.push_back(make("h2-qa", "H2 heading question",
        "Level-2 heading is the question, the remaining text is the answer",
        R"re(^##[ \t]+([^\n]+?)[ \t]*\n+([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 100, 0.95, PatternCategory::Heading,
        { "## What is X?\n\nX is Y." }));

    list.push_back(make("qa-pair", "Q/A labels",
        "Question and answer introduced by Q:/A: or Question:/Answer: labels",
        R"re(^(?:Q|Question)[ \t]*(?::|：)[ \t]*([\s\S]+?)\n+[ \t]*(?:A|Answer)[ \t]*(?::|：)[ \t]*([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 95, 0.9, PatternCategory::QaPair,
        { "Q: What is Y?\nA: Y is Z.", "Question: Why?\nAnswer: Because." }, "i"));

    list.push_back(make("chinese-qa", "Chinese question/answer labels",
        "问题/答案 style labels with half- or full-width colons",
        R"re(^(?:问题|题目|问)[ \t]*(?::|：)[ \t]*([\s\S]+?)\n+[ \t]*(?:答案|解答|回答|答)[ \t]*(?::|：)[ \t]*([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 92, 0.9, PatternCategory::QaPair,
        { "问题：什么是递归？\n\n答案：函数调用自身。" }));

    list.push_back(make("h2-flexible", "H2 heading, loose",
        "Level-2 heading without a space after the hashes, answer optional",
        R"re(^##(?!#)[ \t]*([^\n]+?)[ \t]*(?:\n+([\s\S]*))?$)re",
        { { "question", 1 }, { "answer", 2 } }, 90, 0.85, PatternCategory::Heading,
        { "##What is X?\nX is Y.", "## Lone heading" }));

    list.push_back(make("multiple-choice", "Multiple choice",
        "Question stem, lettered option lines and an optional answer line",
        R"re(^([\s\S]+?)\n+((?:[ \t]*[A-Ha-h][.)][ \t]*[^\n]*(?:\n|$))+)(?:\n*(?:[Aa]nswer|[Cc]orrect(?: answer)?|正确答案|答案)[ \t]*(?::|：)[ \t]*([^\n]+))?\s*$)re",
        { { "question", 1 }, { "options", 2 }, { "correct", 3 } }, 88, 0.85, PatternCategory::MultipleChoice,
        { "Capital of France?\nA. Paris\nB. London\nAnswer: A" }));

    list.push_back(make("h3-qa", "H3 heading question",
        "Level-3 heading is the question",
        R"re(^###[ \t]+([^\n]+?)[ \t]*\n+([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 85, 0.85, PatternCategory::Heading,
        { "### Term\n\nDefinition text." }));

    list.push_back(make("h1-qa", "H1 heading question",
        "Level-1 heading is the question",
        R"re(^#[ \t]+([^\n]+?)[ \t]*\n+([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 80, 0.8, PatternCategory::Heading,
        { "# Topic\n\nBody." }));

    list.push_back(make("bold-question", "Bold question line",
        "**Question** on its own line, optionally followed by a colon",
        R"re(^\*\*([^*\n]+?)\*\*[ \t]*(?::|：)?[ \t]*\n+([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 75, 0.8, PatternCategory::Bold,
        { "**What is X?**\nX is Y." }));

    list.push_back(make("qa-flexible-punctuation", "Question line with trailing mark",
        "First line ends in ? or a colon (either width), the rest is the answer",
        R"re(^([^\n]*?(?:\?|？|:|：))[ \t]*\n+([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 70, 0.75, PatternCategory::QaPair,
        { "What is X?\nX is Y.", "Define recursion:\nA function calling itself." }));

    list.push_back(make("cloze", "Cloze deletion",
        "Text containing {{c1::...}} deletions",
        R"re(^([\s\S]*?\{\{c\d+::[\s\S]+?\}\}[\s\S]*)$)re",
        { { "text", 1 } }, 65, 0.85, PatternCategory::Cloze,
        { "The capital of France is {{c1::Paris}}." }));

    list.push_back(make("list-item-qa", "List item question",
        "First bullet is the question, following lines the answer",
        R"re(^[-*+][ \t]+([^\n]+?)[ \t]*\n+([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 60, 0.7, PatternCategory::List,
        { "- What is X?\n  X is Y." }));

    list.push_back(make("numbered-list-qa", "Numbered item question",
        "First numbered item is the question, following lines the answer",
        R"re(^\d+[.)][ \t]+([^\n]+?)[ \t]*\n+([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 58, 0.7, PatternCategory::List,
        { "1. What is X?\nX is Y." }));

    list.push_back(make("definition", "Term: definition",
        "Single line with a term, a colon and its definition",
        R"re(^([^\n:]{1,80}?)[ \t]*(?::|：)[ \t]*([^\n]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 55, 0.75, PatternCategory::Definition,
        { "Recursion: a function calling itself" }));

    list.push_back(make("free-format", "First line and rest",
        "First line is the question, everything after it is the answer",
        R"re(^([^\n]+?)[ \t]*\n+([\s\S]+)$)re",
        { { "question", 1 }, { "answer", 2 } }, 20, 0.5, PatternCategory::FreeForm,
        { "Some prompt\nSome response" }));

    list.push_back(make("single-line", "Single line",
        "One line of text, used as the front of the card",
        R"re(^([^\n]+)$)re",
        { { "question", 1 } }, 10, 0.4, PatternCategory::FreeForm,
        { "Just a fact to remember" }));

    return list;
}

} // namespace

const std::vector<ContentPattern>& builtinPatterns()
{
    static const std::vector<ContentPattern> patterns = buildPatterns();
    return patterns;
}

std::size_t registerBuiltinPatterns(PatternRegistry& registry)
{
    std::size_t accepted = 0;
    for (const auto& pattern : builtinPatterns())
    {
        if (registry.contains(pattern.id))
            continue;
        RegistrationResult result = registry.registerPattern(pattern);
        if (result.succeeded)
        {
            ++accepted;
        }
        else
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::PatternRegistry,
                "Built-in pattern failed to register",
                pattern.id + ": " + (result.error ? result.error->message : std::string("unknown error")));
        }
    }
    return accepted;
}

} // namespace patterns
