#include "BoundaryDetector.hpp"

#include "../processing/Diagnostics.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <cmath>

#include <plog/Log.h>

namespace boundary
{

using processing::codepointCount;
using processing::trim;

namespace
{

constexpr int kNoHeadingLevel = 7;

bool isBlank(const std::string& line)
{
    return trim(line).empty();
}

// "**Text**", "**Text**:" or "**Text**：" on a line of its own
std::optional<std::string> boldLine(std::string_view line)
{
    std::string t = trim(line);
    for (std::string_view colon : { ":", "：" })
    {
        if (processing::endsWith(t, colon))
        {
            t = trim(std::string_view(t).substr(0, t.size() - colon.size()));
            break;
        }
    }
    if (t.size() < 5 || !processing::startsWith(t, "**") || !processing::endsWith(t, "**"))
        return std::nullopt;
    std::string inner = t.substr(2, t.size() - 4);
    if (inner.find("**") != std::string::npos || trim(inner).empty())
        return std::nullopt;
    return trim(inner);
}

} // namespace

const char* toString(SectionKind kind)
{
    switch (kind)
    {
    case SectionKind::Heading:
        return "heading";
    case SectionKind::Content:
        return "content";
    case SectionKind::Separator:
        return "separator";
    }
    return "content";
}

BoundaryDetector::BoundaryDetector(const processing::LanguagePatternSets& languages, BoundaryOptions options)
    : languages_(languages)
    , options_(options)
{
}

std::optional<int> BoundaryDetector::headingLevel(std::string_view line)
{
    std::size_t pos = 0;
    while (pos < line.size() && pos < 3 && line[pos] == ' ')
        ++pos;
    std::size_t hashes = 0;
    while (pos + hashes < line.size() && line[pos + hashes] == '#')
        ++hashes;
    if (hashes == 0 || hashes > 6)
        return std::nullopt;
    const std::size_t after = pos + hashes;
    if (after < line.size() && line[after] != ' ' && line[after] != '\t')
        return std::nullopt;
    return static_cast<int>(hashes);
}

std::string BoundaryDetector::headingText(std::string_view line)
{
    std::string t = trim(line);
    std::size_t start = t.find_first_not_of('#');
    if (start == std::string::npos)
        return {};
    std::string body = trim(std::string_view(t).substr(start));
    // Closing hashes ("## Title ##")
    const std::size_t last = body.find_last_not_of('#');
    if (last != std::string::npos && last + 1 < body.size() && (body[last] == ' ' || body[last] == '\t'))
        body = trim(std::string_view(body).substr(0, last));
    return body;
}

bool BoundaryDetector::isSeparator(std::string_view line)
{
    const std::string t = trim(line);
    if (t == "---div---")
        return true;
    if (t.size() < 3)
        return false;
    const char c = t.front();
    if (c != '-' && c != '=')
        return false;
    return std::all_of(t.begin(), t.end(), [c](char ch) { return ch == c; });
}

std::vector<Section> BoundaryDetector::segment(std::string_view content) const
{
    std::vector<Section> sections;
    const std::vector<std::string> lines = processing::splitLines(content);
    sections.reserve(lines.size());
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        Section s;
        s.text = lines[i];
        s.span = { i, i + 1 };
        if (auto level = headingLevel(lines[i]))
        {
            s.kind = SectionKind::Heading;
            s.level = *level;
        }
        else if (isSeparator(lines[i]))
        {
            s.kind = SectionKind::Separator;
        }
        sections.push_back(std::move(s));
    }
    return sections;
}

ParsedContent BoundaryDetector::analyze(std::string_view content) const
{
    PROFILE_SCOPE_FUNCTION();

    ParsedContent parsed;
    const std::vector<std::string> lines = processing::splitLines(content);
    parsed.sections = segment(content);
    const auto& sections = parsed.sections;

    if (std::all_of(lines.begin(), lines.end(), isBlank))
    {
        parsed.warnings.emplace_back("Content is empty");
        return parsed;
    }

    auto isQuestionLabel = [&](const Section& s) {
        return s.kind == SectionKind::Content && !languages_.matchAnswerLabel(s.text) &&
               languages_.matchQuestionLabel(s.text).has_value();
    };

    // Question: first heading, then labelled line, then bold line, then question-like line
    std::optional<std::size_t> q;
    int q_level = kNoHeadingLevel;
    bool marked = false;
    bool labelled = false;
    for (std::size_t i = 0; i < sections.size() && !q; ++i)
    {
        if (sections[i].kind == SectionKind::Heading && !headingText(sections[i].text).empty())
        {
            q = i;
            q_level = sections[i].level;
            parsed.question = headingText(sections[i].text);
            marked = true;
        }
    }
    for (std::size_t i = 0; i < sections.size() && !q; ++i)
    {
        if (isQuestionLabel(sections[i]))
        {
            q = i;
            parsed.question = languages_.matchQuestionLabel(sections[i].text)->content;
            marked = true;
            labelled = true;
        }
    }
    for (std::size_t i = 0; i < sections.size() && !q; ++i)
    {
        if (sections[i].kind != SectionKind::Content || languages_.matchAnswerLabel(sections[i].text))
            continue;
        auto bold = boldLine(sections[i].text);
        if (bold && !languages_.matchAnswerLabel(*bold + ":"))
        {
            q = i;
            parsed.question = *bold;
            marked = true;
        }
    }
    for (std::size_t i = 0; i < sections.size() && !q; ++i)
    {
        if (sections[i].kind == SectionKind::Content && !isBlank(sections[i].text) &&
            languages_.looksLikeQuestion(sections[i].text))
        {
            q = i;
            parsed.question = trim(sections[i].text);
        }
    }
    for (std::size_t i = 0; i < sections.size() && !q; ++i)
    {
        if (sections[i].kind == SectionKind::Content && !isBlank(sections[i].text))
        {
            q = i;
            parsed.question = trim(sections[i].text);
            parsed.warnings.emplace_back("No question marker found; the first line is used as the question");
        }
    }
    if (!q)
    {
        // Only headings without text and separators
        parsed.warnings.emplace_back("No question text found");
        return parsed;
    }
    parsed.questionSection = q;

    std::vector<std::string> preamble;
    for (std::size_t i = 0; i < *q; ++i)
    {
        if (!isBlank(lines[i]))
            preamble.push_back(lines[i]);
    }
    if (!preamble.empty())
    {
        parsed.preamble = trim(processing::joinLines(preamble, 0, preamble.size()));
        parsed.warnings.emplace_back("Text before the question is kept as preamble");
    }

    // A labelled question may wrap onto following lines when an answer label closes it
    std::size_t start = *q + 1;
    if (labelled)
    {
        std::size_t j = *q + 1;
        while (j < sections.size() && sections[j].kind == SectionKind::Content && !isBlank(lines[j]) &&
               !isQuestionLabel(sections[j]) && !languages_.matchAnswerLabel(lines[j]))
        {
            ++j;
        }
        if (j < sections.size() && j > *q + 1 && languages_.matchAnswerLabel(lines[j]))
        {
            std::vector<std::string> question_lines{ parsed.question };
            question_lines.insert(question_lines.end(), lines.begin() + static_cast<std::ptrdiff_t>(*q + 1),
                                  lines.begin() + static_cast<std::ptrdiff_t>(j));
            parsed.question = trim(processing::joinLines(question_lines, 0, question_lines.size()));
            start = j;
        }
    }

    std::size_t end = start;
    bool has_content = false;
    for (std::size_t k = start; k < sections.size(); ++k)
    {
        const Section& s = sections[k];
        if (s.kind == SectionKind::Heading && s.level <= q_level)
            break;
        if (s.kind == SectionKind::Separator)
            break;
        if (has_content && isQuestionLabel(s))
            break;
        if (s.kind != SectionKind::Content || !isBlank(s.text))
            has_content = true;
        end = k + 1;
    }
    parsed.answerSpan = LineSpan{ start, end };

    std::vector<std::string> answer_lines;
    for (std::size_t k = start; k < end; ++k)
    {
        if (!options_.preserveFormatting && sections[k].kind == SectionKind::Heading)
            answer_lines.push_back(headingText(lines[k]));
        else
            answer_lines.push_back(lines[k]);
    }
    if (options_.stripAnswerMarker)
    {
        for (auto& line : answer_lines)
        {
            if (isBlank(line))
                continue;
            if (auto label = languages_.matchAnswerLabel(line))
                line = label->content;
            break;
        }
    }
    parsed.answer = trim(processing::joinLines(answer_lines, 0, answer_lines.size()));

    std::size_t trailing = 0;
    for (std::size_t k = end; k < lines.size(); ++k)
    {
        if (!isBlank(lines[k]) && sections[k].kind != SectionKind::Separator)
            ++trailing;
    }
    if (trailing > 0)
        parsed.warnings.push_back(std::to_string(trailing) + " line(s) after the answer boundary are not part of this card");

    const std::size_t q_len = codepointCount(parsed.question);
    const std::size_t a_len = codepointCount(parsed.answer);
    if (q_len < 5)
        parsed.warnings.emplace_back("Question is very short");
    if (a_len < 10)
        parsed.warnings.emplace_back("Answer is very short");
    if (a_len > 5000)
        parsed.warnings.emplace_back("Answer is very long; consider splitting the note");
    const auto headings = std::count_if(sections.begin(), sections.end(),
                                        [](const Section& s) { return s.kind == SectionKind::Heading; });
    if (headings > 5)
        parsed.warnings.emplace_back("Many headings; the note may hold more than one card");

    const bool has_structure = std::any_of(sections.begin(), sections.end(), [](const Section& s) {
        return s.kind != SectionKind::Content;
    });
    parsed.confidence = scoreConfidence(parsed, marked, has_structure);

    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
            << "[BoundaryDetector] sections=" << sections.size() << " question_line=" << *q << " answer_lines=["
            << start << "," << end << ") confidence=" << parsed.confidence;
    }
    return parsed;
}

double BoundaryDetector::scoreConfidence(const ParsedContent& parsed, bool marked_question, bool has_structure) const
{
    const std::size_t q_len = codepointCount(parsed.question);
    const std::size_t a_len = codepointCount(parsed.answer);

    double c = 0.3;
    if (marked_question)
        c += 0.2;
    if (q_len >= 5)
        c += 0.05;
    if (languages_.looksLikeQuestion(parsed.question))
        c += 0.1;
    if (a_len >= 10)
        c += 0.1;

    const std::vector<std::string> answer_lines = processing::splitLines(parsed.answer);
    if (std::count_if(answer_lines.begin(), answer_lines.end(), [](const std::string& l) { return !isBlank(l); }) >= 2)
        c += 0.05;
    if (has_structure)
        c += 0.05;

    if (q_len > 0 && a_len > 0)
    {
        const double ratio = static_cast<double>(q_len) / static_cast<double>(q_len + a_len);
        if (ratio >= 0.1 && ratio <= 0.5)
            c += 0.1;
    }
    if (a_len == 0)
        c *= 0.5;
    return std::clamp(c, 0.0, 1.0);
}

std::string BoundaryDetector::structuralText(std::string_view text) const
{
    std::vector<std::string> kept;
    for (const auto& line : processing::splitLines(text))
    {
        if (isSeparator(line))
            continue;
        if (headingLevel(line))
            kept.push_back(headingText(line));
        else if (auto answer = languages_.matchAnswerLabel(line))
            kept.push_back(answer->content);
        else if (auto question = languages_.matchQuestionLabel(line))
            kept.push_back(question->content);
        else if (auto bold = boldLine(line))
            kept.push_back(*bold);
        else
            kept.push_back(line);
    }
    return processing::joinLines(kept, 0, kept.size());
}

CompletenessReport BoundaryDetector::validateCompleteness(std::string_view original, const ParsedContent& parsed) const
{
    CompletenessReport report;
    const std::size_t total = processing::countNonWhitespace(structuralText(original));
    if (total == 0)
    {
        report.coverage = 1.0;
        report.complete = true;
        return report;
    }

    const std::size_t recovered = processing::countNonWhitespace(structuralText(parsed.question)) +
                                  processing::countNonWhitespace(structuralText(parsed.answer));
    report.coverage = std::min(1.0, static_cast<double>(recovered) / static_cast<double>(total));
    report.complete = report.coverage >= kCompletenessThreshold;
    if (!report.complete)
    {
        report.warning = "Recovered text covers " + std::to_string(static_cast<int>(std::lround(report.coverage * 100))) +
                         "% of the note; the answer may be truncated";
    }
    return report;
}

} // namespace boundary
