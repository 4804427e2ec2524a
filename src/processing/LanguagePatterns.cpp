#include "LanguagePatterns.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>

namespace processing
{

namespace
{

bool isLatinWord(std::string_view word)
{
    return !word.empty() && static_cast<unsigned char>(word.front()) < 0x80;
}

bool isAsciiAlnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::size_t countOccurrences(std::string_view haystack, std::string_view needle)
{
    if (needle.empty())
        return 0;
    std::size_t count = 0;
    for (std::size_t pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size()))
        ++count;
    return count;
}

// Latin words count only on ASCII word boundaries; lowered must already be lower-cased
std::size_t countWord(std::string_view lowered, std::string_view word)
{
    if (!isLatinWord(word))
        return countOccurrences(lowered, word);

    const std::string needle = toLowerAscii(word);
    std::size_t count = 0;
    for (std::size_t pos = lowered.find(needle); pos != std::string_view::npos;
         pos = lowered.find(needle, pos + 1))
    {
        const bool left_ok = pos == 0 || !isAsciiAlnum(lowered[pos - 1]);
        const std::size_t end = pos + needle.size();
        const bool right_ok = end >= lowered.size() || !isAsciiAlnum(lowered[end]);
        if (left_ok && right_ok)
            ++count;
    }
    return count;
}

bool startsWithWord(std::string_view text, std::string_view word)
{
    if (!isLatinWord(word))
        return startsWith(text, word);
    if (!startsWithIgnoreCase(text, word))
        return false;
    return text.size() == word.size() || !isAsciiAlnum(text[word.size()]);
}

std::string_view skipLeadingSpaces(std::string_view text)
{
    std::size_t i = 0;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t'))
        ++i;
    return text.substr(i);
}

// Consumes ':' or '：'; returns false when neither is present
bool consumeColon(std::string_view& text)
{
    if (startsWith(text, ":"))
    {
        text.remove_prefix(1);
        return true;
    }
    if (startsWith(text, "："))
    {
        text.remove_prefix(std::string_view("：").size());
        return true;
    }
    return false;
}

bool consumeBold(std::string_view& text)
{
    if (startsWith(text, "**"))
    {
        text.remove_prefix(2);
        return true;
    }
    return false;
}

struct ScriptCounts
{
    std::size_t han = 0;
    std::size_t kana = 0;
    std::size_t hangul = 0;
};

ScriptCounts countScripts(std::string_view text)
{
    ScriptCounts counts;
    for (char32_t cp : utf8ToUtf32(text))
    {
        const auto v = static_cast<std::uint32_t>(cp);
        if ((v >= 0x4E00u && v <= 0x9FFFu) || (v >= 0x3400u && v <= 0x4DBFu))
            ++counts.han;
        else if ((v >= 0x3040u && v <= 0x30FFu) || (v >= 0xFF66u && v <= 0xFF9Fu))
            ++counts.kana;
        else if ((v >= 0xAC00u && v <= 0xD7AFu) || (v >= 0x1100u && v <= 0x11FFu) || (v >= 0x3130u && v <= 0x318Fu))
            ++counts.hangul;
    }
    return counts;
}

std::vector<std::string> longestFirst(std::vector<std::string> labels)
{
    std::stable_sort(labels.begin(), labels.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
    return labels;
}

} // namespace

LanguagePatternSets::LanguagePatternSets()
{
    sets_.push_back(LanguagePatternSet{
        Language::Chinese,
        "zh",
        { "问题", "题目", "问", "Q" },
        { "答案", "解答", "回答", "答", "A", "解释" },
        { "---", "===", "***", "———", "——" },
        { "什么", "如何", "为什么", "怎么", "哪个", "哪些", "谁", "何时", "何地", "多少", "几个" },
        { "请", "试", "解释", "说明", "描述", "分析", "比较", "列举" },
        { "是什么", "怎么样", "如何", "为什么", "是否", "能否" },
        { "？", "。", "！", "：", "；", "，" },
    });

    sets_.push_back(LanguagePatternSet{
        Language::English,
        "en",
        { "Question", "Q", "Ask", "Problem" },
        { "Answer", "A", "Solution", "Response", "Reply", "Explanation" },
        { "---", "===", "***" },
        { "what", "how", "why", "when", "where", "who", "which", "whose", "whom", "can", "could", "should",
          "would", "will", "do", "does", "did", "is", "are" },
        { "explain", "describe", "define", "compare", "list", "name", "identify" },
        { "what is", "how does", "why does" },
        { "?", ".", "!", ":", ";", "," },
    });

    sets_.push_back(LanguagePatternSet{
        Language::Japanese,
        "ja",
        { "質問", "問題", "問", "Q" },
        { "答え", "回答", "解答", "A", "説明", "解釈" },
        { "---", "===", "***" },
        { "何", "どう", "なぜ", "いつ", "どこ", "誰", "どの", "どれ", "いくつ" },
        { "説明せよ", "述べよ" },
        { "とは", "ですか", "ますか" },
        { "？", "。", "！", "：", "；", "、" },
    });

    sets_.push_back(LanguagePatternSet{
        Language::Korean,
        "ko",
        { "질문", "문제", "물음", "Q" },
        { "답변", "답", "해답", "A", "설명", "해석" },
        { "---", "===", "***" },
        { "무엇", "어떻게", "왜", "언제", "어디", "누구", "어느", "몇", "얼마" },
        { "설명하시오", "쓰시오" },
        { "입니까", "습니까", "인가요" },
        { "?", ".", "!", ":", ";", "," },
    });

    // Longest label first so "Question" wins over "Q" and "答案" over "答"
    for (auto& set : sets_)
    {
        set.questionLabels = longestFirst(std::move(set.questionLabels));
        set.answerLabels = longestFirst(std::move(set.answerLabels));
    }
}

const LanguagePatternSet& LanguagePatternSets::get(Language language) const
{
    for (const auto& set : sets_)
    {
        if (set.language == language)
            return set;
    }
    return sets_[1];
}

std::map<Language, double> LanguagePatternSets::languageScores(std::string_view text) const
{
    std::map<Language, double> scores;
    const std::string lowered = toLowerAscii(text);
    const ScriptCounts scripts = countScripts(text);

    for (const auto& set : sets_)
    {
        double score = 0.0;
        for (const auto& label : set.questionLabels)
        {
            // Labels only count with a colon; a bare "Q" or "问" is too common
            const std::string needle = isLatinWord(label) ? toLowerAscii(label) : label;
            score += 2.0 * static_cast<double>(countOccurrences(lowered, needle + ":") + countOccurrences(lowered, needle + "："));
        }
        for (const auto& word : set.questionWords)
            score += static_cast<double>(countWord(lowered, word));
        for (const auto& punct : set.punctuation)
            score += 0.5 * static_cast<double>(countOccurrences(text, punct));

        switch (set.language)
        {
        case Language::Chinese:
            score += 0.25 * static_cast<double>(scripts.han);
            break;
        case Language::Japanese:
            if (scripts.kana > 0)
                score += 0.5 * static_cast<double>(scripts.kana) + 0.25 * static_cast<double>(scripts.han);
            break;
        case Language::Korean:
            score += 0.5 * static_cast<double>(scripts.hangul);
            break;
        case Language::English:
            break;
        }
        scores[set.language] = score;
    }
    return scores;
}

Language LanguagePatternSets::detectLanguage(std::string_view text) const
{
    const auto scores = languageScores(text);

    // Table order breaks ties: zh, en, ja, ko
    double best_score = 0.0;
    Language detected = Language::English;
    for (const auto& set : sets_)
    {
        const double score = scores.at(set.language);
        if (score > best_score)
        {
            best_score = score;
            detected = set.language;
        }
    }
    return detected;
}

bool LanguagePatternSets::looksLikeQuestion(std::string_view text) const
{
    const std::string trimmed = trim(text);
    if (trimmed.empty())
        return false;

    if (endsWith(trimmed, "?") || endsWith(trimmed, "？"))
        return true;
    if (matchQuestionLabel(trimmed))
        return true;

    const std::string lowered = toLowerAscii(trimmed);
    for (const auto& set : sets_)
    {
        for (const auto& word : set.questionWords)
        {
            if (startsWithWord(trimmed, word))
                return true;
        }
        for (const auto& word : set.instructionWords)
        {
            if (startsWithWord(trimmed, word))
                return true;
        }
        for (const auto& phrase : set.questionPhrases)
        {
            if (isLatinWord(phrase) ? countWord(lowered, phrase) > 0 : trimmed.find(phrase) != std::string::npos)
                return true;
        }
    }
    return false;
}

std::optional<LabelMatch> LanguagePatternSets::matchLabel(std::string_view line, bool question) const
{
    std::string_view view = skipLeadingSpaces(line);
    const bool bold = consumeBold(view);

    for (const auto& set : sets_)
    {
        for (const auto& label : question ? set.questionLabels : set.answerLabels)
        {
            if (!startsWithIgnoreCase(view, label))
                continue;

            std::string_view rest = skipLeadingSpaces(view.substr(label.size()));
            bool closed = bold && consumeBold(rest);
            if (!consumeColon(rest))
                continue;
            if (bold && !closed)
                consumeBold(rest);

            return LabelMatch{ label, trim(rest), set.language };
        }
    }
    return std::nullopt;
}

std::optional<LabelMatch> LanguagePatternSets::matchQuestionLabel(std::string_view line) const
{
    return matchLabel(line, true);
}

std::optional<LabelMatch> LanguagePatternSets::matchAnswerLabel(std::string_view line) const
{
    return matchLabel(line, false);
}

std::vector<std::string> LanguagePatternSets::allQuestionLabels() const
{
    std::vector<std::string> labels;
    for (const auto& set : sets_)
        labels.insert(labels.end(), set.questionLabels.begin(), set.questionLabels.end());
    std::sort(labels.begin(), labels.end());
    return longestFirst(std::move(labels));
}

std::vector<std::string> LanguagePatternSets::allAnswerLabels() const
{
    std::vector<std::string> labels;
    for (const auto& set : sets_)
        labels.insert(labels.end(), set.answerLabels.begin(), set.answerLabels.end());
    std::sort(labels.begin(), labels.end());
    return longestFirst(std::move(labels));
}

SmartSplit LanguagePatternSets::smartSplit(std::string_view content) const
{
    SmartSplit split;
    split.language = detectLanguage(content);
    const auto& set = get(split.language);

    std::vector<std::string> lines;
    for (auto& line : splitLines(content))
    {
        if (!trim(line).empty())
            lines.push_back(std::move(line));
    }

    for (std::size_t i = 1; i < lines.size(); ++i)
    {
        const std::string current = trim(lines[i]);
        const bool separator = std::find(set.separators.begin(), set.separators.end(), current) != set.separators.end();
        std::optional<LabelMatch> answer_label;
        if (!separator)
            answer_label = matchAnswerLabel(current);
        if (!separator && !answer_label)
            continue;

        std::vector<std::string> question_lines(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(i));
        if (auto label = matchQuestionLabel(question_lines.front()))
            question_lines.front() = label->content;
        std::string question = joinLines(question_lines, 0, question_lines.size());

        std::string answer = trim(joinLines(lines, i + 1, lines.size()));
        if (answer_label)
            answer = trim(answer_label->content + (answer.empty() ? "" : "\n" + answer));

        split.question = trim(question);
        split.answer = answer;
        split.confidence = 0.8;
        return split;
    }

    for (std::size_t i = 0; i + 1 < lines.size(); ++i)
    {
        if (looksLikeQuestion(lines[i]))
        {
            split.question = trim(joinLines(lines, 0, i + 1));
            split.answer = trim(joinLines(lines, i + 1, lines.size()));
            split.confidence = 0.6;
            return split;
        }
    }

    if (lines.size() >= 2)
    {
        split.question = trim(lines.front());
        split.answer = trim(joinLines(lines, 1, lines.size()));
        split.confidence = 0.4;
        return split;
    }

    split.question = trim(content);
    split.confidence = 0.2;
    return split;
}

const char* LanguagePatternSets::code(Language language)
{
    switch (language)
    {
    case Language::Chinese:
        return "zh";
    case Language::English:
        return "en";
    case Language::Japanese:
        return "ja";
    case Language::Korean:
        return "ko";
    }
    return "en";
}

std::optional<Language> LanguagePatternSets::fromCode(std::string_view code)
{
    if (code == "zh")
        return Language::Chinese;
    if (code == "en")
        return Language::English;
    if (code == "ja")
        return Language::Japanese;
    if (code == "ko")
        return Language::Korean;
    return std::nullopt;
}

} // namespace processing
