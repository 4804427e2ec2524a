#pragma once

#include <string>
#include <vector>

namespace processing
{

// Canonical form for comparing short marker strings ("Q:", "Ｑ：", "question").
class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;

    // Same order as the input; empty strings stay empty
    [[nodiscard]] std::vector<std::string> normalizeAll(const std::vector<std::string>& texts) const
    {
        std::vector<std::string> out;
        out.reserve(texts.size());
        for (const auto& text : texts)
            out.push_back(text.empty() ? std::string() : normalize(text));
        return out;
    }

    [[nodiscard]] bool equivalent(const std::string& a, const std::string& b) const
    {
        return normalize(a) == normalize(b);
    }
};

} // namespace processing
