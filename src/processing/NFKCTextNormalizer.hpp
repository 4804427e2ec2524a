#pragma once

#include "ITextNormalizer.hpp"

namespace processing
{

// NFKC (full-width/half-width and compatibility forms folded), optionally case-folded,
// with surrounding whitespace trimmed.
class NFKCTextNormalizer : public ITextNormalizer
{
public:
    explicit NFKCTextNormalizer(bool case_fold = true);
    ~NFKCTextNormalizer() override = default;

    NFKCTextNormalizer(const NFKCTextNormalizer&) = delete;
    NFKCTextNormalizer& operator=(const NFKCTextNormalizer&) = delete;

    [[nodiscard]] std::string normalize(const std::string& text) const override;

    [[nodiscard]] bool caseFold() const noexcept { return case_fold_; }

private:
    bool case_fold_;
};

} // namespace processing
