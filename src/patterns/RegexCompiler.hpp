#pragma once

#include "../utils/LRUCache.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <regex>
#include <string>

namespace patterns
{

using CompiledRegex = std::shared_ptr<const std::regex>;

[[nodiscard]] std::regex_constants::syntax_option_type syntaxFor(const std::string& flags);

// Throws std::regex_error when the source does not compile
[[nodiscard]] CompiledRegex compileRegex(const std::string& source, const std::string& flags);

// Capturing groups in source order, or throws std::regex_error
[[nodiscard]] std::size_t captureGroupCount(const std::string& source, const std::string& flags);

// Mutex-guarded LRU of compiled template regexes keyed by flags + source.
class RegexCache
{
public:
    explicit RegexCache(std::size_t capacity = 64);

    // Throws std::regex_error like compileRegex; failures are not cached
    [[nodiscard]] CompiledRegex get(const std::string& source, const std::string& flags);

    bool invalidate(const std::string& source, const std::string& flags);
    void clear();
    void setCapacity(std::size_t capacity);
    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] static std::string keyFor(const std::string& source, const std::string& flags);

    mutable std::mutex mutex_;
    LRUCache<std::string, CompiledRegex> cache_;
};

} // namespace patterns
