#pragma once

#include "ContentPattern.hpp"
#include "PatternSafetyValidator.hpp"
#include "RegexCompiler.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace patterns
{

// Immutable view of one registered pattern and its compiled regex
struct RegisteredPattern
{
    std::shared_ptr<const ContentPattern> pattern;
    CompiledRegex regex;
    std::uint64_t sequence = 0; // Registration order, used for tie-breaking
    bool custom = false;
};

/**
 * @brief Owns the set of recognition patterns and their compiled regexes.
 *
 * Constructed once by the host and passed by reference to the matcher and the
 * pipeline. Mutation is guarded by a mutex; readers receive snapshots of
 * shared_ptr entries, so a concurrent update never exposes a half-written pattern.
 * Replacing or removing a pattern drops its compiled regex with it.
 */
class PatternRegistry
{
public:
    explicit PatternRegistry(SafetyOptions safety = {});

    // Trusted patterns (built-ins): syntax and field mapping checks only
    RegistrationResult registerPattern(ContentPattern pattern);

    // User-supplied patterns additionally pass the ReDoS screen
    RegistrationResult registerCustomPattern(ContentPattern pattern);

    // Replaces an existing pattern in place, keeping its registration order
    RegistrationResult updatePattern(const std::string& id, ContentPattern pattern);

    bool removePattern(const std::string& id);

    // Cached compiled regex, nullptr for an unknown id
    [[nodiscard]] CompiledRegex compile(const std::string& id) const;

    // Sorted by priority descending, then registration order
    [[nodiscard]] std::vector<ContentPattern> all() const;
    [[nodiscard]] std::vector<RegisteredPattern> snapshot() const;

    [[nodiscard]] std::optional<ContentPattern> find(const std::string& id) const;
    [[nodiscard]] std::optional<RegisteredPattern> entry(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] bool isCustom(const std::string& id) const;
    [[nodiscard]] std::size_t size() const;

    void setSafetyOptions(SafetyOptions options);
    [[nodiscard]] SafetyOptions safetyOptions() const;

    // Syntax + field mapping check without touching the registry.
    // On success the compiled regex is returned and pattern.captureGroups is filled in.
    [[nodiscard]] static std::optional<ValidationError> validateStructure(ContentPattern& pattern,
                                                                          CompiledRegex& compiled);

    // ReDoS screen mapped onto a ValidationError
    [[nodiscard]] std::optional<ValidationError> screen(const ContentPattern& pattern,
                                                        std::vector<std::string>& warnings) const;

private:
    RegistrationResult add(ContentPattern pattern, bool custom);
    [[nodiscard]] static RegistrationResult reject(const std::string& id, ValidationError error);

    mutable std::mutex mutex_;
    std::vector<RegisteredPattern> entries_;
    std::uint64_t next_sequence_ = 0;
    PatternSafetyValidator validator_;
};

} // namespace patterns
