#pragma once

#include "ContentPattern.hpp"

#include <cstddef>
#include <vector>

namespace patterns
{

class PatternRegistry;

// The stock recognition rules, highest priority first
[[nodiscard]] const std::vector<ContentPattern>& builtinPatterns();

// Registers every built-in pattern; returns how many were accepted
std::size_t registerBuiltinPatterns(PatternRegistry& registry);

} // namespace patterns
