#include "RegexCompiler.hpp"

namespace patterns
{

std::regex_constants::syntax_option_type syntaxFor(const std::string& flags)
{
    auto syntax = std::regex_constants::ECMAScript;
    for (char flag : flags)
    {
        switch (flag)
        {
        case 'i':
            syntax |= std::regex_constants::icase;
            break;
        case 'm':
            syntax |= std::regex_constants::multiline;
            break;
        default:
            // g, u, s, y have no std::regex counterpart
            break;
        }
    }
    return syntax;
}

CompiledRegex compileRegex(const std::string& source, const std::string& flags)
{
    return std::make_shared<const std::regex>(source, syntaxFor(flags));
}

std::size_t captureGroupCount(const std::string& source, const std::string& flags)
{
    return std::regex(source, syntaxFor(flags)).mark_count();
}

RegexCache::RegexCache(std::size_t capacity)
    : cache_(capacity)
{
}

CompiledRegex RegexCache::get(const std::string& source, const std::string& flags)
{
    const std::string key = keyFor(source, flags);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CompiledRegex cached;
        if (cache_.get(key, cached))
            return cached;
    }

    // Compile outside the lock; a concurrent miss compiles twice and the last put wins
    CompiledRegex compiled = compileRegex(source, flags);
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.put(key, compiled);
    return compiled;
}

bool RegexCache::invalidate(const std::string& source, const std::string& flags)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.erase(keyFor(source, flags));
}

void RegexCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

void RegexCache::setCapacity(std::size_t capacity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.setCapacity(capacity);
}

std::size_t RegexCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::string RegexCache::keyFor(const std::string& source, const std::string& flags)
{
    return flags + '/' + source;
}

} // namespace patterns
