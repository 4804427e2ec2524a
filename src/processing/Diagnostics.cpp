#include "Diagnostics.hpp"

#include <algorithm>
#include <sstream>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

namespace
{

// Length of the UTF-8 sequence introduced by a lead byte; stray continuation bytes count as one.
std::size_t sequenceLength(unsigned char lead)
{
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 1;
}

} // namespace

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes < 8)
        bytes = 8;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    std::string out;
    out.reserve(std::min(text.size(), limit) + 24);

    std::size_t pos = 0;
    while (pos < text.size())
    {
        const auto lead = static_cast<unsigned char>(text[pos]);
        const std::size_t len = std::min(sequenceLength(lead), text.size() - pos);
        if (pos + len > limit)
            break;

        switch (lead)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (lead < 0x20 || lead == 0x7F)
                out.push_back('?');
            else
                out.append(text.substr(pos, len));
            break;
        }
        pos += len;
    }

    if (pos < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

TraceLine::TraceLine(std::string_view component)
{
    line_.reserve(96);
    line_ += '[';
    line_.append(component);
    line_ += ']';
}

void TraceLine::key(std::string_view name)
{
    line_ += ' ';
    line_.append(name);
    line_ += '=';
}

TraceLine& TraceLine::add(std::string_view name, std::string_view value)
{
    key(name);
    line_.append(value.empty() ? std::string_view("-") : value);
    return *this;
}

TraceLine& TraceLine::add(std::string_view name, double value)
{
    std::ostringstream oss;
    oss << value;
    key(name);
    line_ += oss.str();
    return *this;
}

TraceLine& TraceLine::flag(std::string_view name, bool value)
{
    key(name);
    line_ += value ? "true" : "false";
    return *this;
}

TraceLine& TraceLine::duration(std::chrono::microseconds elapsed)
{
    key("duration");
    line_ += std::to_string(elapsed.count());
    line_ += "us";
    return *this;
}

TraceLine& TraceLine::preview(std::string_view name, std::string_view text)
{
    key(name);
    line_ += Diagnostics::Preview(text);
    return *this;
}

} // namespace processing
