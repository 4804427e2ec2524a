#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

/**
 * @brief Switches for the recognition trace logger (plog instance 1).
 *
 * Traces are one line per event in key=value form so a run can be grepped by
 * stage or strategy:
 *
 *   [RecognitionPipeline] stage=multi-pattern status=ok duration=412us confidence=1 pattern=h2-qa
 */
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Byte budget for Preview(); values below 8 are raised to 8
    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Single-line preview of note text. Never cuts a UTF-8 sequence in half.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

// Builds one "[Component] key=value ..." trace line
class TraceLine
{
public:
    explicit TraceLine(std::string_view component);

    TraceLine& add(std::string_view key, std::string_view value);
    TraceLine& add(std::string_view key, double value);
    TraceLine& flag(std::string_view key, bool value);
    TraceLine& duration(std::chrono::microseconds elapsed);
    // Value goes through Diagnostics::Preview
    TraceLine& preview(std::string_view key, std::string_view text);

    [[nodiscard]] const std::string& str() const noexcept { return line_; }

private:
    void key(std::string_view name);

    std::string line_;
};

} // namespace processing
