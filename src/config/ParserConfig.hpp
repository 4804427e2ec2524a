#pragma once

#include "../patterns/PatternSafetyValidator.hpp"
#include "../pipeline/RecognitionPipeline.hpp"

#include <string>

#include <toml++/toml.h>

namespace config
{

struct LoggingSettings
{
    std::string directory = "logs";
    bool verbose = false;
    std::size_t maxPreview = 160;
    bool appendLogs = true;
    int level = 4; // plog::Severity, 4 = info
};

/**
 * @brief Settings read from notecard.toml.
 *
 * Each table is optional and unknown keys are ignored. A value of the wrong
 * type keeps its default. A parse error keeps every default, stores the
 * message in lastError() and reports it as a configuration warning.
 */
class ParserConfig
{
public:
    // A missing file is not an error
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& text, const std::string& source_name = "<string>");

    [[nodiscard]] const std::string& lastError() const { return last_error_; }
    [[nodiscard]] const std::string& sourcePath() const { return source_path_; }

    [[nodiscard]] const pipeline::PipelineSettings& pipeline() const { return pipeline_; }
    [[nodiscard]] const patterns::SafetyOptions& safety() const { return safety_; }
    [[nodiscard]] const LoggingSettings& logging() const { return logging_; }
    [[nodiscard]] const std::string& customPatternsFile() const { return custom_patterns_file_; }

    pipeline::PipelineSettings& pipeline() { return pipeline_; }
    patterns::SafetyOptions& safety() { return safety_; }
    LoggingSettings& logging() { return logging_; }

    // Pushes the [logging] verbosity and preview budget into processing::Diagnostics
    void applyDiagnostics() const;

private:
    void apply(const toml::table& root);
    void applyPipeline(const toml::table& t);
    void applyPreprocess(const toml::table& t);
    void applySafety(const toml::table& t);
    void applyLogging(const toml::table& t);

    pipeline::PipelineSettings pipeline_;
    patterns::SafetyOptions safety_;
    LoggingSettings logging_;
    std::string custom_patterns_file_;
    std::string source_path_;
    std::string last_error_;
};

} // namespace config
