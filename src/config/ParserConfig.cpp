#include "ParserConfig.hpp"

#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace config
{

namespace
{

template<typename T>
void readValue(const toml::table& t, const char* key, T& out)
{
    if (auto v = t[key].value<T>())
        out = *v;
}

void readSize(const toml::table& t, const char* key, std::size_t& out)
{
    if (auto v = t[key].value<int64_t>())
    {
        if (*v > 0)
            out = static_cast<std::size_t>(*v);
        else
            PLOG_WARNING << "config: " << key << " must be positive, keeping " << out;
    }
}

} // namespace

bool ParserConfig::loadFromFile(const std::string& path)
{
    last_error_.clear();
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        PLOG_INFO << "config: " << path << " not found, using defaults";
        return true;
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        last_error_ = "cannot open " + path;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Configuration file is unreadable",
                                            path);
        return false;
    }

    std::ostringstream oss;
    oss << ifs.rdbuf();
    return loadFromString(oss.str(), path);
}

bool ParserConfig::loadFromString(const std::string& text, const std::string& source_name)
{
    last_error_.clear();
    try
    {
        const toml::table root = toml::parse(text, source_name);
        source_path_ = source_name;
        apply(root);
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                            std::string(pe.description());
        else
            error_details = std::string(pe.description());

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + source_name);
        return false;
    }
}

void ParserConfig::apply(const toml::table& root)
{
    if (auto* t = root["pipeline"].as_table())
        applyPipeline(*t);
    if (auto* t = root["preprocess"].as_table())
        applyPreprocess(*t);
    if (auto* t = root["safety"].as_table())
        applySafety(*t);
    if (auto* t = root["logging"].as_table())
        applyLogging(*t);
    if (auto* t = root["patterns"].as_table())
        readValue(*t, "custom_patterns_file", custom_patterns_file_);
}

void ParserConfig::applyPipeline(const toml::table& t)
{
    if (auto v = t["acceptance_threshold"].value<double>())
        pipeline_.acceptanceThreshold = std::clamp(*v, 0.0, 1.0);

    if (auto* arr = t["strategies"].as_array())
    {
        std::vector<std::string> names;
        for (const auto& node : *arr)
        {
            if (auto name = node.value<std::string>())
                names.push_back(*name);
        }
        pipeline_.strategies = std::move(names);
    }

    readSize(t, "max_regex_input_bytes", pipeline_.maxRegexInputBytes);
    readSize(t, "template_cache_size", pipeline_.templateCacheSize);
    readValue(t, "preprocess", pipeline_.preprocess);
}

void ParserConfig::applyPreprocess(const toml::table& t)
{
    auto& o = pipeline_.preprocessOptions;
    readValue(t, "normalize_headings", o.normalizeHeadings);
    readValue(t, "normalize_punctuation", o.normalizePunctuation);
    readValue(t, "normalize_sentence_punctuation", o.normalizeSentencePunctuation);
    readValue(t, "standardize_quotes", o.standardizeQuotes);
    readValue(t, "normalize_whitespace", o.normalizeWhitespace);
    readValue(t, "normalize_line_breaks", o.normalizeLineBreaks);
    readValue(t, "remove_extra_spaces", o.removeExtraSpaces);
    readValue(t, "preserve_code", o.preserveCode);
    readValue(t, "preserve_links", o.preserveLinks);
    readValue(t, "preserve_math", o.preserveMath);
}

void ParserConfig::applySafety(const toml::table& t)
{
    readSize(t, "max_length", safety_.maxLength);
    if (auto v = t["max_complexity"].value<int64_t>())
        safety_.maxComplexity = static_cast<int>(*v);
    readValue(t, "allow_lookahead", safety_.allowLookahead);
    readValue(t, "allow_backreferences", safety_.allowBackreferences);
    if (auto v = t["timeout_ms"].value<int64_t>(); v && *v > 0)
        safety_.timeoutPerTest = std::chrono::milliseconds(*v);
}

void ParserConfig::applyLogging(const toml::table& t)
{
    readValue(t, "directory", logging_.directory);
    readValue(t, "verbose", logging_.verbose);
    readSize(t, "max_preview", logging_.maxPreview);
    readValue(t, "append_logs", logging_.appendLogs);
    if (auto v = t["level"].value<int64_t>())
        logging_.level = static_cast<int>(std::clamp<int64_t>(*v, 0, 6));
}

void ParserConfig::applyDiagnostics() const
{
    processing::Diagnostics::SetVerbose(logging_.verbose);
    processing::Diagnostics::SetMaxPreview(logging_.maxPreview);
}

} // namespace config
