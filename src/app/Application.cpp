#include "Application.hpp"

#include "../choice/ChoiceFieldParser.hpp"
#include "../config/ParserConfig.hpp"
#include "../patterns/BuiltinPatterns.hpp"
#include "../patterns/CustomPatternManager.hpp"
#include "../patterns/PatternRegistry.hpp"
#include "../pipeline/DualModeParser.hpp"
#include "../pipeline/RecognitionPipeline.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/LanguagePatterns.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../utils/Profile.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using nlohmann::json;

namespace
{

json issuesToJson(const std::vector<text_processing::ParseIssue>& issues)
{
    json arr = json::array();
    for (const auto& issue : issues)
        arr.push_back({ { "kind", text_processing::toString(issue.kind) }, { "message", issue.message } });
    return arr;
}

json toJson(const text_processing::EnhancedParseResult& result)
{
    json attempts = json::array();
    for (const auto& trace : result.attempts)
    {
        json row = { { "strategy", trace.strategy },
                     { "succeeded", trace.succeeded },
                     { "confidence", trace.confidence },
                     { "duration_us", trace.duration.count() } };
        if (trace.reason)
            row["reason"] = *trace.reason;
        attempts.push_back(std::move(row));
    }

    return { { "success", result.success },
             { "strategy", result.strategy },
             { "method", text_processing::toString(result.method) },
             { "confidence", result.confidence },
             { "fields", result.fields },
             { "warnings", result.warnings },
             { "issues", issuesToJson(result.issues) },
             { "attempts", std::move(attempts) } };
}

json toJson(const pipeline::ParseResult& result)
{
    json out = { { "success", result.success },
                 { "mode", result.mode },
                 { "state", pipeline::toString(result.state) },
                 { "confidence", result.confidence },
                 { "fields", result.fields },
                 { "warnings", result.warnings } };
    if (result.error)
    {
        out["error"] = { { "kind", text_processing::toString(result.error->kind) },
                         { "message", result.error->message } };
        if (!result.error->field.empty())
            out["error"]["field"] = result.error->field;
    }
    if (result.preserved)
    {
        json attempts = json::array();
        for (const auto& attempt : result.preserved->attempts)
        {
            json row = { { "strategy", attempt.strategy }, { "pattern", attempt.pattern }, { "success", attempt.success } };
            if (attempt.error)
                row["error"] = *attempt.error;
            attempts.push_back(std::move(row));
        }
        out["preserved"] = { { "fallback_template", result.preserved->fallbackTemplateId },
                             { "repair_suggestions", result.preserved->repairSuggestions },
                             { "attempts", std::move(attempts) } };
    }
    return out;
}

json toJson(const std::vector<choice::ChoiceOption>& options)
{
    json arr = json::array();
    for (const auto& option : options)
    {
        arr.push_back({ { "id", option.id },
                        { "label", option.label },
                        { "content", option.content },
                        { "is_correct", option.isCorrect } });
    }
    return arr;
}

json reportsToJson(const std::vector<utils::ErrorReport>& reports)
{
    json arr = json::array();
    for (const auto& report : reports)
    {
        arr.push_back({ { "category", utils::ErrorReporter::CategoryToString(report.category) },
                        { "severity", utils::ErrorReporter::SeverityToString(report.severity) },
                        { "summary", report.summary },
                        { "details", report.details },
                        { "time", utils::ErrorReporter::FormatTimestamp(report.raised_at) } });
    }
    return arr;
}

// --verbose adds everything reported during the run under "diagnostics"
void print(json j, bool with_diagnostics)
{
    if (with_diagnostics)
        j["diagnostics"] = reportsToJson(utils::ErrorReporter::GetPendingErrors());
    std::cout << j.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
}

} // namespace

const char* toString(CliMode mode)
{
    switch (mode)
    {
    case CliMode::Pipeline:
        return "pipeline";
    case CliMode::Lenient:
        return "lenient";
    case CliMode::Strict:
        return "strict";
    case CliMode::Choice:
        return "choice";
    }
    return "pipeline";
}

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application() = default;

std::optional<std::map<std::string, int>> Application::parseFieldMapping(const std::string& text)
{
    std::map<std::string, int> mapping;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        if (item.empty())
            continue;
        const auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == item.size())
            return std::nullopt;

        int group = 0;
        const char* first = item.data() + eq + 1;
        const char* last = item.data() + item.size();
        auto [ptr, ec] = std::from_chars(first, last, group);
        if (ec != std::errc() || ptr != last || group < 0)
            return std::nullopt;
        mapping[item.substr(0, eq)] = group;
    }
    if (mapping.empty())
        return std::nullopt;
    return mapping;
}

std::optional<CliOptions> Application::parseArguments(const std::vector<std::string>& args, std::string& error)
{
    CliOptions options;
    bool input_seen = false;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= args.size())
            {
                error = arg + " needs a value";
                return false;
            }
            out = args[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            options.help = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            options.verbose = true;
        }
        else if (arg == "--config")
        {
            if (!next(options.configPath))
                return std::nullopt;
        }
        else if (arg == "--mode")
        {
            std::string mode;
            if (!next(mode))
                return std::nullopt;
            if (mode == "pipeline")
                options.mode = CliMode::Pipeline;
            else if (mode == "lenient")
                options.mode = CliMode::Lenient;
            else if (mode == "strict")
                options.mode = CliMode::Strict;
            else if (mode == "choice")
                options.mode = CliMode::Choice;
            else
            {
                error = "unknown mode '" + mode + "'";
                return std::nullopt;
            }
        }
        else if (arg == "--template")
        {
            std::string regex;
            if (!next(regex))
                return std::nullopt;
            options.templateRegex = regex;
        }
        else if (arg == "--flags")
        {
            if (!next(options.templateFlags))
                return std::nullopt;
        }
        else if (arg == "--map")
        {
            std::string text;
            if (!next(text))
                return std::nullopt;
            auto mapping = parseFieldMapping(text);
            if (!mapping)
            {
                error = "--map expects field=group[,field=group...]";
                return std::nullopt;
            }
            options.fieldMapping = std::move(*mapping);
        }
        else if (arg == "--answer")
        {
            std::string answer;
            if (!next(answer))
                return std::nullopt;
            options.answer = answer;
        }
        else if (arg.size() > 1 && arg[0] == '-' && arg != "-")
        {
            error = "unknown option '" + arg + "'";
            return std::nullopt;
        }
        else
        {
            if (input_seen)
            {
                error = "only one input file may be given";
                return std::nullopt;
            }
            options.input = arg;
            input_seen = true;
        }
    }

    if (options.help)
        return options;

    if (!options.fieldMapping.empty() && !options.templateRegex)
    {
        error = "--map needs --template";
        return std::nullopt;
    }
    if (options.templateRegex && options.fieldMapping.empty())
    {
        error = "--template needs --map";
        return std::nullopt;
    }
    if (options.mode == CliMode::Strict && !options.templateRegex)
    {
        error = "strict mode needs --template and --map";
        return std::nullopt;
    }
    if (options.answer && options.mode != CliMode::Choice)
    {
        error = "--answer is only valid with --mode choice";
        return std::nullopt;
    }
    return options;
}

void Application::printUsage(std::ostream& os)
{
    os << "usage: notecard [--config FILE] [--mode pipeline|lenient|strict|choice]\n"
          "                [--template REGEX --map field=group,... [--flags i]]\n"
          "                [--answer LABELS] [--verbose] [FILE|-]\n"
          "\n"
          "Recognises a note and prints its flashcard fields as JSON.\n"
          "Exit status: 0 recognised, 1 not recognised, 2 usage or configuration error.\n";
}

int Application::run()
{
    std::string error;
    auto options = parseArguments(args_, error);
    if (!options)
    {
        std::cerr << "notecard: " << error << "\n";
        printUsage(std::cerr);
        return kExitUsage;
    }
    options_ = std::move(*options);
    if (options_.help)
    {
        printUsage(std::cout);
        return kExitSuccess;
    }

    if (!initialize())
        return kExitUsage;

    std::string content;
    if (!readInput(content))
        return kExitUsage;

    int exit_code = kExitUsage;
    switch (options_.mode)
    {
    case CliMode::Pipeline:
        exit_code = runPipeline(content);
        break;
    case CliMode::Lenient:
    case CliMode::Strict:
        exit_code = runDualMode(content);
        break;
    case CliMode::Choice:
        exit_code = runChoice(content);
        break;
    }

    const utils::ErrorTally tally = utils::ErrorReporter::GetTally();
    PLOG_INFO << "Finished with exit code " << exit_code << " (" << tally.warnings << " warnings, " << tally.errors
              << " errors)";
    PROFILE_LOG_SUMMARY();
    return exit_code;
}

bool Application::initialize()
{
    if (!loadConfig())
        return false;
    if (!initializeLogging())
        return false;
    buildRecognizer();
    return true;
}

bool Application::loadConfig()
{
    PROFILE_SCOPE_FUNCTION();

    config_ = std::make_unique<config::ParserConfig>();
    if (!config_->loadFromFile(options_.configPath))
    {
        std::cerr << "notecard: " << config_->lastError() << "\n";
        return false;
    }

    if (options_.verbose)
        config_->logging().verbose = true;
    config_->applyDiagnostics();
    return true;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    const config::LoggingSettings& logging = config_->logging();
    utils::LogSettings settings;
    settings.directory = logging.directory;
    settings.append = logging.appendLogs;
    settings.level = static_cast<plog::Severity>(logging.level);
    settings.console = options_.verbose;
    settings.verbose = logging.verbose;

    if (!utils::LogManager::Initialize(settings))
    {
        std::cerr << "notecard: cannot write logs to " << settings.directory << "\n";
        return false;
    }
    PLOG_INFO << "Configuration " << (config_->sourcePath().empty() ? "(defaults)" : config_->sourcePath())
              << ", mode " << toString(options_.mode);
    return true;
}

void Application::buildRecognizer()
{
    PROFILE_SCOPE_FUNCTION();

    languages_ = std::make_unique<processing::LanguagePatternSets>();
    registry_ = std::make_unique<patterns::PatternRegistry>(config_->safety());
    const std::size_t builtins = patterns::registerBuiltinPatterns(*registry_);
    PLOG_INFO << "Registered " << builtins << " built-in patterns";

    custom_patterns_ = std::make_unique<patterns::CustomPatternManager>(*registry_);
    const std::string& custom_file = config_->customPatternsFile();
    if (!custom_file.empty())
    {
        std::error_code ec;
        if (std::filesystem::exists(custom_file, ec))
        {
            auto imported = custom_patterns_->importFile(custom_file);
            PLOG_INFO << "Imported " << imported.imported << " custom patterns from " << custom_file;
            for (const auto& message : imported.errors)
                PLOG_WARNING << "custom patterns: " << message;
            for (const auto& record : imported.records)
            {
                for (const auto& message : record.errors)
                    PLOG_WARNING << "custom pattern '" << record.name << "': " << message;
            }
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Custom pattern file does not exist", custom_file);
        }
    }

    pipeline_ = std::make_unique<pipeline::RecognitionPipeline>(*registry_, *languages_, config_->pipeline());
}

bool Application::readInput(std::string& content)
{
    std::ostringstream oss;
    if (options_.input == "-")
    {
        oss << std::cin.rdbuf();
    }
    else
    {
        std::ifstream ifs(options_.input, std::ios::binary);
        if (!ifs)
        {
            std::cerr << "notecard: cannot open " << options_.input << "\n";
            return false;
        }
        oss << ifs.rdbuf();
    }
    content = oss.str();
    return true;
}

int Application::runPipeline(const std::string& content)
{
    text_processing::EnhancedParseResult result;
    if (options_.templateRegex)
    {
        text_processing::CardTemplate tmpl;
        tmpl.id = "cli";
        tmpl.name = "command line template";
        tmpl.regex = *options_.templateRegex;
        tmpl.flags = options_.templateFlags;
        tmpl.fieldMapping = options_.fieldMapping;
        result = pipeline_->parseWithPipeline(content, tmpl);
    }
    else
    {
        result = pipeline_->parse(content);
    }
    print(toJson(result), options_.verbose);
    return result.success ? kExitSuccess : kExitParseFailure;
}

int Application::runDualMode(const std::string& content)
{
    pipeline::DualModeParser parser(pipeline_.get(), { config_->pipeline().maxRegexInputBytes });

    std::optional<text_processing::CardTemplate> tmpl;
    if (options_.templateRegex)
    {
        tmpl.emplace();
        tmpl->id = "cli";
        tmpl->name = "command line template";
        tmpl->regex = *options_.templateRegex;
        tmpl->flags = options_.templateFlags;
        tmpl->fieldMapping = options_.fieldMapping;
    }

    const auto mode = options_.mode == CliMode::Strict ? pipeline::ParseMode::Strict : pipeline::ParseMode::Lenient;
    const auto result = parser.parse(content, mode, tmpl ? &*tmpl : nullptr);
    print(toJson(result), options_.verbose);
    return result.success ? kExitSuccess : kExitParseFailure;
}

int Application::runChoice(const std::string& content)
{
    json out;
    bool success = false;
    if (options_.answer)
    {
        const auto result = choice::ChoiceFieldParser::parseChoiceQuestion(content, *options_.answer);
        success = result.success;
        out = { { "success", result.success },
                { "options", toJson(result.options) },
                { "correct", result.correctAnswers },
                { "multiple", result.isMultiple },
                { "warnings", result.warnings } };
        if (result.error)
            out["error"] = *result.error;
    }
    else
    {
        const auto result = choice::ChoiceFieldParser::parseOptions(content);
        success = result.success;
        out = { { "success", result.success }, { "options", toJson(result.options) }, { "warnings", result.warnings } };
        if (result.error)
            out["error"] = *result.error;
    }
    print(std::move(out), options_.verbose);
    return success ? kExitSuccess : kExitParseFailure;
}
