#pragma once

#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace config
{
class ParserConfig;
}

namespace patterns
{
class CustomPatternManager;
class PatternRegistry;
}

namespace processing
{
class LanguagePatternSets;
}

namespace pipeline
{
class RecognitionPipeline;
}

enum class CliMode
{
    Pipeline,
    Lenient,
    Strict,
    Choice
};

[[nodiscard]] const char* toString(CliMode mode);

struct CliOptions
{
    std::string configPath = "notecard.toml";
    CliMode mode = CliMode::Pipeline;
    std::optional<std::string> templateRegex;
    std::string templateFlags;
    std::map<std::string, int> fieldMapping;
    std::optional<std::string> answer;
    std::string input = "-";
    bool verbose = false;
    bool help = false;
};

// Exit codes of the notecard command
enum ExitCode : int
{
    kExitSuccess = 0,
    kExitParseFailure = 1,
    kExitUsage = 2
};

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

    // Parses argv[1..]; nullopt and a message in error on bad usage
    [[nodiscard]] static std::optional<CliOptions> parseArguments(const std::vector<std::string>& args,
                                                                  std::string& error);
    // "question=1,answer=2"
    [[nodiscard]] static std::optional<std::map<std::string, int>> parseFieldMapping(const std::string& text);
    static void printUsage(std::ostream& os);

private:
    bool initialize();
    bool loadConfig();
    bool initializeLogging();
    void buildRecognizer();
    bool readInput(std::string& content);

    int runPipeline(const std::string& content);
    int runDualMode(const std::string& content);
    int runChoice(const std::string& content);

    std::vector<std::string> args_;
    CliOptions options_;

    std::unique_ptr<config::ParserConfig> config_;
    std::unique_ptr<processing::LanguagePatternSets> languages_;
    std::unique_ptr<patterns::PatternRegistry> registry_;
    std::unique_ptr<patterns::CustomPatternManager> custom_patterns_;
    std::unique_ptr<pipeline::RecognitionPipeline> pipeline_;
};
