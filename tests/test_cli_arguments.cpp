#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "app/Application.hpp"

namespace
{
std::optional<CliOptions> parse(const std::vector<std::string>& args, std::string& error)
{
    error.clear();
    return Application::parseArguments(args, error);
}
} // namespace

TEST_CASE("CLI - field mapping", "[cli]")
{
    auto mapping = Application::parseFieldMapping("question=1,answer=2");
    REQUIRE(mapping.has_value());
    REQUIRE(mapping->at("question") == 1);
    REQUIRE(mapping->at("answer") == 2);

    auto whole = Application::parseFieldMapping("text=0,");
    REQUIRE(whole.has_value());
    REQUIRE(whole->at("text") == 0);

    for (const std::string bad : { "", ",", "question", "=1", "question=", "question=x", "question=-1", "q=1a" })
    {
        INFO(bad);
        REQUIRE_FALSE(Application::parseFieldMapping(bad).has_value());
    }
}

TEST_CASE("CLI - parseArguments", "[cli]")
{
    std::string error;

    SECTION("Defaults read stdin in pipeline mode")
    {
        auto options = parse({}, error);
        REQUIRE(options.has_value());
        REQUIRE(options->mode == CliMode::Pipeline);
        REQUIRE(options->input == "-");
        REQUIRE(options->configPath == "notecard.toml");
        REQUIRE_FALSE(options->templateRegex.has_value());
    }

    SECTION("Strict mode with a template")
    {
        auto options = parse({ "--mode", "strict", "--template", "^(.+)\\n(.+)$", "--map", "front=1,back=2", "--flags",
                               "i", "--config", "alt.toml", "-v", "note.md" },
                             error);
        REQUIRE(options.has_value());
        REQUIRE(options->mode == CliMode::Strict);
        REQUIRE(*options->templateRegex == "^(.+)\\n(.+)$");
        REQUIRE(options->fieldMapping.at("back") == 2);
        REQUIRE(options->templateFlags == "i");
        REQUIRE(options->configPath == "alt.toml");
        REQUIRE(options->verbose);
        REQUIRE(options->input == "note.md");
    }

    SECTION("Choice mode with an answer")
    {
        auto options = parse({ "--mode", "choice", "--answer", "A,C", "-" }, error);
        REQUIRE(options.has_value());
        REQUIRE(options->mode == CliMode::Choice);
        REQUIRE(*options->answer == "A,C");
    }

    SECTION("Help skips the consistency checks")
    {
        auto options = parse({ "--mode", "strict", "--help" }, error);
        REQUIRE(options.has_value());
        REQUIRE(options->help);
    }

    SECTION("Usage errors")
    {
        REQUIRE_FALSE(parse({ "--mode", "fast" }, error).has_value());
        REQUIRE(error == "unknown mode 'fast'");

        REQUIRE_FALSE(parse({ "--config" }, error).has_value());
        REQUIRE(error == "--config needs a value");

        REQUIRE_FALSE(parse({ "--bogus" }, error).has_value());
        REQUIRE(error == "unknown option '--bogus'");

        REQUIRE_FALSE(parse({ "a.md", "b.md" }, error).has_value());
        REQUIRE(error == "only one input file may be given");

        REQUIRE_FALSE(parse({ "--map", "question" }, error).has_value());
        REQUIRE(error == "--map expects field=group[,field=group...]");

        REQUIRE_FALSE(parse({ "--map", "question=1" }, error).has_value());
        REQUIRE(error == "--map needs --template");

        REQUIRE_FALSE(parse({ "--template", "^(.+)$" }, error).has_value());
        REQUIRE(error == "--template needs --map");

        REQUIRE_FALSE(parse({ "--mode", "strict" }, error).has_value());
        REQUIRE(error == "strict mode needs --template and --map");

        REQUIRE_FALSE(parse({ "--answer", "A" }, error).has_value());
        REQUIRE(error == "--answer is only valid with --mode choice");
    }
}

TEST_CASE("CLI - usage text", "[cli]")
{
    std::ostringstream os;
    Application::printUsage(os);
    REQUIRE(os.str().rfind("usage: notecard", 0) == 0);
}
