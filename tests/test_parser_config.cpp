#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <fstream>
#include <string>

#include "config/ParserConfig.hpp"
#include "processing/Diagnostics.hpp"

using namespace config;
using Catch::Matchers::WithinAbs;

namespace fs = std::filesystem;

TEST_CASE("ParserConfig - defaults", "[config]")
{
    ParserConfig cfg;
    REQUIRE_THAT(cfg.pipeline().acceptanceThreshold, WithinAbs(0.5, 1e-9));
    REQUIRE(cfg.pipeline().strategies.size() == 6);
    REQUIRE(cfg.pipeline().maxRegexInputBytes == 16384);
    REQUIRE(cfg.pipeline().preprocess);
    REQUIRE(cfg.safety().maxLength == 1000);
    REQUIRE(cfg.safety().maxComplexity == 100);
    REQUIRE_FALSE(cfg.safety().allowBackreferences);
    REQUIRE(cfg.logging().level == 4);
    REQUIRE(cfg.logging().directory == "logs");
    REQUIRE(cfg.customPatternsFile().empty());
    REQUIRE(cfg.lastError().empty());
}

TEST_CASE("ParserConfig - loadFromString", "[config]")
{
    ParserConfig cfg;

    SECTION("Every table")
    {
        const std::string text = R"(
[pipeline]
acceptance_threshold = 0.7
strategies = ["boundary", "keyword-heuristic"]
max_regex_input_bytes = 4096
template_cache_size = 8

[preprocess]
normalize_sentence_punctuation = true
preserve_math = false

[safety]
max_length = 500
max_complexity = 60
allow_backreferences = true
timeout_ms = 250

[logging]
directory = "var/log"
verbose = true
max_preview = 40
level = 5

[patterns]
custom_patterns_file = "my_patterns.json"
)";
        REQUIRE(cfg.loadFromString(text));
        REQUIRE(cfg.lastError().empty());
        REQUIRE(cfg.sourcePath() == "<string>");

        REQUIRE_THAT(cfg.pipeline().acceptanceThreshold, WithinAbs(0.7, 1e-9));
        REQUIRE(cfg.pipeline().strategies == std::vector<std::string>{ "boundary", "keyword-heuristic" });
        REQUIRE(cfg.pipeline().maxRegexInputBytes == 4096);
        REQUIRE(cfg.pipeline().templateCacheSize == 8);
        REQUIRE(cfg.pipeline().preprocessOptions.normalizeSentencePunctuation);
        REQUIRE_FALSE(cfg.pipeline().preprocessOptions.preserveMath);
        REQUIRE(cfg.pipeline().preprocessOptions.preserveCode);

        REQUIRE(cfg.safety().maxLength == 500);
        REQUIRE(cfg.safety().maxComplexity == 60);
        REQUIRE(cfg.safety().allowBackreferences);
        REQUIRE(cfg.safety().timeoutPerTest == std::chrono::milliseconds(250));

        REQUIRE(cfg.logging().directory == "var/log");
        REQUIRE(cfg.logging().verbose);
        REQUIRE(cfg.logging().maxPreview == 40);
        REQUIRE(cfg.logging().level == 5);
        REQUIRE(cfg.customPatternsFile() == "my_patterns.json");
    }

    SECTION("Out-of-range values are clamped or ignored")
    {
        REQUIRE(cfg.loadFromString("[pipeline]\nacceptance_threshold = 1.7\nmax_regex_input_bytes = -5\n"
                                   "[logging]\nlevel = 9\n[safety]\ntimeout_ms = 0\n"));
        REQUIRE_THAT(cfg.pipeline().acceptanceThreshold, WithinAbs(1.0, 1e-9));
        REQUIRE(cfg.pipeline().maxRegexInputBytes == 16384);
        REQUIRE(cfg.logging().level == 6);
        REQUIRE(cfg.safety().timeoutPerTest == std::chrono::milliseconds(1000));
    }

    SECTION("Wrongly typed values keep their defaults")
    {
        REQUIRE(cfg.loadFromString("[pipeline]\nacceptance_threshold = \"high\"\nstrategies = [\"boundary\", 3]\n"
                                   "[logging]\nverbose = \"yes\"\n"));
        REQUIRE_THAT(cfg.pipeline().acceptanceThreshold, WithinAbs(0.5, 1e-9));
        REQUIRE(cfg.pipeline().strategies == std::vector<std::string>{ "boundary" });
        REQUIRE_FALSE(cfg.logging().verbose);
    }

    SECTION("Unknown tables and keys are ignored")
    {
        REQUIRE(cfg.loadFromString("[display]\ntheme = \"dark\"\n[pipeline]\nspeed = 3\n"));
        REQUIRE_THAT(cfg.pipeline().acceptanceThreshold, WithinAbs(0.5, 1e-9));
    }

    SECTION("Parse error keeps defaults")
    {
        REQUIRE_FALSE(cfg.loadFromString("[pipeline\nacceptance_threshold = 0.9\n"));
        REQUIRE(cfg.lastError().rfind("config parse error: ", 0) == 0);
        REQUIRE_THAT(cfg.pipeline().acceptanceThreshold, WithinAbs(0.5, 1e-9));

        // A later good load clears the error
        REQUIRE(cfg.loadFromString("[pipeline]\nacceptance_threshold = 0.9\n"));
        REQUIRE(cfg.lastError().empty());
    }
}

TEST_CASE("ParserConfig - loadFromFile", "[config]")
{
    ParserConfig cfg;

    SECTION("Missing file uses defaults")
    {
        REQUIRE(cfg.loadFromFile("/nonexistent/notecard/notecard.toml"));
        REQUIRE(cfg.lastError().empty());
        REQUIRE_THAT(cfg.pipeline().acceptanceThreshold, WithinAbs(0.5, 1e-9));
    }

    SECTION("File on disk")
    {
        const fs::path path = fs::temp_directory_path() / "notecard_test_config.toml";
        {
            std::ofstream out(path);
            out << "[pipeline]\nacceptance_threshold = 0.25\n";
        }
        REQUIRE(cfg.loadFromFile(path.string()));
        REQUIRE(cfg.sourcePath() == path.string());
        REQUIRE_THAT(cfg.pipeline().acceptanceThreshold, WithinAbs(0.25, 1e-9));
        fs::remove(path);
    }
}

TEST_CASE("ParserConfig - applyDiagnostics", "[config]")
{
    ParserConfig cfg;
    REQUIRE(cfg.loadFromString("[logging]\nverbose = true\nmax_preview = 12\n"));
    cfg.applyDiagnostics();
    REQUIRE(processing::Diagnostics::IsVerbose());
    REQUIRE(processing::Diagnostics::MaxPreview() == 12);

    ParserConfig defaults;
    defaults.applyDiagnostics();
    REQUIRE_FALSE(processing::Diagnostics::IsVerbose());
    REQUIRE(processing::Diagnostics::MaxPreview() == 160);
}
