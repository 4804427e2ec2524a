#include <catch2/catch_test_macros.hpp>
#include <string>

#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("ErrorReporter - queue and tally", "[errors]")
{
    ErrorReporter::ClearErrors();

    SECTION("Reports are queued oldest first")
    {
        ErrorReporter::ReportWarning(ErrorCategory::PatternRegistry, "Custom pattern rejected", "(a+)+");
        ErrorReporter::ReportError(ErrorCategory::Import, "Import data must be a JSON array of patterns");
        ErrorReporter::ReportInfo(ErrorCategory::Configuration, "Using defaults");

        REQUIRE(ErrorReporter::HasPendingErrors());

        const auto last = ErrorReporter::GetLastError();
        REQUIRE(last.has_value());
        REQUIRE(last->summary == "Using defaults");
        REQUIRE(last->severity == ErrorSeverity::Info);

        const auto peeked = ErrorReporter::PeekPendingErrors();
        REQUIRE(peeked.size() == 3);
        REQUIRE(ErrorReporter::HasPendingErrors());

        const auto drained = ErrorReporter::GetPendingErrors();
        REQUIRE(drained.size() == 3);
        REQUIRE(drained[0].category == ErrorCategory::PatternRegistry);
        REQUIRE(drained[0].details == "(a+)+");
        REQUIRE(drained[1].category == ErrorCategory::Import);
        REQUIRE(drained[1].details.empty());
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
        REQUIRE_FALSE(ErrorReporter::GetLastError().has_value());
    }

    SECTION("Tally counts severities and categories")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Parsing, "Recognition stage failed", "boundary: bad");
        ErrorReporter::ReportWarning(ErrorCategory::Parsing, "Recognition stage failed", "keyword: bad");
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Cannot open log file");
        ErrorReporter::Report(ErrorCategory::Unknown, ErrorSeverity::Fatal, "Out of memory");
        ErrorReporter::ReportInfo(ErrorCategory::Import, "Imported 2 patterns");

        const ErrorTally tally = ErrorReporter::GetTally();
        REQUIRE(tally.warnings == 2);
        REQUIRE(tally.errors == 2);
        REQUIRE(tally.count(ErrorCategory::Parsing) == 2);
        REQUIRE(tally.count(ErrorCategory::Configuration) == 1);
        REQUIRE(tally.count(ErrorCategory::Unknown) == 1);
        REQUIRE(tally.count(ErrorCategory::Import) == 1);
        REQUIRE(tally.count(ErrorCategory::PatternRegistry) == 0);

        // Draining the queue leaves the tally alone
        (void)ErrorReporter::GetPendingErrors();
        REQUIRE(ErrorReporter::GetTally().warnings == 2);

        ErrorReporter::ClearErrors();
        REQUIRE(ErrorReporter::GetTally().warnings == 0);
        REQUIRE(ErrorReporter::GetTally().errors == 0);
    }

    SECTION("Queue keeps only the newest reports")
    {
        for (int i = 0; i < 105; ++i)
            ErrorReporter::ReportWarning(ErrorCategory::Parsing, "report " + std::to_string(i));

        const auto pending = ErrorReporter::PeekPendingErrors();
        REQUIRE(pending.size() == ErrorReporter::kMaxQueueSize);
        REQUIRE(pending.front().summary == "report 5");
        REQUIRE(pending.back().summary == "report 104");
        REQUIRE(ErrorReporter::GetTally().warnings == 105);
    }

    ErrorReporter::ClearErrors();
}

TEST_CASE("ErrorReporter - names", "[errors]")
{
    REQUIRE(std::string(ErrorReporter::CategoryToString(ErrorCategory::Configuration)) == "configuration");
    REQUIRE(std::string(ErrorReporter::CategoryToString(ErrorCategory::PatternRegistry)) == "pattern-registry");
    REQUIRE(std::string(ErrorReporter::CategoryToString(ErrorCategory::Parsing)) == "parsing");
    REQUIRE(std::string(ErrorReporter::CategoryToString(ErrorCategory::Import)) == "import");
    REQUIRE(std::string(ErrorReporter::CategoryToString(ErrorCategory::Unknown)) == "unknown");

    REQUIRE(std::string(ErrorReporter::SeverityToString(ErrorSeverity::Warning)) == "warning");
    REQUIRE(std::string(ErrorReporter::SeverityToString(ErrorSeverity::Fatal)) == "fatal");

    // YYYY-MM-DD HH:MM:SS
    const std::string stamp = ErrorReporter::FormatTimestamp(std::chrono::system_clock::now());
    REQUIRE(stamp.size() == 19);
    REQUIRE(stamp[4] == '-');
    REQUIRE(stamp[10] == ' ');
    REQUIRE(stamp[13] == ':');
}
