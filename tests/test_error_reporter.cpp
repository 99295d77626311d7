#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <string>

using namespace utils;

TEST_CASE("ErrorReporter - Queue", "[errors]")
{
    ErrorReporter::ClearErrors();

    SECTION("Reports are queued until collected")
    {
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Bad duration", "duration=-1");
        ErrorReporter::ReportError(ErrorCategory::Callback, "Callback failed");
        REQUIRE(ErrorReporter::HasPendingErrors());

        auto errors = ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 2);
        REQUIRE(errors[0].severity == ErrorSeverity::Warning);
        REQUIRE(errors[0].technical_details == "duration=-1");
        REQUIRE(errors[1].severity == ErrorSeverity::Error);
        REQUIRE(errors[1].technical_details.empty());

        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    }

    SECTION("GetLastError peeks without collecting")
    {
        REQUIRE(ErrorReporter::GetLastError().user_message.empty());

        ErrorReporter::ReportWarning(ErrorCategory::Numeric, "first");
        ErrorReporter::ReportFatal(ErrorCategory::Initialization, "second");

        ErrorReport last = ErrorReporter::GetLastError();
        REQUIRE(last.user_message == "second");
        REQUIRE(last.is_fatal);
        REQUIRE_FALSE(last.timestamp.empty());
        REQUIRE(ErrorReporter::HasPendingErrors());
    }

    SECTION("The oldest reports are dropped past the cap")
    {
        for (int i = 0; i < 105; ++i)
            ErrorReporter::ReportError(ErrorCategory::Scheduling, "frame " + std::to_string(i));

        auto errors = ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 100);
        REQUIRE(errors.front().user_message == "frame 5");
        REQUIRE(errors.back().user_message == "frame 104");
    }

    ErrorReporter::ClearErrors();
}

TEST_CASE("ErrorReporter - Names", "[errors]")
{
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Numeric) == "Numeric");
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Scheduling) == "Scheduling");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Fatal) == "Fatal");
    REQUIRE(ErrorReporter::GetTimestamp().size() == 19);
}
