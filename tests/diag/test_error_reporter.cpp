#include <catch2/catch_test_macros.hpp>
#include "tether/utils/ErrorReporter.hpp"

#include <string>

using namespace tether::utils;

TEST_CASE("ErrorReporter - queue and drain", "[diag][errors]") {
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::Plugin, "Plugin skipped", "api level 2");
    ErrorReporter::ReportFatal(ErrorCategory::Startup, "Cannot start");

    REQUIRE(ErrorReporter::HasPendingErrors());
    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].category == ErrorCategory::Plugin);
    REQUIRE(reports[0].technical_details == "api level 2");
    REQUIRE_FALSE(reports[0].IsFatal());
    REQUIRE(reports[1].IsFatal());
    REQUIRE(reports[1].timestamp.size() == 8);

    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - overflow keeps fatal reports", "[diag][errors]") {
    ErrorReporter::ClearErrors();

    ErrorReporter::ReportFatal(ErrorCategory::Startup, "Game data could not be loaded");
    for (size_t i = 0; i < ErrorReporter::kMaxQueuedReports + 5; ++i)
        ErrorReporter::ReportError(ErrorCategory::Plugin, "noise " + std::to_string(i));

    REQUIRE(ErrorReporter::DroppedCount() == 6);
    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == ErrorReporter::kMaxQueuedReports);
    REQUIRE(reports.front().IsFatal());
    REQUIRE(reports.back().user_message == "noise " + std::to_string(ErrorReporter::kMaxQueuedReports + 4));

    ErrorReporter::ClearErrors();
    REQUIRE(ErrorReporter::DroppedCount() == 0);
}

TEST_CASE("ErrorReporter - names", "[diag][errors]") {
    REQUIRE(std::string(ErrorReporter::CategoryName(ErrorCategory::Teardown)) == "Teardown");
    REQUIRE(std::string(ErrorReporter::SeverityName(ErrorSeverity::Warning)) == "Warning");
}
