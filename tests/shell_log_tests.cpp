#include "cairn/tools/shell_log_formatter.hpp"

#include "cairn/shell/shell_engine.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <string>

using cairn::shell::CommandMetrics;
using cairn::tools::format_shell_command_log_json;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;

TEST_CASE("shell log JSON carries command metrics")
{
    cairn::shell::ShellEngine engine;
    REQUIRE(engine.execute_sql("CREATE TABLE metrics (id INT, name TEXT);").success);
    const auto insert = engine.execute_sql("INSERT INTO metrics VALUES (1, 'alpha');");
    REQUIRE(insert.success);

    const auto json = format_shell_command_log_json(insert);
    CHECK_THAT(json, StartsWith("{\"correlation_id\":\"cmd-2\""));
    CHECK_THAT(json, EndsWith("]}"));
    CHECK_THAT(json, ContainsSubstring("\"category\":\"sql\""));
    CHECK_THAT(json, ContainsSubstring("\"sql\":\"INSERT INTO metrics VALUES (1, 'alpha');\""));
    CHECK_THAT(json, ContainsSubstring("\"summary\":\"Executed 1 statement.\""));
    CHECK_THAT(json, ContainsSubstring("\"success\":true"));
    CHECK_THAT(json, ContainsSubstring("\"rows_touched\":1"));
    CHECK_THAT(json, ContainsSubstring("\"statements_executed\":1"));
    CHECK_THAT(json, ContainsSubstring("\"detail_lines\":[\"INSERT 1\"]"));
    CHECK_THAT(json, ContainsSubstring("\"diagnostics\":[]"));
    CHECK_THAT(json, ContainsSubstring("\"started_at\":\""));
    CHECK_THAT(json, ContainsSubstring("Z\",\"finished_at\":\""));
}

TEST_CASE("shell log JSON includes diagnostics for failures")
{
    cairn::shell::ShellEngine engine;
    const auto failure = engine.execute_sql("DELETE FROM ghosts");
    REQUIRE_FALSE(failure.success);

    const auto json = format_shell_command_log_json(failure);
    CHECK_THAT(json, ContainsSubstring("\"success\":false"));
    CHECK_THAT(json, ContainsSubstring("\"severity\":\"error\""));
    CHECK_THAT(json, ContainsSubstring("\"statement\":\"DELETE\""));
    CHECK_THAT(json, ContainsSubstring("\"remediation_hints\":[\"Error category: cairn.storage\"]"));
}

TEST_CASE("shell log JSON escapes text and omits unset timestamps")
{
    CommandMetrics metrics{};
    metrics.correlation_id = "cmd-7";
    metrics.command_category = "sql";
    metrics.command_text = "SELECT 'a\"b'\n\tFROM t\\x";
    metrics.summary = std::string{"bell\x01"};
    metrics.duration_ms = 1.23456;

    cairn::parser::ParserDiagnostic diagnostic{};
    diagnostic.severity = cairn::parser::ParserSeverity::Warning;
    diagnostic.message = "careful";
    diagnostic.line = 3U;
    diagnostic.column = 14U;
    metrics.diagnostics.push_back(diagnostic);

    const auto json = format_shell_command_log_json(metrics);
    CHECK_THAT(json, ContainsSubstring(R"("sql":"SELECT 'a\"b'\n\tFROM t\\x")"));
    CHECK_THAT(json, ContainsSubstring(R"("summary":"bell\u0001")"));
    CHECK_THAT(json, ContainsSubstring("\"duration_ms\":1.235"));
    CHECK_THAT(json, ContainsSubstring("\"started_at\":null"));
    CHECK_THAT(json, ContainsSubstring("\"finished_at\":null"));
    CHECK_THAT(json,
               ContainsSubstring("{\"severity\":\"warning\",\"message\":\"careful\",\"line\":3,\"column\":14,"
                                 "\"statement\":\"\",\"remediation_hints\":[]}"));
}

TEST_CASE("shell log JSON renders timestamps in UTC")
{
    CommandMetrics metrics{};
    metrics.started_at = std::chrono::system_clock::time_point{std::chrono::seconds{86'400}}
                         + std::chrono::microseconds{250};
    const auto json = format_shell_command_log_json(metrics);
    CHECK_THAT(json, ContainsSubstring("\"started_at\":\"1970-01-02T00:00:00.000250Z\""));
}
