#pragma once

#include "cairn/parser/ast.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::parser {

enum class ParserSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ParserDiagnostic final {
    ParserSeverity severity = ParserSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::string statement{};
    std::vector<std::string> remediation_hints{};
};

// Deepest nesting of parentheses, subqueries and prefix operators accepted.
inline constexpr std::size_t max_nesting_depth = 128U;

// Expression nodes referenced by the statements live in the arena, so the
// statements are only valid while the result is alive.
struct StatementParseResult final {
    AstArena arena{};
    std::vector<Statement> statements{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return diagnostics.empty(); }
};

// Parses zero or more statements separated by ';'. Any syntax error fails the
// whole script and leaves no statements behind.
StatementParseResult parse_script(std::string_view input);

// Parses exactly one statement; a trailing ';' is accepted.
StatementParseResult parse_statement(std::string_view input);

}  // namespace cairn::parser
