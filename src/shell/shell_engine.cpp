#include "cairn/shell/shell_engine.hpp"

#include "cairn/data/value.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <utility>
#include <variant>

using cairn::parser::ParserDiagnostic;

namespace cairn::shell {

namespace {

[[nodiscard]] std::string_view skip_leading_whitespace(std::string_view text)
{
    std::size_t offset = 0U;
    while (offset < text.size() && std::isspace(static_cast<unsigned char>(text[offset])) != 0) {
        ++offset;
    }
    return text.substr(offset);
}

[[nodiscard]] std::string_view consume_leading_comments(std::string_view text)
{
    std::string_view view = text;
    while (!view.empty()) {
        view = skip_leading_whitespace(view);
        if (view.size() >= 2U && view[0] == '-' && view[1] == '-') {
            const auto newline = view.find('\n');
            view = newline == std::string_view::npos ? std::string_view{} : view.substr(newline + 1U);
            continue;
        }
        if (view.size() >= 2U && view[0] == '/' && view[1] == '*') {
            const auto terminator = view.find("*/", 2U);
            view = terminator == std::string_view::npos ? std::string_view{} : view.substr(terminator + 2U);
            continue;
        }
        break;
    }
    return skip_leading_whitespace(view);
}

[[nodiscard]] std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.emplace_back(text.substr(begin, index - begin));
    }
    return tokens;
}

[[nodiscard]] std::string plural(std::size_t count, std::string_view noun)
{
    std::ostringstream stream;
    stream << count << ' ' << noun << (count == 1U ? "" : "s");
    return stream.str();
}

[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows)
{
    std::vector<std::size_t> widths(headers.size(), 0U);
    for (std::size_t i = 0U; i < headers.size(); ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < widths.size() && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    const auto make_line = [&](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0U; i < widths.size(); ++i) {
            if (i > 0U) {
                line.append(" | ");
            }
            const auto field = i < fields.size() ? std::string_view{fields[i]} : std::string_view{};
            line.append(field);
            line.append(widths[i] - std::min(widths[i], field.size()), ' ');
        }
        while (!line.empty() && line.back() == ' ') {
            line.pop_back();
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 2U);
    lines.push_back(make_line(headers));

    std::string separator;
    for (std::size_t i = 0U; i < widths.size(); ++i) {
        if (i > 0U) {
            separator.append("-+-");
        }
        separator.append(widths[i], '-');
    }
    lines.push_back(std::move(separator));

    if (rows.empty()) {
        lines.push_back("(no rows)");
        return lines;
    }
    for (const auto& row : rows) {
        lines.push_back(make_line(row));
    }
    return lines;
}

[[nodiscard]] std::vector<std::string> render_rows(const executor::SelectPayload& payload)
{
    std::vector<std::vector<std::string>> cells;
    cells.reserve(payload.rows.size());
    for (const auto& row : payload.rows) {
        std::vector<std::string> line;
        line.reserve(row.values.size());
        for (const auto& value : row.values) {
            line.push_back(data::format_value(value));
        }
        cells.push_back(std::move(line));
    }
    return format_table(payload.columns, cells);
}

[[nodiscard]] std::uint64_t rows_touched(const executor::Payload& payload)
{
    if (std::holds_alternative<executor::InsertPayload>(payload)) {
        return 1U;
    }
    if (const auto* select = std::get_if<executor::SelectPayload>(&payload)) {
        return select->rows.size();
    }
    if (const auto* update = std::get_if<executor::UpdatePayload>(&payload)) {
        return update->count;
    }
    if (const auto* removed = std::get_if<executor::DeletePayload>(&payload)) {
        return removed->count;
    }
    return 0U;
}

[[nodiscard]] ParserDiagnostic make_execution_diagnostic(const std::system_error& error, std::string_view statement)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = parser::ParserSeverity::Error;
    diagnostic.message = error.what();
    diagnostic.statement = std::string{statement};
    diagnostic.remediation_hints = {std::string{"Error category: "} + error.code().category().name()};
    return diagnostic;
}

}  // namespace

ShellEngine::ShellEngine()
    : ShellEngine(Config{})
{
}

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
    , store_{config_.store}
{
    if (store_ == nullptr) {
        owned_store_ = std::make_unique<storage::MemoryStore>();
        store_ = owned_store_.get();
    }
}

CommandMetrics ShellEngine::execute_sql(const std::string& sql)
{
    const auto started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();
    const auto trimmed = trim(sql);
    const auto kind = classify(trimmed);

    CommandMetrics metrics{};
    switch (kind) {
    case CommandKind::Empty:
        metrics.success = true;
        metrics.summary = "Empty command.";
        break;
    case CommandKind::Meta:
        metrics = execute_meta(trimmed);
        break;
    case CommandKind::Sql:
    default:
        metrics = execute_script(trimmed);
        break;
    }

    metrics.command_text = trimmed;
    metrics.started_at = started_at;
    finish(metrics, command_kind_to_string(kind), start);
    return metrics;
}

std::string ShellEngine::trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }

    return std::string{text.substr(start, end - start)};
}

ShellEngine::CommandKind ShellEngine::classify(std::string_view text)
{
    const auto view = consume_leading_comments(text);
    if (view.empty()) {
        return CommandKind::Empty;
    }
    if (view.front() == '\\') {
        return CommandKind::Meta;
    }
    return CommandKind::Sql;
}

std::string_view ShellEngine::command_kind_to_string(CommandKind kind) noexcept
{
    switch (kind) {
    case CommandKind::Empty:
        return "empty";
    case CommandKind::Meta:
        return "meta";
    case CommandKind::Sql:
    default:
        return "sql";
    }
}

CommandMetrics ShellEngine::execute_script(const std::string& sql)
{
    CommandMetrics metrics{};
    auto parsed = parser::parse_script(sql);
    if (!parsed.success()) {
        metrics.success = false;
        metrics.summary = "Parse failed.";
        metrics.diagnostics = std::move(parsed.diagnostics);
        return metrics;
    }

    const auto total = parsed.statements.size();
    for (const auto& statement : parsed.statements) {
        const auto kind_name = parser::statement_kind_name(statement);
        try {
            const auto payload = executor::execute(*store_, statement);
            metrics.detail_lines.push_back(executor::describe_payload(payload));
            if (const auto* select = std::get_if<executor::SelectPayload>(&payload)) {
                auto table = render_rows(*select);
                metrics.detail_lines.insert(metrics.detail_lines.end(),
                                            std::make_move_iterator(table.begin()),
                                            std::make_move_iterator(table.end()));
            }
            metrics.rows_touched += rows_touched(payload);
            ++metrics.statements_executed;
        } catch (const std::system_error& error) {
            metrics.success = false;
            metrics.diagnostics.push_back(make_execution_diagnostic(error, kind_name));
            metrics.summary = std::string{kind_name} + " failed after " + plural(metrics.statements_executed, "statement")
                              + " of " + std::to_string(total) + ".";
            return metrics;
        }
    }

    metrics.success = true;
    metrics.summary = total == 0U ? std::string{"No statements parsed."} : "Executed " + plural(total, "statement") + ".";
    return metrics;
}

CommandMetrics ShellEngine::execute_meta(const std::string& command)
{
    CommandMetrics metrics{};
    const auto tokens = split_tokens(command);

    if (tokens.front() == "\\tables" || tokens.front() == "\\dt") {
        std::vector<std::vector<std::string>> rows;
        for (const auto& name : store_->table_names()) {
            data::Schema schema{};
            if (store_->get_schema(name, schema)) {
                continue;
            }
            rows.push_back({name, std::to_string(schema.column_defs.size()), std::to_string(store_->row_count(name))});
        }
        metrics.detail_lines = format_table({"name", "columns", "rows"}, rows);
        metrics.summary = "Listed " + plural(rows.size(), "table");
        metrics.success = true;
        return metrics;
    }

    if (tokens.front() == "\\d" && tokens.size() == 2U) {
        data::Schema schema{};
        if (const auto ec = store_->get_schema(tokens[1], schema)) {
            metrics.success = false;
            metrics.summary = "Unknown table '" + tokens[1] + "'.";
            ParserDiagnostic diagnostic{};
            diagnostic.severity = parser::ParserSeverity::Error;
            diagnostic.statement = command;
            diagnostic.message = ec.message();
            diagnostic.remediation_hints = {"Use \\tables to list existing tables."};
            metrics.diagnostics.push_back(std::move(diagnostic));
            return metrics;
        }

        std::vector<std::vector<std::string>> rows;
        rows.reserve(schema.column_defs.size());
        for (const auto& column : schema.column_defs) {
            rows.push_back({column.name,
                            std::string{data::data_type_name(column.data_type)},
                            column.nullable ? "yes" : "no",
                            column.default_value ? data::format_value(*column.default_value) : std::string{"-"}});
        }
        metrics.detail_lines = format_table({"column", "type", "nullable", "default"}, rows);
        metrics.summary = "Table '" + schema.table_name + "' has " + plural(rows.size(), "column");
        metrics.success = true;
        return metrics;
    }

    metrics.success = false;
    metrics.summary = "Unsupported meta command.";
    ParserDiagnostic diagnostic{};
    diagnostic.severity = parser::ParserSeverity::Error;
    diagnostic.statement = command;
    diagnostic.message = "Shell command is not recognised.";
    diagnostic.remediation_hints = {"Use \\help to list supported commands."};
    metrics.diagnostics.push_back(std::move(diagnostic));
    return metrics;
}

void ShellEngine::finish(CommandMetrics& metrics, std::string_view category, std::chrono::steady_clock::time_point start)
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
    metrics.finished_at = std::chrono::system_clock::now();
    metrics.command_category = std::string{category};
    metrics.correlation_id = "cmd-" + std::to_string(correlation_counter_.fetch_add(1U));

    if (config_.command_logger) {
        config_.command_logger(metrics);
    }
}

}  // namespace cairn::shell
