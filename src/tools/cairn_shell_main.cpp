#include "cairn/shell/input_buffer.hpp"
#include "cairn/shell/shell_engine.hpp"
#include "cairn/storage/memory_store.hpp"
#include "cairn/tools/shell_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using cairn::shell::CommandMetrics;
using cairn::shell::ShellEngine;

struct ShellOptions final {
    bool quiet = false;
    std::vector<std::string> commands{};
    std::vector<std::string> scripts{};
    std::string log_json{};
    std::uint64_t first_row_id = 1U;
};

// Serialises JSON log lines from the engine's command logger.
class JsonLogSink final {
public:
    bool open(const std::string& target)
    {
        if (target == "-") {
            out_ = &std::cout;
            return true;
        }
        file_.open(target, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            return false;
        }
        out_ = &file_;
        return true;
    }

    void write(const CommandMetrics& metrics)
    {
        const auto line = cairn::tools::format_shell_command_log_json(metrics);
        std::lock_guard<std::mutex> guard{mutex_};
        *out_ << line << std::endl;
    }

private:
    std::ofstream file_{};
    std::ostream* out_ = nullptr;
    std::mutex mutex_{};
};

int exit_with(int code, std::string_view path)
{
    std::cerr << "[debug] cairn_shell exit path=" << path << " code=" << code << '\n';
    return code;
}

void print_metrics(const CommandMetrics& metrics)
{
    if (metrics.command_category == "empty") {
        return;
    }

    for (const auto& line : metrics.detail_lines) {
        std::cout << line << '\n';
    }

    for (const auto& diagnostic : metrics.diagnostics) {
        std::cout << "error";
        if (diagnostic.line != 0U) {
            std::cout << " at " << diagnostic.line << ':' << diagnostic.column;
        }
        if (!diagnostic.statement.empty()) {
            std::cout << " in " << diagnostic.statement;
        }
        std::cout << ": " << diagnostic.message << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cout << "  (" << hint << ")\n";
        }
    }

    std::cout << (metrics.success ? "" : "failed: ") << metrics.summary << " (" << metrics.correlation_id << ", "
              << std::fixed << std::setprecision(3) << metrics.duration_ms << " ms)\n";
}

std::optional<std::string> read_script(const std::string& path)
{
    std::ostringstream contents;
    if (path == "-") {
        contents << std::cin.rdbuf();
        return contents.str();
    }

    std::ifstream file{path, std::ios::in | std::ios::binary};
    if (!file.is_open()) {
        return std::nullopt;
    }
    contents << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return contents.str();
}

bool run_script(ShellEngine& engine, const std::string& path)
{
    const auto script = read_script(path);
    if (!script) {
        std::cerr << "error: cannot read script '" << path << "'\n";
        return false;
    }
    const auto metrics = engine.execute_sql(*script);
    print_metrics(metrics);
    return metrics.success;
}

std::string history_file()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return {};
    }
    return (std::filesystem::path{home} / ".cairn_shell_history").string();
}

void print_help(const cairn::storage::MemoryStore& store)
{
    std::cout << "cairn shell (first row id " << store.config().initial_row_id << ")\n"
              << "  <sql>;       run one or more statements, each ending in ';'\n"
              << "  \\tables      list tables with their column and row counts\n"
              << "  \\d <table>   show the columns of a table\n"
              << "  @<path>      run a script file\n"
              << "  \\help        show this text\n"
              << "  \\quit        leave the shell\n";
}

int run_interactive(ShellEngine& engine, bool quiet)
{
    replxx::Replxx editor;
    const auto history = history_file();
    if (!history.empty() && !editor.history_load(history)) {
        std::cerr << "[debug] no history at " << history << '\n';
    }

    if (!quiet) {
        std::cout << "cairn shell. Statements end with ';'. Type \\help for commands.\n";
    }

    cairn::shell::InputBuffer input;
    for (;;) {
        const char* raw = editor.input(input.empty() ? "cairn> " : "  ...> ");
        if (raw == nullptr) {
            std::cout << '\n';
            break;
        }

        const std::string_view line{raw};
        if (input.empty() && !line.empty() && line.front() == '@') {
            const std::string path{line.substr(1U)};
            if (path.empty() || path == "-") {
                std::cerr << "error: '@' needs a script file path\n";
            } else if (!run_script(engine, path)) {
                std::cerr << "error: script '" << path << "' stopped with errors\n";
            }
            continue;
        }

        if (!input.append_line(line)) {
            continue;
        }

        const auto command = input.take();
        if (command == "\\q" || command == "\\quit") {
            break;
        }
        if (command == "\\help") {
            print_help(engine.store());
            continue;
        }

        editor.history_add(command);
        print_metrics(engine.execute_sql(command));
        if (!history.empty() && !editor.history_save(history)) {
            std::cerr << "[debug] cannot save history to " << history << '\n';
        }
    }

    if (!input.empty()) {
        std::cerr << "[debug] discarded unterminated input\n";
    }
    return 0;
}

int run_batch(ShellEngine& engine, const ShellOptions& options)
{
    int code = 0;
    for (const auto& path : options.scripts) {
        if (!run_script(engine, path)) {
            code = 1;
        }
    }
    for (const auto& command : options.commands) {
        const auto metrics = engine.execute_sql(command);
        print_metrics(metrics);
        if (!metrics.success) {
            code = 1;
        }
    }
    return code;
}

}  // namespace

int main(int argc, char** argv)
{
    ShellOptions options{};
    CLI::App app{"cairn_shell: run SQL against an in-memory cairn store."};
    app.add_flag("-q,--quiet", options.quiet, "Do not print the banner");
    app.add_option("-c,--command", options.commands, "SQL to run before exiting (repeatable)")
        ->type_name("SQL")
        ->expected(1);
    app.add_option("-f,--file", options.scripts, "Script file to run before exiting, '-' for stdin (repeatable)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("--log-json", options.log_json, "Append one JSON line per command to PATH, '-' for stdout")
        ->type_name("PATH");
    app.add_option("--first-row-id", options.first_row_id, "Row id given to the first row of each table")
        ->check(CLI::PositiveNumber);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return exit_with(app.exit(error), "cli");
    }

    std::size_t stdin_scripts = 0U;
    for (const auto& path : options.scripts) {
        stdin_scripts += path == "-" ? 1U : 0U;
    }
    if (stdin_scripts > 1U) {
        std::cerr << "error: '-f -' may be given once\n";
        return exit_with(1, "options");
    }

    cairn::storage::MemoryStore::Config store_config{};
    store_config.initial_row_id = options.first_row_id;
    cairn::storage::MemoryStore store{store_config};

    ShellEngine::Config engine_config{};
    engine_config.store = &store;

    JsonLogSink log_sink;
    if (!options.log_json.empty()) {
        if (!log_sink.open(options.log_json)) {
            std::cerr << "error: cannot open log file '" << options.log_json << "'\n";
            return exit_with(1, "log");
        }
        engine_config.command_logger = [&log_sink](const CommandMetrics& metrics) { log_sink.write(metrics); };
    }

    try {
        ShellEngine engine{std::move(engine_config)};
        if (!options.scripts.empty() || !options.commands.empty()) {
            return exit_with(run_batch(engine, options), "batch");
        }
        return exit_with(run_interactive(engine, options.quiet), "repl");
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return exit_with(1, "exception");
    }
}
