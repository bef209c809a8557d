#pragma once

#include "cairn/executor/execute.hpp"
#include "cairn/parser/grammar.hpp"
#include "cairn/storage/memory_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::shell {

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    std::uint64_t statements_executed = 0U;
    std::vector<parser::ParserDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

// Runs shell input against a MemoryStore: SQL scripts go through the parser
// and executor, backslash commands inspect the store.
class ShellEngine final {
public:
    struct Config final {
        // Owned by the caller. When null the engine creates its own store.
        storage::MemoryStore* store = nullptr;
        std::function<void(const CommandMetrics&)> command_logger{};
    };

    ShellEngine();
    explicit ShellEngine(Config config);

    CommandMetrics execute_sql(const std::string& sql);

    [[nodiscard]] storage::MemoryStore& store() noexcept { return *store_; }

private:
    enum class CommandKind : std::uint8_t {
        Empty = 0,
        Sql,
        Meta
    };

    static std::string trim(std::string_view text);
    static CommandKind classify(std::string_view text);
    static std::string_view command_kind_to_string(CommandKind kind) noexcept;

    CommandMetrics execute_script(const std::string& sql);
    CommandMetrics execute_meta(const std::string& command);
    void finish(CommandMetrics& metrics, std::string_view category, std::chrono::steady_clock::time_point start);

    Config config_{};
    std::unique_ptr<storage::MemoryStore> owned_store_{};
    storage::MemoryStore* store_ = nullptr;
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace cairn::shell
