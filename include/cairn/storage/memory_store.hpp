#pragma once

#include "cairn/storage/store.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cairn::storage {

struct MemoryKey final {
    std::string table_name{};
    std::uint64_t row_id = 0U;

    auto operator<=>(const MemoryKey& other) const = default;
};

class MemoryStore final : public Store<MemoryKey> {
public:
    struct Config final {
        std::uint64_t initial_row_id = 1U;
    };

    MemoryStore();
    explicit MemoryStore(Config config);

    std::error_code set_schema(const data::Schema& schema) override;
    std::error_code get_schema(std::string_view table_name, data::Schema& out_schema) const override;
    std::error_code del_schema(std::string_view table_name) override;

    std::error_code gen_id(std::string_view table_name, MemoryKey& out_key) override;
    std::error_code set_data(const MemoryKey& key, data::Row row, data::Row& out_row) override;
    std::error_code del_data(const MemoryKey& key) override;

    std::error_code scan_data(std::string_view table_name,
                              std::unique_ptr<RowScanCursor<MemoryKey>>& out_cursor) const override;

    std::error_code get_data(const MemoryKey& key, data::Row& out_row) const;

    [[nodiscard]] std::vector<std::string> table_names() const;
    [[nodiscard]] std::size_t row_count(std::string_view table_name) const noexcept;
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    struct Table final {
        data::Schema schema{};
        std::map<std::uint64_t, data::Row> rows{};
        std::uint64_t next_row_id = 1U;
    };

    class Cursor;

    [[nodiscard]] const Table* find_table(std::string_view table_name) const noexcept;
    [[nodiscard]] Table* find_table(std::string_view table_name) noexcept;

    Config config_{};
    std::map<std::string, Table, std::less<>> tables_{};
};

}  // namespace cairn::storage
