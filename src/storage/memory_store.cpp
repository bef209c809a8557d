#include "cairn/storage/memory_store.hpp"
#include "cairn/storage/storage_errors.hpp"

#include <limits>
#include <utility>

namespace cairn::storage {

// Holds the row ids present when the scan started and re-reads each row on
// demand, so rows written or removed behind the cursor are handled in place.
class MemoryStore::Cursor final : public RowScanCursor<MemoryKey> {
public:
    Cursor(const MemoryStore& store, std::string table_name, std::vector<std::uint64_t> row_ids)
        : store_{&store}
        , table_name_{std::move(table_name)}
        , row_ids_{std::move(row_ids)}
    {
    }

    bool next(MemoryKey& out_key, data::Row& out_row) override
    {
        while (position_ < row_ids_.size()) {
            const auto row_id = row_ids_[position_++];
            const auto* table = store_->find_table(table_name_);
            if (table == nullptr) {
                position_ = row_ids_.size();
                return false;
            }

            const auto it = table->rows.find(row_id);
            if (it == table->rows.end()) {
                continue;
            }

            out_key.table_name = table_name_;
            out_key.row_id = row_id;
            out_row = it->second;
            return true;
        }
        return false;
    }

private:
    const MemoryStore* store_ = nullptr;
    std::string table_name_{};
    std::vector<std::uint64_t> row_ids_{};
    std::size_t position_ = 0U;
};

MemoryStore::MemoryStore()
    : MemoryStore(Config{})
{
}

MemoryStore::MemoryStore(Config config)
    : config_{config}
{
}

std::error_code MemoryStore::set_schema(const data::Schema& schema)
{
    if (find_table(schema.table_name) != nullptr) {
        return make_error_code(StorageErrc::TableAlreadyExists);
    }

    Table table{};
    table.schema = schema;
    table.next_row_id = config_.initial_row_id;
    tables_.emplace(schema.table_name, std::move(table));
    return {};
}

std::error_code MemoryStore::get_schema(std::string_view table_name, data::Schema& out_schema) const
{
    const auto* table = find_table(table_name);
    if (table == nullptr) {
        return make_error_code(StorageErrc::TableNotFound);
    }
    out_schema = table->schema;
    return {};
}

std::error_code MemoryStore::del_schema(std::string_view table_name)
{
    const auto it = tables_.find(table_name);
    if (it == tables_.end()) {
        return make_error_code(StorageErrc::TableNotFound);
    }
    tables_.erase(it);
    return {};
}

std::error_code MemoryStore::gen_id(std::string_view table_name, MemoryKey& out_key)
{
    auto* table = find_table(table_name);
    if (table == nullptr) {
        return make_error_code(StorageErrc::TableNotFound);
    }
    if (table->next_row_id == std::numeric_limits<std::uint64_t>::max()) {
        return make_error_code(StorageErrc::RowIdExhausted);
    }

    out_key.table_name = table->schema.table_name;
    out_key.row_id = table->next_row_id++;
    return {};
}

std::error_code MemoryStore::set_data(const MemoryKey& key, data::Row row, data::Row& out_row)
{
    auto* table = find_table(key.table_name);
    if (table == nullptr) {
        return make_error_code(StorageErrc::TableNotFound);
    }

    auto& stored = table->rows[key.row_id];
    stored = std::move(row);
    out_row = stored;
    return {};
}

std::error_code MemoryStore::del_data(const MemoryKey& key)
{
    auto* table = find_table(key.table_name);
    if (table == nullptr) {
        return make_error_code(StorageErrc::TableNotFound);
    }
    if (table->rows.erase(key.row_id) == 0U) {
        return make_error_code(StorageErrc::RowNotFound);
    }
    return {};
}

std::error_code MemoryStore::scan_data(std::string_view table_name,
                                       std::unique_ptr<RowScanCursor<MemoryKey>>& out_cursor) const
{
    const auto* table = find_table(table_name);
    if (table == nullptr) {
        return make_error_code(StorageErrc::TableNotFound);
    }

    std::vector<std::uint64_t> row_ids;
    row_ids.reserve(table->rows.size());
    for (const auto& [row_id, row] : table->rows) {
        row_ids.push_back(row_id);
    }
    out_cursor = std::make_unique<Cursor>(*this, table->schema.table_name, std::move(row_ids));
    return {};
}

std::error_code MemoryStore::get_data(const MemoryKey& key, data::Row& out_row) const
{
    const auto* table = find_table(key.table_name);
    if (table == nullptr) {
        return make_error_code(StorageErrc::TableNotFound);
    }
    const auto it = table->rows.find(key.row_id);
    if (it == table->rows.end()) {
        return make_error_code(StorageErrc::RowNotFound);
    }
    out_row = it->second;
    return {};
}

std::vector<std::string> MemoryStore::table_names() const
{
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [name, table] : tables_) {
        names.push_back(name);
    }
    return names;
}

std::size_t MemoryStore::row_count(std::string_view table_name) const noexcept
{
    const auto* table = find_table(table_name);
    return table != nullptr ? table->rows.size() : 0U;
}

const MemoryStore::Table* MemoryStore::find_table(std::string_view table_name) const noexcept
{
    const auto it = tables_.find(table_name);
    return it != tables_.end() ? &it->second : nullptr;
}

MemoryStore::Table* MemoryStore::find_table(std::string_view table_name) noexcept
{
    const auto it = tables_.find(table_name);
    return it != tables_.end() ? &it->second : nullptr;
}

}  // namespace cairn::storage
