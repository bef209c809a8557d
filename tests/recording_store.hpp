#pragma once

#include "cairn/storage/storage_errors.hpp"
#include "cairn/storage/store.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cairn::test {

// Store keyed by opaque strings such as "people#0002" that logs every call it
// receives. Used to check which storage operations a statement performs.
class RecordingStore final : public storage::Store<std::string> {
public:
    std::error_code set_schema(const data::Schema& schema) override
    {
        calls.push_back("set_schema " + schema.table_name);
        if (schemas_.contains(schema.table_name)) {
            return make_error_code(storage::StorageErrc::TableAlreadyExists);
        }
        schemas_.emplace(schema.table_name, schema);
        return {};
    }

    std::error_code get_schema(std::string_view table_name, data::Schema& out_schema) const override
    {
        calls.push_back("get_schema " + std::string{table_name});
        const auto it = schemas_.find(std::string{table_name});
        if (it == schemas_.end()) {
            return make_error_code(storage::StorageErrc::TableNotFound);
        }
        out_schema = it->second;
        return {};
    }

    std::error_code del_schema(std::string_view table_name) override
    {
        calls.push_back("del_schema " + std::string{table_name});
        if (schemas_.erase(std::string{table_name}) == 0U) {
            return make_error_code(storage::StorageErrc::TableNotFound);
        }
        return {};
    }

    std::error_code gen_id(std::string_view table_name, std::string& out_key) override
    {
        calls.push_back("gen_id " + std::string{table_name});
        if (!schemas_.contains(std::string{table_name})) {
            return make_error_code(storage::StorageErrc::TableNotFound);
        }
        auto number = std::to_string(++sequence_);
        number.insert(0U, 4U - std::min<std::size_t>(4U, number.size()), '0');
        out_key = std::string{table_name} + "#" + number;
        return {};
    }

    std::error_code set_data(const std::string& key, data::Row row, data::Row& out_row) override
    {
        calls.push_back("set_data " + key);
        if (fail_set_data_after && set_data_count_++ >= *fail_set_data_after) {
            return make_error_code(storage::StorageErrc::RowNotFound);
        }
        auto& stored = rows_[key];
        stored = std::move(row);
        out_row = stored;
        return {};
    }

    std::error_code del_data(const std::string& key) override
    {
        calls.push_back("del_data " + key);
        if (fail_del_data_after && del_data_count_++ >= *fail_del_data_after) {
            return make_error_code(storage::StorageErrc::RowNotFound);
        }
        if (rows_.erase(key) == 0U) {
            return make_error_code(storage::StorageErrc::RowNotFound);
        }
        return {};
    }

    std::error_code scan_data(std::string_view table_name,
                              std::unique_ptr<storage::RowScanCursor<std::string>>& out_cursor) const override
    {
        calls.push_back("scan_data " + std::string{table_name});
        if (!schemas_.contains(std::string{table_name})) {
            return make_error_code(storage::StorageErrc::TableNotFound);
        }
        const auto prefix = std::string{table_name} + "#";
        std::vector<std::string> keys;
        for (const auto& [key, row] : rows_) {
            if (key.rfind(prefix, 0U) == 0U) {
                keys.push_back(key);
            }
        }
        out_cursor = std::make_unique<Cursor>(*this, std::move(keys));
        return {};
    }

    [[nodiscard]] const data::Row* find(const std::string& key) const
    {
        const auto it = rows_.find(key);
        return it != rows_.end() ? &it->second : nullptr;
    }

    [[nodiscard]] std::vector<std::string> keys() const
    {
        std::vector<std::string> result;
        for (const auto& [key, row] : rows_) {
            result.push_back(key);
        }
        return result;
    }

    [[nodiscard]] bool has_schema(const std::string& table_name) const { return schemas_.contains(table_name); }

    // Number of successful set_data calls allowed before the rest fail.
    std::optional<std::size_t> fail_set_data_after{};
    // Same for del_data.
    std::optional<std::size_t> fail_del_data_after{};
    mutable std::vector<std::string> calls{};

private:
    class Cursor final : public storage::RowScanCursor<std::string> {
    public:
        Cursor(const RecordingStore& store, std::vector<std::string> keys)
            : store_{&store}
            , keys_{std::move(keys)}
        {
        }

        bool next(std::string& out_key, data::Row& out_row) override
        {
            while (position_ < keys_.size()) {
                const auto& key = keys_[position_++];
                if (const auto* row = store_->find(key)) {
                    out_key = key;
                    out_row = *row;
                    return true;
                }
            }
            return false;
        }

    private:
        const RecordingStore* store_ = nullptr;
        std::vector<std::string> keys_{};
        std::size_t position_ = 0U;
    };

    std::map<std::string, data::Schema> schemas_{};
    std::map<std::string, data::Row> rows_{};
    std::uint64_t sequence_ = 0U;
    std::size_t set_data_count_ = 0U;
    std::size_t del_data_count_ = 0U;
};

}  // namespace cairn::test
