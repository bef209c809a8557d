#pragma once

#include "cairn/data/row.hpp"
#include "cairn/data/schema.hpp"
#include "cairn/executor/filter.hpp"
#include "cairn/executor/schema_lookup.hpp"
#include "cairn/parser/ast.hpp"
#include "cairn/storage/store.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace cairn::executor {

// Lazy sequence of the rows of one table that pass a filter. Single pass.
template <typename Key>
class FetchCursor final {
public:
    FetchCursor(data::Schema schema, std::unique_ptr<storage::RowScanCursor<Key>> scan, Filter<Key> filter)
        : schema_{std::move(schema)}
        , columns_{schema_.column_names()}
        , scan_{std::move(scan)}
        , filter_{std::move(filter)}
    {
    }

    bool next(Key& out_key, data::Row& out_row)
    {
        while (scan_ && scan_->next(out_key, out_row)) {
            if (filter_.matches(schema_.table_name, columns_, out_row)) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] const data::Schema& schema() const noexcept { return schema_; }
    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }

private:
    data::Schema schema_{};
    std::vector<std::string> columns_{};
    std::unique_ptr<storage::RowScanCursor<Key>> scan_{};
    Filter<Key> filter_;
};

template <typename Key>
[[nodiscard]] FetchCursor<Key> fetch(const storage::Store<Key>& storage,
                                     std::string_view table_name,
                                     const Filter<Key>& filter)
{
    auto schema = fetch_schema(storage, table_name);
    std::unique_ptr<storage::RowScanCursor<Key>> scan;
    if (const auto ec = storage.scan_data(table_name, scan)) {
        throw std::system_error(ec, "scan_data " + std::string{table_name});
    }
    return FetchCursor<Key>{std::move(schema), std::move(scan), filter};
}

}  // namespace cairn::executor
