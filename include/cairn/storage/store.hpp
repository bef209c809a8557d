#pragma once

#include "cairn/data/row.hpp"
#include "cairn/data/schema.hpp"

#include <memory>
#include <string_view>
#include <system_error>

namespace cairn::storage {

// Yields the rows of one table. Faults while reading are thrown as
// std::system_error.
template <typename Key>
class RowScanCursor {
public:
    virtual ~RowScanCursor() = default;

    virtual bool next(Key& out_key, data::Row& out_row) = 0;
};

// Backend contract for the executor. Keys are produced by gen_id and handed
// back unchanged; callers never build or inspect them. A backend must allow
// set_data and del_data on a table while a cursor over it is open without
// skipping rows or yielding a row twice.
template <typename Key>
class Store {
public:
    using key_type = Key;

    virtual ~Store() = default;

    virtual std::error_code set_schema(const data::Schema& schema) = 0;
    virtual std::error_code get_schema(std::string_view table_name, data::Schema& out_schema) const = 0;
    virtual std::error_code del_schema(std::string_view table_name) = 0;

    virtual std::error_code gen_id(std::string_view table_name, Key& out_key) = 0;
    virtual std::error_code set_data(const Key& key, data::Row row, data::Row& out_row) = 0;
    virtual std::error_code del_data(const Key& key) = 0;

    virtual std::error_code scan_data(std::string_view table_name,
                                      std::unique_ptr<RowScanCursor<Key>>& out_cursor) const = 0;
};

}  // namespace cairn::storage
