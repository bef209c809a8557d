#pragma once

#include "cairn/data/schema.hpp"
#include "cairn/parser/ast.hpp"
#include "cairn/storage/store.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cairn::executor {

// Reduces `table` or `schema.table` to the table identifier. Throws
// DataErrc::InvalidTableName for anything else.
[[nodiscard]] std::string get_table_name(const parser::QualifiedName& name);

template <typename Key>
[[nodiscard]] data::Schema fetch_schema(const storage::Store<Key>& storage, std::string_view table_name)
{
    data::Schema schema{};
    if (const auto ec = storage.get_schema(table_name, schema)) {
        throw std::system_error(ec, "get_schema " + std::string{table_name});
    }
    return schema;
}

template <typename Key>
[[nodiscard]] std::vector<std::string> fetch_columns(const storage::Store<Key>& storage, std::string_view table_name)
{
    return fetch_schema(storage, table_name).column_names();
}

}  // namespace cairn::executor
