#pragma once

#include "cairn/data/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cairn::data {

struct ColumnDefinition final {
    std::string name{};
    DataType data_type = DataType::Integer;
    bool nullable = true;
    std::optional<Value> default_value{};

    bool operator==(const ColumnDefinition& other) const = default;
};

struct Schema final {
    std::string table_name{};
    std::vector<ColumnDefinition> column_defs{};

    [[nodiscard]] std::optional<std::size_t> column_index(std::string_view column_name) const noexcept;
    [[nodiscard]] std::vector<std::string> column_names() const;

    bool operator==(const Schema& other) const = default;
};

// Checks nullability and converts the value to the column type. INT widens to
// FLOAT; every other type change is rejected.
std::error_code conform_value(const ColumnDefinition& column, const Value& value, Value& out_value);

}  // namespace cairn::data
