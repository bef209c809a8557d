#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cairn::data {

enum class DataType : std::uint8_t {
    Boolean = 0,
    Integer,
    Float,
    Text
};

// std::monostate is SQL NULL.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

[[nodiscard]] inline bool is_null(const Value& value) noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] std::optional<DataType> value_type(const Value& value) noexcept;
[[nodiscard]] std::string_view data_type_name(DataType type) noexcept;
[[nodiscard]] std::optional<DataType> parse_data_type(std::string_view type_name);

// Renders a value the way it would be written as a SQL literal.
[[nodiscard]] std::string format_value(const Value& value);

}  // namespace cairn::data
