#include "cairn/data/schema.hpp"
#include "cairn/data/data_errors.hpp"

#include <cstdint>

namespace cairn::data {

std::optional<std::size_t> Schema::column_index(std::string_view column_name) const noexcept
{
    for (std::size_t index = 0U; index < column_defs.size(); ++index) {
        if (column_defs[index].name == column_name) {
            return index;
        }
    }
    return std::nullopt;
}

std::vector<std::string> Schema::column_names() const
{
    std::vector<std::string> names;
    names.reserve(column_defs.size());
    for (const auto& column : column_defs) {
        names.push_back(column.name);
    }
    return names;
}

std::error_code conform_value(const ColumnDefinition& column, const Value& value, Value& out_value)
{
    if (is_null(value)) {
        if (!column.nullable) {
            return make_error_code(RowErrc::NullValueOnNotNullColumn);
        }
        out_value = std::monostate{};
        return {};
    }

    switch (column.data_type) {
    case DataType::Boolean:
        if (std::holds_alternative<bool>(value)) {
            out_value = value;
            return {};
        }
        break;
    case DataType::Integer:
        if (std::holds_alternative<std::int64_t>(value)) {
            out_value = value;
            return {};
        }
        break;
    case DataType::Float:
        if (const auto* integer = std::get_if<std::int64_t>(&value)) {
            out_value = static_cast<double>(*integer);
            return {};
        }
        if (std::holds_alternative<double>(value)) {
            out_value = value;
            return {};
        }
        break;
    case DataType::Text:
        if (std::holds_alternative<std::string>(value)) {
            out_value = value;
            return {};
        }
        break;
    }

    return make_error_code(RowErrc::IncompatibleDataType);
}

}  // namespace cairn::data
