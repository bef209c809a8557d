#include "cairn/data/value.hpp"

#include <cctype>
#include <sstream>

namespace cairn::data {

namespace {

[[nodiscard]] std::string uppercase(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (const unsigned char ch : text) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

}  // namespace

std::optional<DataType> value_type(const Value& value) noexcept
{
    switch (value.index()) {
    case 1U:
        return DataType::Boolean;
    case 2U:
        return DataType::Integer;
    case 3U:
        return DataType::Float;
    case 4U:
        return DataType::Text;
    default:
        return std::nullopt;
    }
}

std::string_view data_type_name(DataType type) noexcept
{
    switch (type) {
    case DataType::Boolean:
        return "BOOLEAN";
    case DataType::Integer:
        return "INT";
    case DataType::Float:
        return "FLOAT";
    case DataType::Text:
    default:
        return "TEXT";
    }
}

std::optional<DataType> parse_data_type(std::string_view type_name)
{
    const auto name = uppercase(type_name);
    if (name == "BOOLEAN" || name == "BOOL") {
        return DataType::Boolean;
    }
    if (name == "INT" || name == "INTEGER" || name == "BIGINT" || name == "SMALLINT") {
        return DataType::Integer;
    }
    if (name == "FLOAT" || name == "REAL" || name == "DOUBLE" || name == "DECIMAL") {
        return DataType::Float;
    }
    if (name == "TEXT" || name == "VARCHAR" || name == "CHAR" || name == "STRING") {
        return DataType::Text;
    }
    return std::nullopt;
}

std::string format_value(const Value& value)
{
    if (is_null(value)) {
        return "NULL";
    }
    if (const auto* boolean = std::get_if<bool>(&value)) {
        return *boolean ? "TRUE" : "FALSE";
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*integer);
    }
    if (const auto* real = std::get_if<double>(&value)) {
        std::ostringstream stream;
        stream << *real;
        return stream.str();
    }

    const auto& text = std::get<std::string>(value);
    std::string result;
    result.reserve(text.size() + 2U);
    result.push_back('\'');
    for (const char ch : text) {
        if (ch == '\'') {
            result.push_back('\'');
        }
        result.push_back(ch);
    }
    result.push_back('\'');
    return result;
}

}  // namespace cairn::data
