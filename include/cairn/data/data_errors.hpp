#pragma once

#include <system_error>

namespace cairn::data {

enum class DataErrc {
    Success = 0,
    InvalidTableName,
    UnknownDataType
};

enum class RowErrc {
    Success = 0,
    ColumnNotFound,
    DuplicateColumn,
    ValueCountMismatch,
    MultipleRowsNotSupported,
    LackOfRequiredColumn,
    NullValueOnNotNullColumn,
    IncompatibleDataType
};

const std::error_category& data_error_category() noexcept;
const std::error_category& row_error_category() noexcept;
std::error_code make_error_code(DataErrc value) noexcept;
std::error_code make_error_code(RowErrc value) noexcept;

}  // namespace cairn::data

namespace std {

template <>
struct is_error_code_enum<cairn::data::DataErrc> : true_type {
};

template <>
struct is_error_code_enum<cairn::data::RowErrc> : true_type {
};

}  // namespace std
