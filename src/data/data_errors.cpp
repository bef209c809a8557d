#include "cairn/data/data_errors.hpp"

namespace cairn::data {

namespace {

class DataErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "cairn.data";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<DataErrc>(condition)) {
        case DataErrc::Success:
            return "success";
        case DataErrc::InvalidTableName:
            return "table name does not resolve to a single identifier";
        case DataErrc::UnknownDataType:
            return "unknown data type";
        default:
            return "unknown data error";
        }
    }
};

class RowErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "cairn.row";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<RowErrc>(condition)) {
        case RowErrc::Success:
            return "success";
        case RowErrc::ColumnNotFound:
            return "column not found";
        case RowErrc::DuplicateColumn:
            return "column listed more than once";
        case RowErrc::ValueCountMismatch:
            return "value count does not match column count";
        case RowErrc::MultipleRowsNotSupported:
            return "only a single VALUES row is supported";
        case RowErrc::LackOfRequiredColumn:
            return "lack of required column";
        case RowErrc::NullValueOnNotNullColumn:
            return "null value on not null column";
        case RowErrc::IncompatibleDataType:
            return "value is incompatible with the column data type";
        default:
            return "unknown row error";
        }
    }
};

const DataErrorCategory kDataCategory{};
const RowErrorCategory kRowCategory{};

}  // namespace

const std::error_category& data_error_category() noexcept
{
    return kDataCategory;
}

const std::error_category& row_error_category() noexcept
{
    return kRowCategory;
}

std::error_code make_error_code(DataErrc value) noexcept
{
    return {static_cast<int>(value), data_error_category()};
}

std::error_code make_error_code(RowErrc value) noexcept
{
    return {static_cast<int>(value), row_error_category()};
}

}  // namespace cairn::data
