#pragma once

#include <system_error>

namespace cairn::executor {

enum class ExecuteErrc {
    Success = 0,
    QueryNotSupported,
    DropTypeNotSupported
};

enum class EvaluateErrc {
    Success = 0,
    ColumnNotFound,
    AmbiguousColumn,
    IncompatibleTypes,
    DivisionByZero,
    IntegerOverflow,
    NonBooleanPredicate,
    UnsupportedExpression,
    SubqueryColumnCount,
    SubqueryRowCount,
    ExpressionTooDeep
};

enum class UpdateErrc {
    Success = 0,
    ColumnNotFound
};

enum class SelectErrc {
    Success = 0,
    TableAliasNotFound,
    WildcardWithoutTable,
    InvalidLimit
};

const std::error_category& execute_error_category() noexcept;
const std::error_category& evaluate_error_category() noexcept;
const std::error_category& update_error_category() noexcept;
const std::error_category& select_error_category() noexcept;

std::error_code make_error_code(ExecuteErrc value) noexcept;
std::error_code make_error_code(EvaluateErrc value) noexcept;
std::error_code make_error_code(UpdateErrc value) noexcept;
std::error_code make_error_code(SelectErrc value) noexcept;

}  // namespace cairn::executor

namespace std {

template <>
struct is_error_code_enum<cairn::executor::ExecuteErrc> : true_type {
};

template <>
struct is_error_code_enum<cairn::executor::EvaluateErrc> : true_type {
};

template <>
struct is_error_code_enum<cairn::executor::UpdateErrc> : true_type {
};

template <>
struct is_error_code_enum<cairn::executor::SelectErrc> : true_type {
};

}  // namespace std
