#include "cairn/executor/executor_errors.hpp"

namespace cairn::executor {

namespace {

class ExecuteErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "cairn.execute";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ExecuteErrc>(condition)) {
        case ExecuteErrc::Success:
            return "success";
        case ExecuteErrc::QueryNotSupported:
            return "query not supported";
        case ExecuteErrc::DropTypeNotSupported:
            return "drop type not supported";
        default:
            return "unknown execute error";
        }
    }
};

class EvaluateErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "cairn.evaluate";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<EvaluateErrc>(condition)) {
        case EvaluateErrc::Success:
            return "success";
        case EvaluateErrc::ColumnNotFound:
            return "column not found";
        case EvaluateErrc::AmbiguousColumn:
            return "column reference is ambiguous";
        case EvaluateErrc::IncompatibleTypes:
            return "incompatible operand types";
        case EvaluateErrc::DivisionByZero:
            return "division by zero";
        case EvaluateErrc::IntegerOverflow:
            return "integer overflow";
        case EvaluateErrc::NonBooleanPredicate:
            return "predicate did not evaluate to a boolean";
        case EvaluateErrc::UnsupportedExpression:
            return "expression not supported in this context";
        case EvaluateErrc::SubqueryColumnCount:
            return "subquery must return exactly one column";
        case EvaluateErrc::SubqueryRowCount:
            return "scalar subquery returned more than one row";
        case EvaluateErrc::ExpressionTooDeep:
            return "expression nesting too deep";
        default:
            return "unknown evaluate error";
        }
    }
};

class UpdateErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "cairn.update";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<UpdateErrc>(condition)) {
        case UpdateErrc::Success:
            return "success";
        case UpdateErrc::ColumnNotFound:
            return "assignment target column not found";
        default:
            return "unknown update error";
        }
    }
};

class SelectErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "cairn.select";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<SelectErrc>(condition)) {
        case SelectErrc::Success:
            return "success";
        case SelectErrc::TableAliasNotFound:
            return "table alias not found";
        case SelectErrc::WildcardWithoutTable:
            return "wildcard requires a FROM clause";
        case SelectErrc::InvalidLimit:
            return "LIMIT and OFFSET must be non-negative integers";
        default:
            return "unknown select error";
        }
    }
};

const ExecuteErrorCategory kExecuteCategory{};
const EvaluateErrorCategory kEvaluateCategory{};
const UpdateErrorCategory kUpdateCategory{};
const SelectErrorCategory kSelectCategory{};

}  // namespace

const std::error_category& execute_error_category() noexcept
{
    return kExecuteCategory;
}

const std::error_category& evaluate_error_category() noexcept
{
    return kEvaluateCategory;
}

const std::error_category& update_error_category() noexcept
{
    return kUpdateCategory;
}

const std::error_category& select_error_category() noexcept
{
    return kSelectCategory;
}

std::error_code make_error_code(ExecuteErrc value) noexcept
{
    return {static_cast<int>(value), execute_error_category()};
}

std::error_code make_error_code(EvaluateErrc value) noexcept
{
    return {static_cast<int>(value), evaluate_error_category()};
}

std::error_code make_error_code(UpdateErrc value) noexcept
{
    return {static_cast<int>(value), update_error_category()};
}

std::error_code make_error_code(SelectErrc value) noexcept
{
    return {static_cast<int>(value), select_error_category()};
}

}  // namespace cairn::executor
