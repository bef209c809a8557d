#include "cairn/executor/evaluate.hpp"
#include "cairn/executor/executor_errors.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <system_error>
#include <utility>

namespace cairn::executor {
namespace {

[[noreturn]] void fail(EvaluateErrc code, const std::string& context)
{
    throw std::system_error(make_error_code(code), context);
}

bool is_numeric(const data::Value& value) noexcept
{
    return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
}

// Exact ordering of an integer against a float: the integer is never rounded
// to double, so values beyond 2^53 still compare correctly.
int compare_integer_float(std::int64_t integer, double real) noexcept
{
    constexpr double two_pow_63 = 9223372036854775808.0;
    if (std::isnan(real)) {
        return 0;
    }
    if (real >= two_pow_63) {
        return -1;
    }
    if (real < -two_pow_63) {
        return 1;
    }
    const double whole = std::trunc(real);
    const auto truncated = static_cast<std::int64_t>(whole);
    if (integer != truncated) {
        return integer < truncated ? -1 : 1;
    }
    const double fraction = real - whole;
    return fraction > 0.0 ? -1 : (fraction < 0.0 ? 1 : 0);
}

double as_double(const data::Value& value) noexcept
{
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*integer);
    }
    return std::get<double>(value);
}

std::optional<bool> as_truth(const data::Value& value, std::string_view context)
{
    if (data::is_null(value)) {
        return std::nullopt;
    }
    if (const auto* boolean = std::get_if<bool>(&value)) {
        return *boolean;
    }
    fail(EvaluateErrc::NonBooleanPredicate, std::string{context} + ": " + data::format_value(value));
}

data::Value from_truth(std::optional<bool> truth)
{
    if (!truth) {
        return data::Value{};
    }
    return data::Value{*truth};
}

std::optional<bool> negate(std::optional<bool> truth) noexcept
{
    if (!truth) {
        return std::nullopt;
    }
    return !*truth;
}

data::Value integer_arithmetic(parser::BinaryOperator op, std::int64_t left, std::int64_t right)
{
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();

    switch (op) {
    case parser::BinaryOperator::Add:
        if ((right > 0 && left > max - right) || (right < 0 && left < min - right)) {
            fail(EvaluateErrc::IntegerOverflow, "integer addition");
        }
        return data::Value{left + right};
    case parser::BinaryOperator::Subtract:
        if ((right < 0 && left > max + right) || (right > 0 && left < min + right)) {
            fail(EvaluateErrc::IntegerOverflow, "integer subtraction");
        }
        return data::Value{left - right};
    case parser::BinaryOperator::Multiply: {
        bool overflow = false;
        if (left > 0) {
            overflow = right > 0 ? left > max / right : right < min / left;
        } else if (left < 0) {
            overflow = right > 0 ? left < min / right : (right != 0 && left < max / right);
        }
        if (overflow) {
            fail(EvaluateErrc::IntegerOverflow, "integer multiplication");
        }
        return data::Value{left * right};
    }
    case parser::BinaryOperator::Divide:
        if (right == 0) {
            fail(EvaluateErrc::DivisionByZero, "integer division");
        }
        if (left == min && right == -1) {
            fail(EvaluateErrc::IntegerOverflow, "integer division");
        }
        return data::Value{left / right};
    default:
        break;
    }
    fail(EvaluateErrc::UnsupportedExpression, "arithmetic operator");
}

data::Value float_arithmetic(parser::BinaryOperator op, double left, double right)
{
    switch (op) {
    case parser::BinaryOperator::Add:
        return data::Value{left + right};
    case parser::BinaryOperator::Subtract:
        return data::Value{left - right};
    case parser::BinaryOperator::Multiply:
        return data::Value{left * right};
    case parser::BinaryOperator::Divide:
        if (right == 0.0) {
            fail(EvaluateErrc::DivisionByZero, "float division");
        }
        return data::Value{left / right};
    default:
        break;
    }
    fail(EvaluateErrc::UnsupportedExpression, "arithmetic operator");
}

data::Value arithmetic(parser::BinaryOperator op, const data::Value& left, const data::Value& right)
{
    if (data::is_null(left) || data::is_null(right)) {
        return data::Value{};
    }
    if (!is_numeric(left) || !is_numeric(right)) {
        fail(EvaluateErrc::IncompatibleTypes,
             "arithmetic on " + data::format_value(left) + " and " + data::format_value(right));
    }

    const auto* left_integer = std::get_if<std::int64_t>(&left);
    const auto* right_integer = std::get_if<std::int64_t>(&right);
    if (left_integer != nullptr && right_integer != nullptr) {
        return integer_arithmetic(op, *left_integer, *right_integer);
    }
    return float_arithmetic(op, as_double(left), as_double(right));
}

std::optional<bool> comparison(parser::BinaryOperator op, const data::Value& left, const data::Value& right)
{
    const auto order = compare_values(left, right);
    if (!order) {
        return std::nullopt;
    }

    switch (op) {
    case parser::BinaryOperator::Equal:
        return *order == 0;
    case parser::BinaryOperator::NotEqual:
        return *order != 0;
    case parser::BinaryOperator::Less:
        return *order < 0;
    case parser::BinaryOperator::LessOrEqual:
        return *order <= 0;
    case parser::BinaryOperator::Greater:
        return *order > 0;
    case parser::BinaryOperator::GreaterOrEqual:
        return *order >= 0;
    default:
        break;
    }
    fail(EvaluateErrc::UnsupportedExpression, "comparison operator");
}

// SQL IN semantics: true on any match, otherwise unknown if a NULL was seen.
std::optional<bool> membership(const data::Value& needle, const std::vector<data::Value>& candidates)
{
    if (data::is_null(needle)) {
        return candidates.empty() ? std::optional<bool>{false} : std::nullopt;
    }

    bool saw_null = false;
    for (const auto& candidate : candidates) {
        const auto order = compare_values(needle, candidate);
        if (!order) {
            saw_null = true;
        } else if (*order == 0) {
            return true;
        }
    }
    if (saw_null) {
        return std::nullopt;
    }
    return false;
}

const data::Value* column_in_scope(const FilterContext& scope, const std::string& column, const std::string* qualifier)
{
    if (scope.columns == nullptr || scope.row == nullptr) {
        return nullptr;
    }
    if (qualifier != nullptr && scope.table_name != *qualifier) {
        return nullptr;
    }
    const auto& columns = *scope.columns;
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        if (columns[index] != column) {
            continue;
        }
        static const data::Value null_value{};
        const auto* value = scope.row->get(index);
        return value != nullptr ? value : &null_value;
    }
    return nullptr;
}

// Scopes of one query level (linked by `joined`) are searched together and a
// name found in more than one of them is ambiguous. Enclosing levels are only
// consulted when the current level has no match.
const data::Value* lookup_column(const FilterContext* context, const parser::QualifiedName& name)
{
    const auto& parts = name.parts;
    const auto& column = parts.back().value;
    const std::string* qualifier = parts.size() >= 2U ? &parts[parts.size() - 2U].value : nullptr;

    const auto* scope = context;
    while (scope != nullptr) {
        const data::Value* found = nullptr;
        bool more = true;
        while (scope != nullptr && more) {
            more = scope->joined;
            if (const auto* value = column_in_scope(*scope, column, qualifier)) {
                if (found != nullptr) {
                    fail(EvaluateErrc::AmbiguousColumn, parser::format_qualified_name(name));
                }
                found = value;
            }
            scope = scope->next;
        }
        if (found != nullptr) {
            return found;
        }
    }
    return nullptr;
}

class EvaluationVisitor final : public parser::ExpressionVisitor {
public:
    EvaluationVisitor(const Evaluator& evaluator, const SubqueryRunner& subquery)
        : evaluator_{evaluator}
        , subquery_{subquery}
    {
    }

    void visit(const parser::IdentifierExpression& expression) override
    {
        if (expression.name.empty()) {
            fail(EvaluateErrc::ColumnNotFound, "empty column reference");
        }
        const auto* value = lookup_column(evaluator_.context(), expression.name);
        if (value == nullptr) {
            fail(EvaluateErrc::ColumnNotFound, parser::format_qualified_name(expression.name));
        }
        result_ = *value;
    }

    void visit(const parser::LiteralExpression& expression) override
    {
        result_ = literal_value(expression);
    }

    void visit(const parser::UnaryExpression& expression) override
    {
        const auto operand = child(expression.operand);
        switch (expression.op) {
        case parser::UnaryOperator::Not:
            result_ = from_truth(negate(as_truth(operand, "NOT operand")));
            return;
        case parser::UnaryOperator::Minus:
            if (data::is_null(operand)) {
                result_ = data::Value{};
            } else if (const auto* integer = std::get_if<std::int64_t>(&operand)) {
                if (*integer == std::numeric_limits<std::int64_t>::min()) {
                    fail(EvaluateErrc::IntegerOverflow, "integer negation");
                }
                result_ = data::Value{-*integer};
            } else if (const auto* real = std::get_if<double>(&operand)) {
                result_ = data::Value{-*real};
            } else {
                fail(EvaluateErrc::IncompatibleTypes, "negation of " + data::format_value(operand));
            }
            return;
        case parser::UnaryOperator::Plus:
            if (!data::is_null(operand) && !is_numeric(operand)) {
                fail(EvaluateErrc::IncompatibleTypes, "unary plus on " + data::format_value(operand));
            }
            result_ = operand;
            return;
        }
        fail(EvaluateErrc::UnsupportedExpression, "unary operator");
    }

    void visit(const parser::BinaryExpression& expression) override
    {
        switch (expression.op) {
        case parser::BinaryOperator::And: {
            const auto left = as_truth(child(expression.left), "AND operand");
            if (left == false) {
                result_ = data::Value{false};
                return;
            }
            const auto right = as_truth(child(expression.right), "AND operand");
            if (right == false) {
                result_ = data::Value{false};
            } else if (!left || !right) {
                result_ = data::Value{};
            } else {
                result_ = data::Value{true};
            }
            return;
        }
        case parser::BinaryOperator::Or: {
            const auto left = as_truth(child(expression.left), "OR operand");
            if (left == true) {
                result_ = data::Value{true};
                return;
            }
            const auto right = as_truth(child(expression.right), "OR operand");
            if (right == true) {
                result_ = data::Value{true};
            } else if (!left || !right) {
                result_ = data::Value{};
            } else {
                result_ = data::Value{false};
            }
            return;
        }
        case parser::BinaryOperator::Add:
        case parser::BinaryOperator::Subtract:
        case parser::BinaryOperator::Multiply:
        case parser::BinaryOperator::Divide:
            result_ = arithmetic(expression.op, child(expression.left), child(expression.right));
            return;
        default:
            result_ = from_truth(comparison(expression.op, child(expression.left), child(expression.right)));
            return;
        }
    }

    void visit(const parser::StarExpression&) override
    {
        fail(EvaluateErrc::UnsupportedExpression, "'*' outside of a select list");
    }

    void visit(const parser::IsNullExpression& expression) override
    {
        const auto is_null = data::is_null(child(expression.operand));
        result_ = data::Value{expression.negated ? !is_null : is_null};
    }

    void visit(const parser::BetweenExpression& expression) override
    {
        const auto operand = child(expression.operand);
        const auto low = comparison(parser::BinaryOperator::GreaterOrEqual, operand, child(expression.low));
        const auto high = comparison(parser::BinaryOperator::LessOrEqual, operand, child(expression.high));

        std::optional<bool> within{};
        if (low == false || high == false) {
            within = false;
        } else if (low && high) {
            within = true;
        }
        result_ = from_truth(expression.negated ? negate(within) : within);
    }

    void visit(const parser::InListExpression& expression) override
    {
        const auto operand = child(expression.operand);
        std::vector<data::Value> candidates;
        candidates.reserve(expression.items.size());
        for (const auto* item : expression.items) {
            candidates.push_back(child(item));
        }
        const auto found = membership(operand, candidates);
        result_ = from_truth(expression.negated ? negate(found) : found);
    }

    void visit(const parser::InSubqueryExpression& expression) override
    {
        const auto operand = child(expression.operand);
        const auto rows = run(expression.query);
        std::vector<data::Value> candidates;
        candidates.reserve(rows.size());
        for (const auto& row : rows) {
            if (row.size() != 1U) {
                fail(EvaluateErrc::SubqueryColumnCount, "IN subquery");
            }
            candidates.push_back(row.values.front());
        }
        const auto found = membership(operand, candidates);
        result_ = from_truth(expression.negated ? negate(found) : found);
    }

    void visit(const parser::ExistsExpression& expression) override
    {
        result_ = data::Value{!run(expression.query).empty()};
    }

    void visit(const parser::SubqueryExpression& expression) override
    {
        const auto rows = run(expression.query);
        if (rows.empty()) {
            result_ = data::Value{};
            return;
        }
        if (rows.size() > 1U) {
            fail(EvaluateErrc::SubqueryRowCount, "scalar subquery");
        }
        if (rows.front().size() != 1U) {
            fail(EvaluateErrc::SubqueryColumnCount, "scalar subquery");
        }
        result_ = rows.front().values.front();
    }

    [[nodiscard]] data::Value take() { return std::move(result_); }

private:
    data::Value child(const parser::Expression* expression) const
    {
        if (expression == nullptr) {
            fail(EvaluateErrc::UnsupportedExpression, "missing operand");
        }
        return evaluator_.evaluate(*expression);
    }

    std::vector<data::Row> run(const parser::QuerySpecification* query) const
    {
        if (query == nullptr || !subquery_) {
            fail(EvaluateErrc::UnsupportedExpression, "subquery");
        }
        return subquery_(*query, evaluator_.context());
    }

    const Evaluator& evaluator_;
    const SubqueryRunner& subquery_;
    data::Value result_{};
};

}  // namespace

Evaluator::Evaluator(Config config)
    : config_{std::move(config)}
{
}

data::Value Evaluator::evaluate(const parser::Expression& expression) const
{
    struct DepthGuard final {
        explicit DepthGuard(std::size_t& depth)
            : depth_{depth}
        {
            ++depth_;
        }
        ~DepthGuard() { --depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

        std::size_t& depth_;
    };

    const DepthGuard guard{depth_};
    if (depth_ > max_evaluation_depth) {
        fail(EvaluateErrc::ExpressionTooDeep, "expression depth " + std::to_string(depth_));
    }
    EvaluationVisitor visitor{*this, config_.subquery};
    expression.accept(visitor);
    return visitor.take();
}

std::optional<bool> Evaluator::evaluate_predicate(const parser::Expression& expression) const
{
    return as_truth(evaluate(expression), "predicate");
}

std::optional<int> compare_values(const data::Value& left, const data::Value& right)
{
    if (data::is_null(left) || data::is_null(right)) {
        return std::nullopt;
    }

    if (is_numeric(left) && is_numeric(right)) {
        const auto* left_integer = std::get_if<std::int64_t>(&left);
        const auto* right_integer = std::get_if<std::int64_t>(&right);
        if (left_integer != nullptr && right_integer != nullptr) {
            return *left_integer < *right_integer ? -1 : (*left_integer > *right_integer ? 1 : 0);
        }
        if (left_integer != nullptr) {
            return compare_integer_float(*left_integer, std::get<double>(right));
        }
        if (right_integer != nullptr) {
            return -compare_integer_float(*right_integer, std::get<double>(left));
        }
        const auto lhs = as_double(left);
        const auto rhs = as_double(right);
        return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
    }

    if (const auto* left_bool = std::get_if<bool>(&left)) {
        if (const auto* right_bool = std::get_if<bool>(&right)) {
            return static_cast<int>(*left_bool) - static_cast<int>(*right_bool);
        }
    }

    if (const auto* left_text = std::get_if<std::string>(&left)) {
        if (const auto* right_text = std::get_if<std::string>(&right)) {
            const auto order = left_text->compare(*right_text);
            return order < 0 ? -1 : (order > 0 ? 1 : 0);
        }
    }

    fail(EvaluateErrc::IncompatibleTypes,
         "cannot compare " + data::format_value(left) + " with " + data::format_value(right));
}

data::Value literal_value(const parser::LiteralExpression& literal)
{
    switch (literal.tag) {
    case parser::LiteralTag::Null:
        return data::Value{};
    case parser::LiteralTag::Boolean:
        return data::Value{literal.boolean_value};
    case parser::LiteralTag::Integer: {
        std::int64_t value = 0;
        const auto* begin = literal.text.data();
        const auto* end = begin + literal.text.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec == std::errc::result_out_of_range) {
            fail(EvaluateErrc::IntegerOverflow, "integer literal " + literal.text);
        }
        if (ec != std::errc{} || ptr != end) {
            fail(EvaluateErrc::UnsupportedExpression, "integer literal " + literal.text);
        }
        return data::Value{value};
    }
    case parser::LiteralTag::Decimal: {
        char* end = nullptr;
        const auto value = std::strtod(literal.text.c_str(), &end);
        if (end != literal.text.c_str() + literal.text.size()) {
            fail(EvaluateErrc::UnsupportedExpression, "decimal literal " + literal.text);
        }
        return data::Value{value};
    }
    case parser::LiteralTag::String:
        return data::Value{literal.text};
    }
    fail(EvaluateErrc::UnsupportedExpression, "literal");
}

}  // namespace cairn::executor
