#pragma once

#include "cairn/data/row.hpp"
#include "cairn/data/value.hpp"
#include "cairn/parser/ast.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::executor {

// One row in scope during evaluation. Scopes chain outward through `next`,
// which is how correlated subqueries see the rows of the enclosing query.
// `joined` marks a scope whose `next` is another source of the same query.
struct FilterContext final {
    std::string_view table_name{};
    const std::vector<std::string>* columns = nullptr;
    const data::Row* row = nullptr;
    const FilterContext* next = nullptr;
    bool joined = false;
};

using SubqueryRunner =
    std::function<std::vector<data::Row>(const parser::QuerySpecification& query, const FilterContext* context)>;

// Deepest expression tree evaluated before EvaluateErrc::ExpressionTooDeep.
inline constexpr std::size_t max_evaluation_depth = 1024U;

// Evaluates expressions against the scopes in `context`. Faults are thrown as
// std::system_error carrying an EvaluateErrc.
class Evaluator final {
public:
    struct Config final {
        const FilterContext* context = nullptr;
        SubqueryRunner subquery{};
    };

    explicit Evaluator(Config config);

    [[nodiscard]] data::Value evaluate(const parser::Expression& expression) const;

    // Three-valued result: nullopt is unknown.
    [[nodiscard]] std::optional<bool> evaluate_predicate(const parser::Expression& expression) const;

    [[nodiscard]] const FilterContext* context() const noexcept { return config_.context; }

private:
    Config config_{};
    mutable std::size_t depth_ = 0U;
};

// Orders two non-null values; nullopt when either side is NULL. Throws
// EvaluateErrc::IncompatibleTypes when the types cannot be compared.
[[nodiscard]] std::optional<int> compare_values(const data::Value& left, const data::Value& right);

// Converts a literal node to its value.
[[nodiscard]] data::Value literal_value(const parser::LiteralExpression& literal);

}  // namespace cairn::executor
