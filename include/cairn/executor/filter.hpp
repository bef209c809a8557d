#pragma once

#include "cairn/data/row.hpp"
#include "cairn/data/schema.hpp"
#include "cairn/executor/evaluate.hpp"
#include "cairn/parser/ast.hpp"
#include "cairn/storage/store.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cairn::executor {

// Runs subqueries through the select pipeline; defined in select.hpp.
template <typename Key>
SubqueryRunner make_subquery_runner(const storage::Store<Key>& storage);

// Decides whether a row passes an optional WHERE or ON predicate. FALSE and
// unknown both reject; an absent predicate accepts every row.
template <typename Key>
class Filter final {
public:
    Filter(const storage::Store<Key>& storage,
           const parser::Expression* predicate,
           const FilterContext* context = nullptr)
        : storage_{&storage}
        , predicate_{predicate}
        , context_{context}
    {
    }

    [[nodiscard]] bool matches(const data::Schema& schema, const data::Row& row) const
    {
        if (predicate_ == nullptr) {
            return true;
        }
        const auto columns = schema.column_names();
        return matches(schema.table_name, columns, row);
    }

    [[nodiscard]] bool matches(std::string_view table_name,
                               const std::vector<std::string>& columns,
                               const data::Row& row) const
    {
        if (predicate_ == nullptr) {
            return true;
        }
        const FilterContext scope{table_name, &columns, &row, context_};
        return matches(scope);
    }

    // `scope` is used as-is, so it must already chain to any outer scopes.
    [[nodiscard]] bool matches(const FilterContext& scope) const
    {
        if (predicate_ == nullptr) {
            return true;
        }
        const Evaluator evaluator{Evaluator::Config{&scope, make_subquery_runner(*storage_)}};
        return evaluator.evaluate_predicate(*predicate_) == true;
    }

    [[nodiscard]] const parser::Expression* predicate() const noexcept { return predicate_; }
    [[nodiscard]] const FilterContext* context() const noexcept { return context_; }

private:
    const storage::Store<Key>* storage_ = nullptr;
    const parser::Expression* predicate_ = nullptr;
    const FilterContext* context_ = nullptr;
};

}  // namespace cairn::executor

#include "cairn/executor/select.hpp"
