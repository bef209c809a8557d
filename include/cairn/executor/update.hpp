#pragma once

#include "cairn/data/row.hpp"
#include "cairn/data/schema.hpp"
#include "cairn/executor/evaluate.hpp"
#include "cairn/executor/executor_errors.hpp"
#include "cairn/executor/filter.hpp"
#include "cairn/parser/ast.hpp"
#include "cairn/storage/store.hpp"

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cairn::executor {

// Applies the SET list of an UPDATE to one row at a time. Every assignment
// reads the row as it was before the statement, so their order never matters.
template <typename Key>
class Update final {
public:
    Update(const storage::Store<Key>& storage,
           data::Schema schema,
           const std::vector<parser::UpdateAssignment>& assignments)
        : storage_{&storage}
        , schema_{std::move(schema)}
        , columns_{schema_.column_names()}
    {
        targets_.reserve(assignments.size());
        for (const auto& assignment : assignments) {
            const auto index = schema_.column_index(assignment.column.value);
            if (!index) {
                throw std::system_error(make_error_code(UpdateErrc::ColumnNotFound),
                                        schema_.table_name + "." + assignment.column.value);
            }
            targets_.push_back(Target{*index, assignment.value});
        }
    }

    [[nodiscard]] data::Row apply(const data::Row& row) const
    {
        const FilterContext scope{schema_.table_name, &columns_, &row, nullptr};
        const Evaluator evaluator{Evaluator::Config{&scope, make_subquery_runner(*storage_)}};

        std::vector<data::Value> evaluated;
        evaluated.reserve(targets_.size());
        for (const auto& target : targets_) {
            if (target.expression == nullptr) {
                throw std::system_error(make_error_code(EvaluateErrc::UnsupportedExpression),
                                        "assignment to " + schema_.column_defs[target.column].name);
            }
            evaluated.push_back(evaluator.evaluate(*target.expression));
        }

        auto updated = row;
        if (updated.values.size() < schema_.column_defs.size()) {
            updated.values.resize(schema_.column_defs.size());
        }
        for (std::size_t index = 0U; index < targets_.size(); ++index) {
            const auto& column = schema_.column_defs[targets_[index].column];
            data::Value conformed{};
            if (const auto ec = data::conform_value(column, evaluated[index], conformed)) {
                throw std::system_error(ec, schema_.table_name + "." + column.name);
            }
            updated.values[targets_[index].column] = std::move(conformed);
        }
        return updated;
    }

    [[nodiscard]] const data::Schema& schema() const noexcept { return schema_; }

private:
    struct Target final {
        std::size_t column = 0U;
        const parser::Expression* expression = nullptr;
    };

    const storage::Store<Key>* storage_ = nullptr;
    data::Schema schema_{};
    std::vector<std::string> columns_{};
    std::vector<Target> targets_{};
};

}  // namespace cairn::executor
