#pragma once

#include "cairn/data/row.hpp"
#include "cairn/data/schema.hpp"
#include "cairn/executor/evaluate.hpp"
#include "cairn/executor/executor_errors.hpp"
#include "cairn/executor/filter.hpp"
#include "cairn/executor/schema_lookup.hpp"
#include "cairn/parser/ast.hpp"
#include "cairn/storage/store.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cairn::executor {

// Produces the rows of one SELECT. The FROM table is scanned lazily; joined
// tables are read up front and combined by nested loops.
template <typename Key>
class SelectCursor final {
public:
    SelectCursor(const storage::Store<Key>& storage,
                 const parser::QuerySpecification& query,
                 const FilterContext* outer = nullptr)
        : storage_{&storage}
        , query_{&query}
        , outer_{outer}
        , where_{storage, query.where, outer}
        , subquery_{make_subquery_runner(storage)}
    {
        resolve_sources();
        resolve_projection();
        resolve_bounds();
    }

    bool next(data::Row& out_row)
    {
        while (true) {
            if (limit_ && emitted_ >= *limit_) {
                return false;
            }
            if (pending_.empty() && !fill_pending()) {
                return false;
            }

            auto row = std::move(pending_.front());
            pending_.pop_front();
            if (skip_ > 0U) {
                --skip_;
                continue;
            }

            ++emitted_;
            out_row = std::move(row);
            return true;
        }
    }

    [[nodiscard]] const std::vector<std::string>& column_names() const noexcept { return column_names_; }

private:
    struct Source final {
        std::string alias{};
        data::Schema schema{};
        std::vector<std::string> columns{};
        std::vector<data::Row> rows{};
        data::Row null_row{};
        parser::JoinType join_type = parser::JoinType::Inner;
        const parser::Expression* on = nullptr;
    };

    enum class ProjectionKind : std::uint8_t {
        AllColumns = 0,
        TableColumns,
        Expression
    };

    struct Projection final {
        ProjectionKind kind = ProjectionKind::Expression;
        std::size_t source = 0U;
        const parser::Expression* expression = nullptr;
    };

    Source make_source(const parser::TableReference& table) const
    {
        Source source{};
        const auto table_name = get_table_name(table.name);
        source.alias = table.alias ? table.alias->value : table_name;
        source.schema = fetch_schema(*storage_, table_name);
        source.columns = source.schema.column_names();
        source.null_row.values.resize(source.columns.size());
        return source;
    }

    void resolve_sources()
    {
        const auto& query = *query_;
        if (query.from == nullptr) {
            return;
        }

        sources_.push_back(make_source(*query.from));
        const auto base_name = get_table_name(query.from->name);
        if (const auto ec = storage_->scan_data(base_name, base_scan_)) {
            throw std::system_error(ec, "scan_data " + base_name);
        }

        for (const auto& join : query.joins) {
            if (join.table == nullptr) {
                continue;
            }
            auto source = make_source(*join.table);
            source.join_type = join.type;
            source.on = join.predicate;

            std::unique_ptr<storage::RowScanCursor<Key>> scan;
            const auto table_name = get_table_name(join.table->name);
            if (const auto ec = storage_->scan_data(table_name, scan)) {
                throw std::system_error(ec, "scan_data " + table_name);
            }
            Key key{};
            data::Row row{};
            while (scan->next(key, row)) {
                source.rows.push_back(std::move(row));
                row = data::Row{};
            }
            sources_.push_back(std::move(source));
        }

        current_.assign(sources_.size(), nullptr);
        scopes_.assign(sources_.size(), FilterContext{});
    }

    void resolve_projection()
    {
        for (const auto* item : query_->select_items) {
            if (item == nullptr || item->expression == nullptr) {
                continue;
            }

            const auto* expression = item->expression;
            if (expression->kind != parser::NodeKind::StarExpression) {
                projections_.push_back(Projection{ProjectionKind::Expression, 0U, expression});
                if (item->alias) {
                    column_names_.push_back(item->alias->value);
                } else if (expression->kind == parser::NodeKind::IdentifierExpression) {
                    const auto& name = static_cast<const parser::IdentifierExpression*>(expression)->name;
                    column_names_.push_back(name.parts.back().value);
                } else {
                    column_names_.push_back(parser::describe(*expression));
                }
                continue;
            }

            if (sources_.empty()) {
                throw std::system_error(make_error_code(SelectErrc::WildcardWithoutTable), "*");
            }

            const auto& qualifier = static_cast<const parser::StarExpression*>(expression)->qualifier;
            if (qualifier.empty()) {
                projections_.push_back(Projection{ProjectionKind::AllColumns, 0U, nullptr});
                for (const auto& source : sources_) {
                    column_names_.insert(column_names_.end(), source.columns.begin(), source.columns.end());
                }
                continue;
            }

            const auto& alias = qualifier.parts.back().value;
            std::optional<std::size_t> match{};
            for (std::size_t index = 0U; index < sources_.size(); ++index) {
                if (sources_[index].alias == alias) {
                    match = index;
                    break;
                }
            }
            if (!match) {
                throw std::system_error(make_error_code(SelectErrc::TableAliasNotFound), alias);
            }
            projections_.push_back(Projection{ProjectionKind::TableColumns, *match, nullptr});
            const auto& columns = sources_[*match].columns;
            column_names_.insert(column_names_.end(), columns.begin(), columns.end());
        }
    }

    std::optional<std::uint64_t> evaluate_bound(const parser::Expression* expression, const char* clause) const
    {
        if (expression == nullptr) {
            return std::nullopt;
        }
        const Evaluator evaluator{Evaluator::Config{outer_, subquery_}};
        const auto value = evaluator.evaluate(*expression);
        if (data::is_null(value)) {
            return std::nullopt;
        }
        const auto* count = std::get_if<std::int64_t>(&value);
        if (count == nullptr || *count < 0) {
            throw std::system_error(make_error_code(SelectErrc::InvalidLimit), clause);
        }
        return static_cast<std::uint64_t>(*count);
    }

    void resolve_bounds()
    {
        limit_ = evaluate_bound(query_->limit, "LIMIT");
        skip_ = evaluate_bound(query_->offset, "OFFSET").value_or(0U);
    }

    bool fill_pending()
    {
        while (pending_.empty()) {
            if (exhausted_) {
                return false;
            }

            if (sources_.empty()) {
                exhausted_ = true;
                expand(0U);
                continue;
            }

            Key key{};
            data::Row row{};
            if (!base_scan_->next(key, row)) {
                exhausted_ = true;
                return false;
            }
            base_row_ = std::move(row);
            current_[0] = &base_row_;
            expand(1U);
        }
        return true;
    }

    // Scopes are chained innermost first: the most recently joined table,
    // back to the FROM table, then the enclosing query.
    const FilterContext* bind_scopes(std::size_t count)
    {
        for (std::size_t index = 0U; index < count; ++index) {
            auto& scope = scopes_[index];
            scope.table_name = sources_[index].alias;
            scope.columns = &sources_[index].columns;
            scope.row = current_[index];
            scope.next = index == 0U ? outer_ : &scopes_[index - 1U];
            scope.joined = index > 0U;
        }
        return count == 0U ? outer_ : &scopes_[count - 1U];
    }

    static bool passes(const Filter<Key>& filter, const FilterContext* scope)
    {
        return scope != nullptr ? filter.matches(*scope) : filter.matches(FilterContext{});
    }

    void expand(std::size_t level)
    {
        if (level == sources_.size()) {
            const auto* scope = bind_scopes(level);
            if (passes(where_, scope)) {
                pending_.push_back(project(scope));
            }
            return;
        }

        const auto& source = sources_[level];
        const Filter<Key> on{*storage_, source.on, outer_};
        bool matched = false;
        for (const auto& candidate : source.rows) {
            current_[level] = &candidate;
            if (!passes(on, bind_scopes(level + 1U))) {
                continue;
            }
            matched = true;
            expand(level + 1U);
        }

        if (!matched && source.join_type == parser::JoinType::LeftOuter) {
            current_[level] = &source.null_row;
            expand(level + 1U);
        }
    }

    data::Row project(const FilterContext* scope) const
    {
        data::Row row{};
        row.values.reserve(column_names_.size());
        for (const auto& projection : projections_) {
            switch (projection.kind) {
            case ProjectionKind::AllColumns:
                for (std::size_t index = 0U; index < sources_.size(); ++index) {
                    append_source(row, index);
                }
                break;
            case ProjectionKind::TableColumns:
                append_source(row, projection.source);
                break;
            case ProjectionKind::Expression: {
                const Evaluator evaluator{Evaluator::Config{scope, subquery_}};
                row.values.push_back(evaluator.evaluate(*projection.expression));
                break;
            }
            }
        }
        return row;
    }

    void append_source(data::Row& row, std::size_t index) const
    {
        const auto& values = current_[index]->values;
        const auto width = sources_[index].columns.size();
        for (std::size_t column = 0U; column < width; ++column) {
            row.values.push_back(column < values.size() ? values[column] : data::Value{});
        }
    }

    const storage::Store<Key>* storage_ = nullptr;
    const parser::QuerySpecification* query_ = nullptr;
    const FilterContext* outer_ = nullptr;
    Filter<Key> where_;
    SubqueryRunner subquery_{};

    std::vector<Source> sources_{};
    std::vector<Projection> projections_{};
    std::vector<std::string> column_names_{};
    std::unique_ptr<storage::RowScanCursor<Key>> base_scan_{};
    data::Row base_row_{};
    std::vector<const data::Row*> current_{};
    std::vector<FilterContext> scopes_{};
    std::deque<data::Row> pending_{};

    std::optional<std::uint64_t> limit_{};
    std::uint64_t skip_ = 0U;
    std::uint64_t emitted_ = 0U;
    bool exhausted_ = false;
};

template <typename Key>
[[nodiscard]] SelectCursor<Key> select(const storage::Store<Key>& storage,
                                       const parser::QuerySpecification& query,
                                       const FilterContext* outer = nullptr)
{
    return SelectCursor<Key>{storage, query, outer};
}

template <typename Key>
[[nodiscard]] std::vector<data::Row> select_rows(const storage::Store<Key>& storage,
                                                 const parser::QuerySpecification& query,
                                                 const FilterContext* outer = nullptr)
{
    auto cursor = select(storage, query, outer);
    std::vector<data::Row> rows;
    data::Row row{};
    while (cursor.next(row)) {
        rows.push_back(std::move(row));
        row = data::Row{};
    }
    return rows;
}

template <typename Key>
SubqueryRunner make_subquery_runner(const storage::Store<Key>& storage)
{
    return [&storage](const parser::QuerySpecification& query, const FilterContext* context) {
        return select_rows(storage, query, context);
    };
}

}  // namespace cairn::executor
