#include "cairn/executor/row_builder.hpp"
#include "cairn/data/data_errors.hpp"
#include "cairn/executor/evaluate.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace cairn::executor {
namespace {

[[noreturn]] void fail(data::RowErrc code, const std::string& context)
{
    throw std::system_error(data::make_error_code(code), context);
}

std::vector<std::size_t> resolve_targets(const data::Schema& schema, const std::vector<parser::Identifier>& columns)
{
    std::vector<std::size_t> targets;
    if (columns.empty()) {
        targets.reserve(schema.column_defs.size());
        for (std::size_t index = 0U; index < schema.column_defs.size(); ++index) {
            targets.push_back(index);
        }
        return targets;
    }

    std::vector<bool> seen(schema.column_defs.size(), false);
    targets.reserve(columns.size());
    for (const auto& column : columns) {
        const auto index = schema.column_index(column.value);
        if (!index) {
            fail(data::RowErrc::ColumnNotFound, schema.table_name + "." + column.value);
        }
        if (seen[*index]) {
            fail(data::RowErrc::DuplicateColumn, schema.table_name + "." + column.value);
        }
        seen[*index] = true;
        targets.push_back(*index);
    }
    return targets;
}

}  // namespace

data::Row build_row(const data::Schema& schema,
                    const std::vector<parser::Identifier>& columns,
                    const std::vector<parser::InsertRow>& rows)
{
    if (rows.size() != 1U) {
        fail(data::RowErrc::MultipleRowsNotSupported, schema.table_name);
    }

    const auto targets = resolve_targets(schema, columns);
    const auto& values = rows.front().values;
    if (values.size() != targets.size()) {
        fail(data::RowErrc::ValueCountMismatch,
             schema.table_name + ": expected " + std::to_string(targets.size()) + " values, got "
                 + std::to_string(values.size()));
    }

    const Evaluator evaluator{Evaluator::Config{}};
    std::vector<std::optional<data::Value>> provided(schema.column_defs.size());
    for (std::size_t index = 0U; index < targets.size(); ++index) {
        if (values[index] == nullptr) {
            fail(data::RowErrc::ValueCountMismatch, schema.table_name);
        }
        provided[targets[index]] = evaluator.evaluate(*values[index]);
    }

    data::Row row{};
    row.values.reserve(schema.column_defs.size());
    for (std::size_t index = 0U; index < schema.column_defs.size(); ++index) {
        const auto& column = schema.column_defs[index];
        data::Value value{};
        if (provided[index]) {
            value = std::move(*provided[index]);
        } else if (column.default_value) {
            value = *column.default_value;
        } else if (!column.nullable) {
            fail(data::RowErrc::LackOfRequiredColumn, schema.table_name + "." + column.name);
        }

        data::Value conformed{};
        if (const auto ec = data::conform_value(column, value, conformed)) {
            throw std::system_error(ec, schema.table_name + "." + column.name);
        }
        row.values.push_back(std::move(conformed));
    }
    return row;
}

}  // namespace cairn::executor
