#pragma once

#include "cairn/data/row.hpp"
#include "cairn/data/schema.hpp"
#include "cairn/executor/executor_errors.hpp"
#include "cairn/executor/fetch.hpp"
#include "cairn/executor/filter.hpp"
#include "cairn/executor/row_builder.hpp"
#include "cairn/executor/schema_lookup.hpp"
#include "cairn/executor/select.hpp"
#include "cairn/executor/update.hpp"
#include "cairn/parser/ast.hpp"
#include "cairn/storage/storage_errors.hpp"
#include "cairn/storage/store.hpp"

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace cairn::executor {

struct CreatePayload final {
    bool operator==(const CreatePayload& other) const = default;
};

struct InsertPayload final {
    data::Row row{};

    bool operator==(const InsertPayload& other) const = default;
};

struct SelectPayload final {
    std::vector<std::string> columns{};
    std::vector<data::Row> rows{};

    bool operator==(const SelectPayload& other) const = default;
};

struct DeletePayload final {
    std::size_t count = 0U;

    bool operator==(const DeletePayload& other) const = default;
};

struct UpdatePayload final {
    std::size_t count = 0U;

    bool operator==(const UpdatePayload& other) const = default;
};

struct DropTablePayload final {
    bool operator==(const DropTablePayload& other) const = default;
};

using Payload =
    std::variant<CreatePayload, InsertPayload, SelectPayload, DeletePayload, UpdatePayload, DropTablePayload>;

// One-line summary such as "INSERT 1" or "SELECT 3".
[[nodiscard]] std::string describe_payload(const Payload& payload);

namespace detail {

template <typename Key>
class StatementExecutor final {
public:
    explicit StatementExecutor(storage::Store<Key>& storage) noexcept
        : storage_{storage}
    {
    }

    Payload operator()(const parser::CreateTableStatement& statement) const
    {
        data::Schema schema{};
        schema.table_name = get_table_name(statement.name);
        schema.column_defs = statement.columns;

        if (statement.if_not_exists) {
            data::Schema existing{};
            if (!storage_.get_schema(schema.table_name, existing)) {
                return CreatePayload{};
            }
        }

        if (const auto ec = storage_.set_schema(schema)) {
            throw std::system_error(ec, "set_schema " + schema.table_name);
        }
        return CreatePayload{};
    }

    Payload operator()(const parser::SelectStatement& statement) const
    {
        if (statement.query == nullptr) {
            throw std::system_error(make_error_code(ExecuteErrc::QueryNotSupported), "empty SELECT");
        }

        auto cursor = select(std::as_const(storage_), *statement.query);
        SelectPayload payload{};
        data::Row row{};
        while (cursor.next(row)) {
            payload.rows.push_back(std::move(row));
            row = data::Row{};
        }
        payload.columns = cursor.column_names();
        return payload;
    }

    Payload operator()(const parser::InsertStatement& statement) const
    {
        const auto table_name = get_table_name(statement.table_name);
        const auto schema = fetch_schema(std::as_const(storage_), table_name);

        Key key{};
        if (const auto ec = storage_.gen_id(table_name, key)) {
            throw std::system_error(ec, "gen_id " + table_name);
        }

        auto row = build_row(schema, statement.columns, statement.rows);
        data::Row stored{};
        if (const auto ec = storage_.set_data(key, std::move(row), stored)) {
            throw std::system_error(ec, "set_data " + table_name);
        }
        return InsertPayload{std::move(stored)};
    }

    // Rows written before a failure stay written.
    Payload operator()(const parser::UpdateStatement& statement) const
    {
        const auto& storage = std::as_const(storage_);
        const auto table_name = get_table_name(statement.table_name);
        const Update<Key> update{storage, fetch_schema(storage, table_name), statement.assignments};
        const Filter<Key> filter{storage, statement.where};

        auto cursor = fetch(storage, table_name, filter);
        std::size_t count = 0U;
        Key key{};
        data::Row row{};
        while (cursor.next(key, row)) {
            data::Row stored{};
            if (const auto ec = storage_.set_data(key, update.apply(row), stored)) {
                throw std::system_error(ec, "set_data " + table_name);
            }
            ++count;
        }
        return UpdatePayload{count};
    }

    Payload operator()(const parser::DeleteStatement& statement) const
    {
        const auto& storage = std::as_const(storage_);
        const auto table_name = get_table_name(statement.table_name);
        const Filter<Key> filter{storage, statement.where};

        auto cursor = fetch(storage, table_name, filter);
        std::size_t count = 0U;
        Key key{};
        data::Row row{};
        while (cursor.next(key, row)) {
            if (const auto ec = storage_.del_data(key)) {
                throw std::system_error(ec, "del_data " + table_name);
            }
            ++count;
        }
        return DeletePayload{count};
    }

    // The object kind is checked before any name is touched, so a rejected
    // DROP never removes a schema.
    Payload operator()(const parser::DropStatement& statement) const
    {
        if (statement.object_type != parser::ObjectType::Table) {
            throw std::system_error(make_error_code(ExecuteErrc::DropTypeNotSupported), "DROP");
        }

        for (const auto& name : statement.names) {
            const auto table_name = get_table_name(name);
            if (statement.if_exists) {
                data::Schema existing{};
                const auto lookup = storage_.get_schema(table_name, existing);
                if (lookup == storage::StorageErrc::TableNotFound) {
                    continue;
                }
            }
            if (const auto ec = storage_.del_schema(table_name)) {
                throw std::system_error(ec, "del_schema " + table_name);
            }
        }
        return DropTablePayload{};
    }

    template <typename Other>
    Payload operator()(const Other&) const
    {
        throw std::system_error(make_error_code(ExecuteErrc::QueryNotSupported), "statement");
    }

private:
    storage::Store<Key>& storage_;
};

}  // namespace detail

// Runs one statement against `storage`. Failures are thrown as
// std::system_error carrying the originating error code unchanged.
template <typename Key>
Payload execute(storage::Store<Key>& storage, const parser::Statement& statement)
{
    return std::visit(detail::StatementExecutor<Key>{storage}, statement);
}

}  // namespace cairn::executor
