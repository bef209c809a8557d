#include "cairn/executor/executor_errors.hpp"
#include "cairn/executor/filter.hpp"
#include "cairn/storage/memory_store.hpp"
#include "parsed_expression.hpp"
#include "sql_runner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using cairn::data::DataType;
using cairn::data::Row;
using cairn::data::Schema;
using cairn::data::Value;
using cairn::executor::EvaluateErrc;
using cairn::executor::Filter;
using cairn::executor::FilterContext;
using cairn::storage::MemoryKey;
using cairn::storage::MemoryStore;
using cairn::test::ParsedExpression;

namespace {

Schema people_schema()
{
    Schema schema{};
    schema.table_name = "people";
    schema.column_defs = {{"id", DataType::Integer, true, std::nullopt},
                          {"name", DataType::Text, true, std::nullopt},
                          {"age", DataType::Integer, true, std::nullopt}};
    return schema;
}

Row person(std::int64_t id, std::string name, Value age)
{
    Row row{};
    row.values = {Value{id}, Value{std::move(name)}, std::move(age)};
    return row;
}

}  // namespace

TEST_CASE("Filter without a predicate matches every row", "[filter]")
{
    MemoryStore store;
    const Filter<MemoryKey> filter{store, nullptr};
    CHECK(filter.matches(people_schema(), person(1, "a", Value{})));
}

TEST_CASE("Filter treats unknown as non-matching", "[filter][3vl]")
{
    MemoryStore store;
    const ParsedExpression where{"age > 30"};
    const Filter<MemoryKey> filter{store, where.expression};
    const auto schema = people_schema();

    CHECK(filter.matches(schema, person(1, "a", Value{std::int64_t{40}})));
    CHECK_FALSE(filter.matches(schema, person(2, "b", Value{std::int64_t{20}})));
    CHECK_FALSE(filter.matches(schema, person(3, "c", Value{})));
}

TEST_CASE("Filter NOT over unknown stays non-matching", "[filter][3vl]")
{
    MemoryStore store;
    const ParsedExpression where{"NOT (age > 30)"};
    const Filter<MemoryKey> filter{store, where.expression};
    const auto schema = people_schema();

    CHECK(filter.matches(schema, person(1, "a", Value{std::int64_t{20}})));
    CHECK_FALSE(filter.matches(schema, person(2, "b", Value{})));
}

TEST_CASE("Filter raises evaluation faults instead of excluding rows", "[filter]")
{
    MemoryStore store;
    const auto schema = people_schema();

    const ParsedExpression unknown_column{"salary > 10"};
    const Filter<MemoryKey> missing{store, unknown_column.expression};
    try {
        (void)missing.matches(schema, person(1, "a", Value{}));
        FAIL("expected an unknown column error");
    } catch (const std::system_error& error) {
        CHECK(error.code() == EvaluateErrc::ColumnNotFound);
    }

    const ParsedExpression mismatch{"name = 1"};
    const Filter<MemoryKey> incompatible{store, mismatch.expression};
    try {
        (void)incompatible.matches(schema, person(1, "a", Value{}));
        FAIL("expected an incompatible types error");
    } catch (const std::system_error& error) {
        CHECK(error.code() == EvaluateErrc::IncompatibleTypes);
    }

    const ParsedExpression not_boolean{"age + 1"};
    const Filter<MemoryKey> numeric{store, not_boolean.expression};
    CHECK_THROWS_AS(numeric.matches(schema, person(1, "a", Value{std::int64_t{1}})), std::system_error);
}

TEST_CASE("Filter sees outer scopes for correlated predicates", "[filter][scope]")
{
    MemoryStore store;
    const std::vector<std::string> outer_columns{"limit_age"};
    Row outer_row{};
    outer_row.values = {Value{std::int64_t{25}}};
    const FilterContext outer{"settings", &outer_columns, &outer_row, nullptr};

    const ParsedExpression where{"age < settings.limit_age"};
    const Filter<MemoryKey> filter{store, where.expression, &outer};
    const auto schema = people_schema();

    CHECK(filter.matches(schema, person(1, "a", Value{std::int64_t{20}})));
    CHECK_FALSE(filter.matches(schema, person(2, "b", Value{std::int64_t{30}})));
}

TEST_CASE("Filter runs subqueries against the store", "[filter][subquery]")
{
    MemoryStore store;
    cairn::test::run_sql(store, "CREATE TABLE banned (name TEXT)");
    cairn::test::run_sql(store, "INSERT INTO banned VALUES ('mallory')");

    const ParsedExpression where{"name NOT IN (SELECT name FROM banned)"};
    const Filter<MemoryKey> filter{store, where.expression};
    const auto schema = people_schema();

    CHECK(filter.matches(schema, person(1, "alice", Value{})));
    CHECK_FALSE(filter.matches(schema, person(2, "mallory", Value{})));
}
