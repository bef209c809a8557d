#include "cairn/executor/executor_errors.hpp"
#include "cairn/executor/select.hpp"
#include "cairn/storage/memory_store.hpp"
#include "sql_runner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using cairn::data::Row;
using cairn::data::Value;
using cairn::executor::SelectErrc;
using cairn::storage::MemoryStore;
using cairn::test::run_sql;
using cairn::test::run_sql_error;
using cairn::test::select_sql;

namespace {

Row make_row(std::vector<Value> values)
{
    Row row{};
    row.values = std::move(values);
    return row;
}

Value integer(std::int64_t value)
{
    return Value{value};
}

Value text(std::string value)
{
    return Value{std::move(value)};
}

void seed(MemoryStore& store)
{
    run_sql(store, "CREATE TABLE people (id INT NOT NULL, name TEXT)");
    run_sql(store, "INSERT INTO people VALUES (1, 'ann')");
    run_sql(store, "INSERT INTO people VALUES (2, 'bob')");
    run_sql(store, "INSERT INTO people VALUES (3, 'cid')");

    run_sql(store, "CREATE TABLE orders (id INT, person_id INT, total INT)");
    run_sql(store, "INSERT INTO orders VALUES (10, 1, 50)");
    run_sql(store, "INSERT INTO orders VALUES (11, 1, 20)");
    run_sql(store, "INSERT INTO orders VALUES (12, 2, 70)");
}

}  // namespace

TEST_CASE("select projects star in column order", "[select]")
{
    MemoryStore store;
    seed(store);

    const auto payload = select_sql(store, "SELECT * FROM people");
    CHECK(payload.columns == std::vector<std::string>{"id", "name"});
    REQUIRE(payload.rows.size() == 3U);
    CHECK(payload.rows[0] == make_row({integer(1), text("ann")}));
    CHECK(payload.rows[2] == make_row({integer(3), text("cid")}));
}

TEST_CASE("select evaluates expressions and aliases", "[select]")
{
    MemoryStore store;
    seed(store);

    const auto payload = select_sql(store, "SELECT id * 10 AS scaled, name FROM people WHERE id >= 2");
    CHECK(payload.columns == std::vector<std::string>{"scaled", "name"});
    REQUIRE(payload.rows.size() == 2U);
    CHECK(payload.rows[0] == make_row({integer(20), text("bob")}));
    CHECK(payload.rows[1] == make_row({integer(30), text("cid")}));
}

TEST_CASE("select without FROM evaluates once", "[select]")
{
    MemoryStore store;
    const auto payload = select_sql(store, "SELECT 1 + 1, 'x'");
    REQUIRE(payload.rows.size() == 1U);
    CHECK(payload.rows.front() == make_row({integer(2), text("x")}));
    CHECK(run_sql_error(store, "SELECT *") == SelectErrc::WildcardWithoutTable);
}

TEST_CASE("select applies LIMIT and OFFSET after filtering", "[select]")
{
    MemoryStore store;
    seed(store);

    const auto payload = select_sql(store, "SELECT name FROM people WHERE id > 1 LIMIT 1 OFFSET 1");
    REQUIRE(payload.rows.size() == 1U);
    CHECK(payload.rows.front() == make_row({text("cid")}));

    CHECK(select_sql(store, "SELECT id FROM people LIMIT 0").rows.empty());
    CHECK(select_sql(store, "SELECT id FROM people OFFSET 5").rows.empty());
    CHECK(run_sql_error(store, "SELECT id FROM people LIMIT -1") == SelectErrc::InvalidLimit);
    CHECK(run_sql_error(store, "SELECT id FROM people LIMIT 'all'") == SelectErrc::InvalidLimit);
}

TEST_CASE("select joins tables with nested loops", "[select][join]")
{
    MemoryStore store;
    seed(store);

    const auto payload = select_sql(store,
                                    "SELECT p.name, o.total FROM people p JOIN orders o ON o.person_id = p.id "
                                    "WHERE o.total > 25");
    REQUIRE(payload.rows.size() == 2U);
    CHECK(payload.rows[0] == make_row({text("ann"), integer(50)}));
    CHECK(payload.rows[1] == make_row({text("bob"), integer(70)}));
}

TEST_CASE("select LEFT JOIN pads unmatched rows with NULL", "[select][join]")
{
    MemoryStore store;
    seed(store);

    const auto payload = select_sql(store,
                                    "SELECT p.id, o.id FROM people AS p LEFT JOIN orders AS o ON o.person_id = p.id");
    REQUIRE(payload.rows.size() == 4U);
    CHECK(payload.rows[0] == make_row({integer(1), integer(10)}));
    CHECK(payload.rows[1] == make_row({integer(1), integer(11)}));
    CHECK(payload.rows[2] == make_row({integer(2), integer(12)}));
    CHECK(payload.rows[3] == make_row({integer(3), Value{}}));
}

TEST_CASE("select expands qualified stars per table", "[select][join]")
{
    MemoryStore store;
    seed(store);

    const auto payload = select_sql(store,
                                    "SELECT o.*, p.name FROM orders o JOIN people p ON p.id = o.person_id "
                                    "WHERE o.id = 12");
    CHECK(payload.columns == std::vector<std::string>{"id", "person_id", "total", "name"});
    REQUIRE(payload.rows.size() == 1U);
    CHECK(payload.rows.front() == make_row({integer(12), integer(2), integer(70), text("bob")}));

    CHECK(run_sql_error(store, "SELECT x.* FROM orders o") == SelectErrc::TableAliasNotFound);
}

TEST_CASE("select runs correlated subqueries", "[select][subquery]")
{
    MemoryStore store;
    seed(store);

    const auto with_orders = select_sql(store,
                                        "SELECT name FROM people p WHERE EXISTS "
                                        "(SELECT id FROM orders o WHERE o.person_id = p.id)");
    REQUIRE(with_orders.rows.size() == 2U);
    CHECK(with_orders.rows[0] == make_row({text("ann")}));
    CHECK(with_orders.rows[1] == make_row({text("bob")}));

    const auto scalar = select_sql(store,
                                   "SELECT name, (SELECT total FROM orders WHERE orders.id = 12) FROM people "
                                   "WHERE id = 3");
    REQUIRE(scalar.rows.size() == 1U);
    CHECK(scalar.rows.front() == make_row({text("cid"), integer(70)}));

    CHECK(run_sql_error(store, "SELECT (SELECT total FROM orders) FROM people")
          == cairn::executor::EvaluateErrc::SubqueryRowCount);
}

TEST_CASE("select reports unknown tables from storage", "[select]")
{
    MemoryStore store;
    CHECK(run_sql_error(store, "SELECT * FROM ghosts") == cairn::storage::StorageErrc::TableNotFound);
}

TEST_CASE("select cursor yields rows lazily", "[select]")
{
    MemoryStore store;
    seed(store);

    const auto parsed = cairn::parser::parse_statement("SELECT id FROM people");
    REQUIRE(parsed.success());
    const auto& query = *std::get<cairn::parser::SelectStatement>(parsed.statements.front()).query;

    auto cursor = cairn::executor::select(store, query);
    Row row{};
    REQUIRE(cursor.next(row));
    CHECK(row == make_row({integer(1)}));

    run_sql(store, "DELETE FROM people WHERE id = 2");
    REQUIRE(cursor.next(row));
    CHECK(row == make_row({integer(3)}));
    CHECK_FALSE(cursor.next(row));
}

TEST_CASE("select rejects unqualified columns shared by joined tables", "[select][join]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE a (id INT)");
    run_sql(store, "CREATE TABLE b (id INT)");
    run_sql(store, "INSERT INTO a VALUES (7)");

    CHECK(run_sql_error(store, "SELECT id FROM a LEFT JOIN b ON a.id = b.id")
          == cairn::executor::EvaluateErrc::AmbiguousColumn);

    const auto qualified = select_sql(store, "SELECT a.id, b.id FROM a LEFT JOIN b ON a.id = b.id");
    REQUIRE(qualified.rows.size() == 1U);
    CHECK(qualified.rows.front() == make_row({integer(7), Value{}}));
}

TEST_CASE("select resolves subquery columns before enclosing ones", "[select][subquery]")
{
    MemoryStore store;
    seed(store);

    const auto payload = select_sql(store,
                                    "SELECT name FROM people WHERE EXISTS "
                                    "(SELECT id FROM orders WHERE id = 12) AND id = 1");
    REQUIRE(payload.rows.size() == 1U);
    CHECK(payload.rows.front() == make_row({text("ann")}));
}
