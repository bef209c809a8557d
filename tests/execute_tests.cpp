#include "cairn/data/data_errors.hpp"
#include "cairn/executor/execute.hpp"
#include "cairn/executor/executor_errors.hpp"
#include "cairn/storage/memory_store.hpp"
#include "cairn/storage/storage_errors.hpp"
#include "recording_store.hpp"
#include "sql_runner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using cairn::data::DataType;
using cairn::data::Row;
using cairn::data::Schema;
using cairn::data::Value;
using cairn::executor::CreatePayload;
using cairn::executor::DeletePayload;
using cairn::executor::DropTablePayload;
using cairn::executor::ExecuteErrc;
using cairn::executor::InsertPayload;
using cairn::executor::Payload;
using cairn::executor::UpdatePayload;
using cairn::storage::MemoryStore;
using cairn::storage::StorageErrc;
using cairn::test::RecordingStore;
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

bool called(const RecordingStore& store, std::string_view prefix)
{
    return std::any_of(store.calls.begin(), store.calls.end(), [&](const std::string& call) {
        return call.rfind(prefix, 0U) == 0U;
    });
}

void seed_numbers(RecordingStore& store)
{
    run_sql(store, "CREATE TABLE numbers (id INT, value INT)");
    for (std::int64_t id = 1; id <= 5; ++id) {
        run_sql(store, "INSERT INTO numbers VALUES (" + std::to_string(id) + ", " + std::to_string(id * 10) + ")");
    }
}

}  // namespace

TEST_CASE("CREATE TABLE registers the schema exactly as declared", "[execute][create]")
{
    RecordingStore store;
    const auto payload = run_sql(store, "CREATE TABLE t (id INT, name TEXT, score FLOAT NOT NULL)");
    CHECK(std::holds_alternative<CreatePayload>(payload));

    Schema schema{};
    REQUIRE_FALSE(store.get_schema("t", schema));
    CHECK(schema.table_name == "t");
    REQUIRE(schema.column_defs.size() == 3U);
    CHECK(schema.column_names() == std::vector<std::string>{"id", "name", "score"});
    CHECK(schema.column_defs[0].data_type == DataType::Integer);
    CHECK(schema.column_defs[1].data_type == DataType::Text);
    CHECK(schema.column_defs[2].data_type == DataType::Float);
    CHECK_FALSE(schema.column_defs[2].nullable);
}

TEST_CASE("CREATE TABLE propagates backend rejection", "[execute][create]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE t (id INT)");
    CHECK(run_sql_error(store, "CREATE TABLE t (id INT)") == StorageErrc::TableAlreadyExists);
}

TEST_CASE("CREATE TABLE IF NOT EXISTS leaves an existing table alone", "[execute][create]")
{
    RecordingStore store;
    run_sql(store, "CREATE TABLE t (id INT)");
    store.calls.clear();

    const auto payload = run_sql(store, "CREATE TABLE IF NOT EXISTS t (other TEXT)");
    CHECK(std::holds_alternative<CreatePayload>(payload));
    CHECK_FALSE(called(store, "set_schema"));

    Schema schema{};
    REQUIRE_FALSE(store.get_schema("t", schema));
    CHECK(schema.column_names() == std::vector<std::string>{"id"});
}

TEST_CASE("CREATE TABLE accepts a schema-qualified name", "[execute][create]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE app.t (id INT)");
    CHECK(store.table_names() == std::vector<std::string>{"t"});
    CHECK(run_sql_error(store, "CREATE TABLE a.b.c (id INT)") == cairn::data::DataErrc::InvalidTableName);
}

TEST_CASE("INSERT generates distinct keys and returns the stored row", "[execute][insert]")
{
    RecordingStore store;
    run_sql(store, "CREATE TABLE t (id INT, name TEXT)");

    const auto first = run_sql(store, "INSERT INTO t VALUES (1, 'a')");
    const auto second = run_sql(store, "INSERT INTO t (name, id) VALUES ('b', 2)");
    REQUIRE(std::holds_alternative<InsertPayload>(first));
    CHECK(std::get<InsertPayload>(first).row == make_row({integer(1), text("a")}));
    CHECK(std::get<InsertPayload>(second).row == make_row({integer(2), text("b")}));

    const auto keys = store.keys();
    REQUIRE(keys.size() == 2U);
    CHECK(keys[0] != keys[1]);
    REQUIRE(store.find(keys[0]) != nullptr);
    CHECK(*store.find(keys[0]) == make_row({integer(1), text("a")}));
    CHECK(*store.find(keys[1]) == make_row({integer(2), text("b")}));
}

TEST_CASE("INSERT into an unknown table fails before a key is generated", "[execute][insert]")
{
    RecordingStore store;
    CHECK(run_sql_error(store, "INSERT INTO ghosts VALUES (1)") == StorageErrc::TableNotFound);
    CHECK_FALSE(called(store, "gen_id"));
    CHECK_FALSE(called(store, "set_data"));
}

TEST_CASE("INSERT row errors stop before set_data", "[execute][insert]")
{
    RecordingStore store;
    run_sql(store, "CREATE TABLE t (id INT NOT NULL, name TEXT)");
    store.calls.clear();

    CHECK(run_sql_error(store, "INSERT INTO t (name) VALUES ('x')") == cairn::data::RowErrc::LackOfRequiredColumn);
    CHECK(called(store, "gen_id"));
    CHECK_FALSE(called(store, "set_data"));
}

TEST_CASE("create, insert, select and update round trip", "[execute][integration]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE t (id INT, name TEXT)");
    run_sql(store, "INSERT INTO t VALUES (1, 'a')");

    const auto selected = select_sql(store, "SELECT * FROM t WHERE id = 1");
    REQUIRE(selected.rows.size() == 1U);
    CHECK(selected.rows.front() == make_row({integer(1), text("a")}));

    const auto updated = run_sql(store, "UPDATE t SET name = 'b' WHERE id = 1");
    REQUIRE(std::holds_alternative<UpdatePayload>(updated));
    CHECK(std::get<UpdatePayload>(updated).count == 1U);

    const auto after = select_sql(store, "SELECT * FROM t WHERE id = 1");
    REQUIRE(after.rows.size() == 1U);
    CHECK(after.rows.front() == make_row({integer(1), text("b")}));
}

TEST_CASE("UPDATE counts only rows whose predicate is true", "[execute][update]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE t (id INT, flag INT, note TEXT)");
    run_sql(store, "INSERT INTO t VALUES (1, 1, 'x')");
    run_sql(store, "INSERT INTO t VALUES (2, 0, 'x')");
    run_sql(store, "INSERT INTO t VALUES (3, NULL, 'x')");

    const auto payload = run_sql(store, "UPDATE t SET note = 'y' WHERE flag = 1");
    CHECK(std::get<UpdatePayload>(payload).count == 1U);

    const auto rows = select_sql(store, "SELECT id, note FROM t").rows;
    REQUIRE(rows.size() == 3U);
    CHECK(rows[0] == make_row({integer(1), text("y")}));
    CHECK(rows[1] == make_row({integer(2), text("x")}));
    CHECK(rows[2] == make_row({integer(3), text("x")}));
}

TEST_CASE("UPDATE assignments read pre-update values", "[execute][update]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE t (a INT, b INT)");
    run_sql(store, "INSERT INTO t VALUES (3, 4)");

    run_sql(store, "UPDATE t SET a = a + b, b = a * b");
    const auto rows = select_sql(store, "SELECT a, b FROM t").rows;
    REQUIRE(rows.size() == 1U);
    CHECK(rows.front() == make_row({integer(7), integer(12)}));
}

TEST_CASE("UPDATE writes back at the key it read", "[execute][update]")
{
    RecordingStore store;
    seed_numbers(store);
    const auto keys = store.keys();
    store.calls.clear();

    const auto payload = run_sql(store, "UPDATE numbers SET value = value + 1 WHERE id IN (2, 4)");
    CHECK(std::get<UpdatePayload>(payload).count == 2U);

    CHECK(store.keys() == keys);
    CHECK(std::count(store.calls.begin(), store.calls.end(), "set_data " + keys[1]) == 1);
    CHECK(std::count(store.calls.begin(), store.calls.end(), "set_data " + keys[3]) == 1);
    CHECK_FALSE(called(store, "gen_id"));
    CHECK(*store.find(keys[1]) == make_row({integer(2), integer(21)}));
    CHECK(*store.find(keys[0]) == make_row({integer(1), integer(10)}));
}

TEST_CASE("UPDATE validates targets before any row is touched", "[execute][update]")
{
    RecordingStore store;
    seed_numbers(store);
    store.calls.clear();

    CHECK(run_sql_error(store, "UPDATE numbers SET missing = 1") == cairn::executor::UpdateErrc::ColumnNotFound);
    CHECK_FALSE(called(store, "scan_data"));
    CHECK_FALSE(called(store, "set_data"));
}

TEST_CASE("a failing UPDATE keeps the rows written before it", "[execute][update]")
{
    RecordingStore store;
    seed_numbers(store);
    const auto keys = store.keys();
    store.fail_set_data_after = 2U;

    CHECK(run_sql_error(store, "UPDATE numbers SET value = 0") == StorageErrc::RowNotFound);
    CHECK(*store.find(keys[0]) == make_row({integer(1), integer(0)}));
    CHECK(*store.find(keys[1]) == make_row({integer(2), integer(0)}));
    CHECK(*store.find(keys[2]) == make_row({integer(3), integer(30)}));
    CHECK(*store.find(keys[4]) == make_row({integer(5), integer(50)}));
}

TEST_CASE("a faulting UPDATE expression stops partway without rollback", "[execute][update]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE t (id INT, d INT, v INT)");
    run_sql(store, "INSERT INTO t VALUES (1, 1, 10)");
    run_sql(store, "INSERT INTO t VALUES (2, 0, 10)");
    run_sql(store, "INSERT INTO t VALUES (3, 1, 10)");

    CHECK(run_sql_error(store, "UPDATE t SET v = v / d") == cairn::executor::EvaluateErrc::DivisionByZero);
    const auto rows = select_sql(store, "SELECT v FROM t").rows;
    REQUIRE(rows.size() == 3U);
    CHECK(rows[0] == make_row({integer(10)}));
    CHECK(rows[1] == make_row({integer(10)}));
    CHECK(rows[2] == make_row({integer(10)}));

    CHECK(run_sql_error(store, "UPDATE t SET v = 100 / (d - 1) WHERE id <> 1") == cairn::executor::EvaluateErrc::DivisionByZero);
    const auto after = select_sql(store, "SELECT v FROM t").rows;
    CHECK(after[1] == make_row({integer(-100)}));
    CHECK(after[2] == make_row({integer(10)}));
}

TEST_CASE("DELETE removes exactly the matching rows", "[execute][delete]")
{
    RecordingStore store;
    seed_numbers(store);
    const auto keys = store.keys();

    const auto payload = run_sql(store, "DELETE FROM numbers WHERE value > 20 AND id <> 5");
    REQUIRE(std::holds_alternative<DeletePayload>(payload));
    CHECK(std::get<DeletePayload>(payload).count == 2U);

    CHECK(store.find(keys[2]) == nullptr);
    CHECK(store.find(keys[3]) == nullptr);
    REQUIRE(store.find(keys[0]) != nullptr);
    CHECK(*store.find(keys[0]) == make_row({integer(1), integer(10)}));
    CHECK(store.find(keys[4]) != nullptr);
}

TEST_CASE("a failing DELETE keeps the rows removed before it", "[execute][delete]")
{
    RecordingStore store;
    seed_numbers(store);
    const auto keys = store.keys();
    store.fail_del_data_after = 2U;

    CHECK(run_sql_error(store, "DELETE FROM numbers WHERE id > 1") == StorageErrc::RowNotFound);
    CHECK(store.find(keys[0]) != nullptr);
    CHECK(store.find(keys[1]) == nullptr);
    CHECK(store.find(keys[2]) == nullptr);
    REQUIRE(store.find(keys[3]) != nullptr);
    CHECK(*store.find(keys[3]) == make_row({integer(4), integer(40)}));
    CHECK(store.find(keys[4]) != nullptr);
}

TEST_CASE("DELETE without WHERE empties the table", "[execute][delete]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE t (id INT)");
    run_sql(store, "INSERT INTO t VALUES (1)");
    run_sql(store, "INSERT INTO t VALUES (2)");

    CHECK(std::get<DeletePayload>(run_sql(store, "DELETE FROM t")).count == 2U);
    CHECK(store.row_count("t") == 0U);
    CHECK(std::get<DeletePayload>(run_sql(store, "DELETE FROM t")).count == 0U);
}

TEST_CASE("DROP TABLE removes every named schema", "[execute][drop]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE a (id INT)");
    run_sql(store, "CREATE TABLE b (id INT)");

    const auto payload = run_sql(store, "DROP TABLE a, b");
    CHECK(std::holds_alternative<DropTablePayload>(payload));
    CHECK(store.table_names().empty());
    CHECK(run_sql_error(store, "DROP TABLE a") == StorageErrc::TableNotFound);
}

TEST_CASE("a failing multi-name DROP keeps the schemas dropped before it", "[execute][drop]")
{
    RecordingStore store;
    run_sql(store, "CREATE TABLE a (id INT)");
    run_sql(store, "CREATE TABLE b (id INT)");

    CHECK(run_sql_error(store, "DROP TABLE a, missing, b") == StorageErrc::TableNotFound);
    CHECK_FALSE(store.has_schema("a"));
    CHECK(store.has_schema("b"));
    CHECK_FALSE(called(store, "del_schema b"));
}

TEST_CASE("DROP TABLE IF EXISTS skips unknown names", "[execute][drop]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE b (id INT)");
    CHECK(std::holds_alternative<DropTablePayload>(run_sql(store, "DROP TABLE IF EXISTS a, b")));
    CHECK(store.table_names().empty());
}

TEST_CASE("DROP of a non-table object touches no storage", "[execute][drop]")
{
    RecordingStore store;
    run_sql(store, "CREATE TABLE v1 (id INT)");
    run_sql(store, "CREATE TABLE v2 (id INT)");
    store.calls.clear();

    CHECK(run_sql_error(store, "DROP VIEW v1") == ExecuteErrc::DropTypeNotSupported);
    CHECK(run_sql_error(store, "DROP INDEX v1, v2") == ExecuteErrc::DropTypeNotSupported);
    CHECK(run_sql_error(store, "DROP SCHEMA v2") == ExecuteErrc::DropTypeNotSupported);
    CHECK(store.calls.empty());
    CHECK(store.has_schema("v1"));
    CHECK(store.has_schema("v2"));
}

TEST_CASE("transaction control statements are not supported", "[execute]")
{
    RecordingStore store;
    for (const auto* sql : {"BEGIN", "COMMIT", "ROLLBACK TRANSACTION"}) {
        CAPTURE(sql);
        CHECK(run_sql_error(store, sql) == ExecuteErrc::QueryNotSupported);
    }
    CHECK(store.calls.empty());
}

TEST_CASE("execute reports failures with the originating category", "[execute]")
{
    MemoryStore store;
    run_sql(store, "CREATE TABLE t (id INT)");
    run_sql(store, "INSERT INTO t VALUES (1)");

    const auto error = run_sql_error(store, "DELETE FROM t WHERE id = 'one'");
    CHECK(std::string{error.category().name()} == "cairn.evaluate");

    const std::error_code unsupported = ExecuteErrc::QueryNotSupported;
    CHECK(std::string{unsupported.category().name()} == "cairn.execute");
    CHECK(unsupported.message() == "query not supported");
}

TEST_CASE("describe_payload summarises each outcome", "[execute]")
{
    using cairn::executor::describe_payload;
    CHECK(describe_payload(Payload{CreatePayload{}}) == "CREATE TABLE");
    CHECK(describe_payload(Payload{InsertPayload{}}) == "INSERT 1");
    CHECK(describe_payload(Payload{cairn::executor::SelectPayload{{"id"}, {Row{}, Row{}}}}) == "SELECT 2");
    CHECK(describe_payload(Payload{DeletePayload{3U}}) == "DELETE 3");
    CHECK(describe_payload(Payload{UpdatePayload{0U}}) == "UPDATE 0");
    CHECK(describe_payload(Payload{DropTablePayload{}}) == "DROP TABLE");
}
