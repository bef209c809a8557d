#include "cairn/data/data_errors.hpp"
#include "cairn/executor/executor_errors.hpp"
#include "cairn/executor/row_builder.hpp"
#include "cairn/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

using cairn::data::DataType;
using cairn::data::RowErrc;
using cairn::data::Schema;
using cairn::data::Value;
using cairn::executor::build_row;

namespace {

Schema item_schema()
{
    Schema schema{};
    schema.table_name = "items";
    schema.column_defs = {{"id", DataType::Integer, false, std::nullopt},
                          {"name", DataType::Text, true, std::nullopt},
                          {"price", DataType::Float, true, Value{std::int64_t{0}}},
                          {"active", DataType::Boolean, false, Value{true}}};
    return schema;
}

struct ParsedInsert final {
    explicit ParsedInsert(const std::string& tail)
        : result{cairn::parser::parse_statement("INSERT INTO items " + tail)}
    {
        REQUIRE(result.success());
        statement = &std::get<cairn::parser::InsertStatement>(result.statements.front());
    }

    cairn::data::Row build() const { return build_row(item_schema(), statement->columns, statement->rows); }

    cairn::parser::StatementParseResult result;
    const cairn::parser::InsertStatement* statement = nullptr;
};

std::error_code build_error(const std::string& tail)
{
    const ParsedInsert parsed{tail};
    try {
        (void)parsed.build();
    } catch (const std::system_error& error) {
        return error.code();
    }
    return {};
}

}  // namespace

TEST_CASE("build_row binds values positionally without a column list", "[row_builder]")
{
    const ParsedInsert parsed{"VALUES (1, 'lamp', 12.5, FALSE)"};
    const auto row = parsed.build();
    REQUIRE(row.size() == 4U);
    CHECK(row.values[0] == Value{std::int64_t{1}});
    CHECK(row.values[1] == Value{std::string{"lamp"}});
    CHECK(row.values[2] == Value{12.5});
    CHECK(row.values[3] == Value{false});
}

TEST_CASE("build_row fills unlisted columns from defaults or NULL", "[row_builder]")
{
    const ParsedInsert parsed{"(id) VALUES (7)"};
    const auto row = parsed.build();
    CHECK(row.values[0] == Value{std::int64_t{7}});
    CHECK(row.values[1] == Value{});
    CHECK(row.values[2] == Value{0.0});
    CHECK(row.values[3] == Value{true});
}

TEST_CASE("build_row evaluates constant expressions", "[row_builder]")
{
    const ParsedInsert parsed{"(price, id) VALUES (2 * 3, -4)"};
    const auto row = parsed.build();
    CHECK(row.values[0] == Value{std::int64_t{-4}});
    CHECK(row.values[2] == Value{6.0});
}

TEST_CASE("build_row validates the column list", "[row_builder]")
{
    CHECK(build_error("(id, color) VALUES (1, 'red')") == RowErrc::ColumnNotFound);
    CHECK(build_error("(id, id) VALUES (1, 2)") == RowErrc::DuplicateColumn);
    CHECK(build_error("(id, name) VALUES (1)") == RowErrc::ValueCountMismatch);
    CHECK(build_error("VALUES (1, 'lamp')") == RowErrc::ValueCountMismatch);
    CHECK(build_error("(name) VALUES ('lamp')") == RowErrc::LackOfRequiredColumn);
}

TEST_CASE("build_row accepts exactly one VALUES tuple", "[row_builder]")
{
    CHECK(build_error("(id) VALUES (1), (2)") == RowErrc::MultipleRowsNotSupported);
}

TEST_CASE("build_row rejects values of the wrong type", "[row_builder]")
{
    CHECK(build_error("(id) VALUES ('one')") == RowErrc::IncompatibleDataType);
    CHECK(build_error("(id, active) VALUES (1, NULL)") == RowErrc::NullValueOnNotNullColumn);
    CHECK(build_error("(id) VALUES (missing)") == cairn::executor::EvaluateErrc::ColumnNotFound);
}
