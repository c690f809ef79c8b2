#include <catch2/catch_test_macros.hpp>
#include "executor/query_executor.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "mocks/mock_db_connection.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sqlmcp;

namespace {

std::unique_ptr<QueryExecutor> make_memory_executor() {
    SqliteConnectionFactory factory;
    auto connection = factory.create(":memory:");
    REQUIRE(connection != nullptr);
    return std::make_unique<QueryExecutor>(std::move(connection));
}

std::string text_cell(const QueryResult& result, size_t row, size_t col) {
    return std::get<std::string>(result.rows.at(row).at(col));
}

int64_t int_cell(const QueryResult& result, size_t row, size_t col) {
    return std::get<int64_t>(result.rows.at(row).at(col));
}

} // anonymous namespace

TEST_CASE("QueryExecutor against in-memory SQLite", "[executor][sqlite]") {
    auto executor = make_memory_executor();

    SECTION("Fresh database has no tables") {
        const auto result = executor->list_tables();
        REQUIRE(result.success);
        REQUIRE(result.rows.empty());
    }

    SECTION("Create, insert, select") {
        REQUIRE(executor->execute_write("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT)").success);

        const auto insert = executor->execute_write("INSERT INTO t (name) VALUES ('a'), ('b')");
        REQUIRE(insert.success);
        REQUIRE(insert.affected_rows == 2);

        const auto select = executor->execute_read("SELECT id, name FROM t ORDER BY id");
        REQUIRE(select.success);
        REQUIRE(select.column_names == std::vector<std::string>{"id", "name"});
        REQUIRE(select.rows.size() == 2);
        CHECK(int_cell(select, 0, 0) == 1);
        CHECK(text_cell(select, 1, 1) == "b");
    }

    SECTION("DDL reports zero affected rows even after DML") {
        REQUIRE(executor->execute_write("CREATE TABLE a (x)").success);
        REQUIRE(executor->execute_write("INSERT INTO a VALUES (1), (2), (3)").affected_rows == 3);
        const auto ddl = executor->execute_write("CREATE TABLE b (y)");
        REQUIRE(ddl.success);
        REQUIRE(ddl.affected_rows == 0);
    }

    SECTION("Update reports changed rows") {
        REQUIRE(executor->execute_write("CREATE TABLE t (x INTEGER)").success);
        REQUIRE(executor->execute_write("INSERT INTO t VALUES (1), (2), (3)").success);
        const auto update = executor->execute_write("UPDATE t SET x = 0 WHERE x > 1");
        REQUIRE(update.success);
        REQUIRE(update.affected_rows == 2);
    }

    SECTION("list_tables returns table names") {
        REQUIRE(executor->execute_write("CREATE TABLE users (id INTEGER)").success);
        REQUIRE(executor->execute_write("CREATE TABLE orders (id INTEGER)").success);
        const auto result = executor->list_tables();
        REQUIRE(result.success);
        REQUIRE(result.column_names == std::vector<std::string>{"name"});
        REQUIRE(result.rows.size() == 2);
        CHECK(text_cell(result, 0, 0) == "users");
        CHECK(text_cell(result, 1, 0) == "orders");
    }

    SECTION("describe_table returns column metadata in declaration order") {
        REQUIRE(executor->execute_write("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT)").success);
        const auto result = executor->describe_table("t");
        REQUIRE(result.success);
        REQUIRE(result.rows.size() == 2);
        REQUIRE(result.column_names.at(1) == "name");
        REQUIRE(result.column_names.at(5) == "pk");
        CHECK(text_cell(result, 0, 1) == "id");
        CHECK(int_cell(result, 0, 5) == 1);
        CHECK(text_cell(result, 1, 1) == "name");
        CHECK(int_cell(result, 1, 5) == 0);
    }

    SECTION("describe_table of unknown table is empty") {
        const auto result = executor->describe_table("missing");
        REQUIRE(result.success);
        REQUIRE(result.rows.empty());
    }

    SECTION("Table names with quotes cannot break out of the identifier") {
        REQUIRE(executor->execute_write(R"(CREATE TABLE "we""ird" (v TEXT))").success);
        const auto result = executor->describe_table(R"(we"ird)");
        REQUIRE(result.success);
        REQUIRE(result.rows.size() == 1);

        const auto injected = executor->describe_table("t); DROP TABLE x; --");
        REQUIRE(injected.success);
        REQUIRE(injected.rows.empty());
    }

    SECTION("Engine errors are passed through verbatim") {
        const auto result = executor->execute_read("SELECT * FROM nowhere");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_code == ErrorCode::DATABASE_ERROR);
        REQUIRE(result.error_message == "no such table: nowhere");
    }

    SECTION("Only the first statement runs") {
        REQUIRE(executor->execute_write("CREATE TABLE t (x INTEGER)").success);
        const auto result = executor->execute_write("INSERT INTO t VALUES (1); INSERT INTO t VALUES (2)");
        REQUIRE(result.success);
        REQUIRE(result.affected_rows == 1);
        REQUIRE(executor->execute_read("SELECT x FROM t").rows.size() == 1);
    }

    SECTION("Cell types round out of the engine") {
        const auto result = executor->execute_read("SELECT NULL, 42, 1.5, 'txt', x'00ff'");
        REQUIRE(result.success);
        REQUIRE(result.rows.size() == 1);
        const auto& row = result.rows[0];
        CHECK(std::holds_alternative<std::monostate>(row[0]));
        CHECK(std::get<int64_t>(row[1]) == 42);
        CHECK(std::get<double>(row[2]) == 1.5);
        CHECK(std::get<std::string>(row[3]) == "txt");
        CHECK(std::get<Blob>(row[4]) == Blob{0x00, 0xff});
    }
}

TEST_CASE("QueryExecutor statement text", "[executor]") {
    std::vector<std::string> statements;
    auto connection = std::make_unique<testing::MockDbConnection>(&statements);
    QueryExecutor executor(std::move(connection));

    SECTION("list_tables query") {
        (void)executor.list_tables();
        REQUIRE(statements == std::vector<std::string>{
            "SELECT name FROM sqlite_master WHERE type='table'"});
    }

    SECTION("describe_table quotes the identifier") {
        (void)executor.describe_table("my\"table");
        REQUIRE(statements == std::vector<std::string>{R"(PRAGMA table_info("my""table"))"});
    }

    SECTION("Statements are forwarded unmodified") {
        (void)executor.execute_read("  select 1  ");
        REQUIRE(statements.back() == "  select 1  ");
    }
}

TEST_CASE("QueryExecutor quote_identifier", "[executor]") {
    CHECK(QueryExecutor::quote_identifier("t") == "\"t\"");
    CHECK(QueryExecutor::quote_identifier("") == "\"\"");
    CHECK(QueryExecutor::quote_identifier("a\"b\"c") == "\"a\"\"b\"\"c\"");
}

TEST_CASE("QueryExecutor requires a connection", "[executor]") {
    REQUIRE_THROWS_AS(QueryExecutor(nullptr), std::invalid_argument);
}
