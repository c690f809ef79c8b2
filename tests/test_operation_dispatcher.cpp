#include <catch2/catch_test_macros.hpp>
#include "dispatcher/operation_dispatcher.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "executor/query_executor.hpp"
#include "mocks/mock_query_executor.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace sqlmcp;

namespace {

struct MockFixture {
    std::shared_ptr<testing::MockQueryExecutor> executor = std::make_shared<testing::MockQueryExecutor>();
    std::shared_ptr<InsightLedger> ledger = std::make_shared<InsightLedger>();
    OperationDispatcher dispatcher{OperationCatalog::standard(), executor, ledger};
};

struct SqliteFixture {
    std::shared_ptr<InsightLedger> ledger = std::make_shared<InsightLedger>();
    OperationDispatcher dispatcher{OperationCatalog::standard(), make_executor(), ledger};

    static std::shared_ptr<IQueryExecutor> make_executor() {
        SqliteConnectionFactory factory;
        auto connection = factory.create(":memory:");
        if (!connection) {
            throw std::runtime_error("cannot open :memory: database");
        }
        return std::make_shared<QueryExecutor>(std::move(connection));
    }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("OperationDispatcher rejects before reaching the engine", "[dispatcher]") {
    MockFixture f;

    SECTION("Unknown operation") {
        const auto response = f.dispatcher.dispatch("drop_everything", Json::object());
        REQUIRE(response.is_error);
        REQUIRE(response.error_code == ErrorCode::VALIDATION_ERROR);
        REQUIRE(response.first_text() == "Error: Unknown tool: drop_everything");
        REQUIRE(f.executor->execute_count() == 0);
    }

    SECTION("Missing required field") {
        const auto response = f.dispatcher.dispatch("read_query", Json::object());
        REQUIRE(response.is_error);
        REQUIRE(response.error_code == ErrorCode::VALIDATION_ERROR);
        REQUIRE(contains(response.first_text(), "query: Required"));
        REQUIRE(f.executor->execute_count() == 0);
    }

    SECTION("read_query with an UPDATE") {
        const auto response = f.dispatcher.dispatch("read_query", Json{{"query", "UPDATE t SET x=1"}});
        REQUIRE(response.is_error);
        REQUIRE(response.error_code == ErrorCode::CATEGORY_MISMATCH);
        REQUIRE(response.first_text() == "Error: Only SELECT queries are allowed for read_query");
        REQUIRE(f.executor->execute_count() == 0);
    }

    SECTION("write_query with a SELECT") {
        const auto response = f.dispatcher.dispatch("write_query", Json{{"query", "SELECT * FROM t"}});
        REQUIRE(response.is_error);
        REQUIRE(response.first_text() == "Error: SELECT queries are not allowed for write_query");
        REQUIRE(f.executor->execute_count() == 0);
    }

    SECTION("create_table with an INSERT") {
        const auto response = f.dispatcher.dispatch("create_table", Json{{"query", "INSERT INTO t VALUES (1)"}});
        REQUIRE(response.is_error);
        REQUIRE(response.first_text() == "Error: Only CREATE TABLE statements are allowed");
        REQUIRE(f.executor->execute_count() == 0);
    }

    SECTION("Rejections are counted") {
        (void)f.dispatcher.dispatch("nope", Json::object());
        (void)f.dispatcher.dispatch("list_tables", Json::object());
        const auto stats = f.dispatcher.get_stats();
        REQUIRE(stats.total_calls == 2);
        REQUIRE(stats.rejected_calls == 1);
    }
}

TEST_CASE("OperationDispatcher forwards accepted calls", "[dispatcher]") {
    MockFixture f;

    SECTION("read_query forwards the statement unmodified") {
        const auto response = f.dispatcher.dispatch("read_query", Json{{"query", " select 1"}});
        REQUIRE_FALSE(response.is_error);
        REQUIRE(f.executor->execute_count() == 1);
        REQUIRE(f.executor->last_sql() == " select 1");
    }

    SECTION("write_query reports affected rows") {
        const auto response = f.dispatcher.dispatch("write_query", Json{{"query", "DELETE FROM t"}});
        REQUIRE_FALSE(response.is_error);
        REQUIRE(response.first_text() == "[\n  {\n    \"affectedRows\": 1\n  }\n]");
    }

    SECTION("Engine failure becomes an error envelope") {
        f.executor->set_should_succeed(false);
        const auto response = f.dispatcher.dispatch("list_tables", Json(nullptr));
        REQUIRE(response.is_error);
        REQUIRE(response.error_code == ErrorCode::DATABASE_ERROR);
        REQUIRE(response.first_text() == "Error: Mock failure: mock");
    }

    SECTION("append_insight never touches the engine") {
        const auto response = f.dispatcher.dispatch("append_insight", Json{{"insight", "Margins improved"}});
        REQUIRE_FALSE(response.is_error);
        REQUIRE(response.first_text() == "Insight added to memo");
        REQUIRE(f.ledger->size() == 1);
        REQUIRE(f.executor->execute_count() == 0);
    }
}

TEST_CASE("OperationDispatcher end to end on SQLite", "[dispatcher][sqlite]") {
    SqliteFixture f;

    SECTION("list_tables on a fresh database") {
        const auto response = f.dispatcher.dispatch("list_tables", Json::object());
        REQUIRE_FALSE(response.is_error);
        REQUIRE(response.first_text() == "[]");
    }

    SECTION("create_table then describe_table") {
        const auto created = f.dispatcher.dispatch("create_table",
            Json{{"query", "CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT)"}});
        REQUIRE_FALSE(created.is_error);
        REQUIRE(created.first_text() == "Table created successfully");

        const auto described = f.dispatcher.dispatch("describe_table", Json{{"table_name", "t"}});
        REQUIRE_FALSE(described.is_error);
        const auto rows = Json::parse(described.first_text());
        REQUIRE(rows.size() == 2);
        CHECK(rows[0]["name"] == "id");
        CHECK(rows[0]["pk"] == 1);
        CHECK(rows[1]["name"] == "name");
        CHECK(rows[1]["pk"] == 0);
    }

    SECTION("write then read") {
        REQUIRE_FALSE(f.dispatcher.dispatch("create_table",
            Json{{"query", "CREATE TABLE sales (region TEXT, amount REAL)"}}).is_error);

        const auto written = f.dispatcher.dispatch("write_query",
            Json{{"query", "INSERT INTO sales VALUES ('north', 10.5), ('south', 4)"}});
        REQUIRE_FALSE(written.is_error);
        REQUIRE(Json::parse(written.first_text())[0]["affectedRows"] == 2);

        const auto read = f.dispatcher.dispatch("read_query",
            Json{{"query", "SELECT region, amount FROM sales ORDER BY region"}});
        REQUIRE_FALSE(read.is_error);
        REQUIRE(read.first_text() ==
            "[\n"
            "  {\n"
            "    \"region\": \"north\",\n"
            "    \"amount\": 10.5\n"
            "  },\n"
            "  {\n"
            "    \"region\": \"south\",\n"
            "    \"amount\": 4\n"
            "  }\n"
            "]");
    }

    SECTION("Engine errors are reported, not thrown") {
        const auto response = f.dispatcher.dispatch("read_query", Json{{"query", "SELECT * FROM missing"}});
        REQUIRE(response.is_error);
        REQUIRE(response.first_text() == "Error: no such table: missing");
    }

    SECTION("Syntax errors are reported, not thrown") {
        const auto response = f.dispatcher.dispatch("write_query", Json{{"query", "INSERT INTO"}});
        REQUIRE(response.is_error);
        REQUIRE(response.error_code == ErrorCode::DATABASE_ERROR);
    }

    SECTION("Insights flow into the memo") {
        REQUIRE_FALSE(f.dispatcher.dispatch("append_insight", Json{{"insight", "X"}}).is_error);
        REQUIRE(f.ledger->synthesize() ==
            "📊 Business Intelligence Memo 📊\n\nKey Insights Discovered:\n\n- X");
    }
}

TEST_CASE("OperationDispatcher requires its collaborators", "[dispatcher]") {
    auto executor = std::make_shared<testing::MockQueryExecutor>();
    auto ledger = std::make_shared<InsightLedger>();
    REQUIRE_THROWS_AS(OperationDispatcher(OperationCatalog::standard(), nullptr, ledger), std::invalid_argument);
    REQUIRE_THROWS_AS(OperationDispatcher(OperationCatalog::standard(), executor, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(OperationDispatcher(nullptr, executor, ledger), std::invalid_argument);
}
