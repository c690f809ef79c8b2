#include <catch2/catch_test_macros.hpp>
#include "dispatcher/tool_response.hpp"

using namespace sqlmcp;

TEST_CASE("ToolResponse envelope serialization", "[response]") {

    SECTION("Success envelope omits isError") {
        const auto response = ToolResponse::text("hello");
        REQUIRE(dump_json(response.to_json()) == R"({"content":[{"type":"text","text":"hello"}]})");
    }

    SECTION("Error envelope prefixes message and flags isError") {
        const auto response = ToolResponse::error(ErrorCode::DATABASE_ERROR, "no such table: t");
        REQUIRE(response.is_error);
        REQUIRE(response.error_code == ErrorCode::DATABASE_ERROR);
        REQUIRE(response.first_text() == "Error: no such table: t");
        const auto json = response.to_json();
        REQUIRE(json["isError"] == true);
        REQUIRE(json["content"][0]["text"] == "Error: no such table: t");
    }
}

TEST_CASE("Result formatting", "[response]") {

    SECTION("Empty row set") {
        QueryResult result;
        result.success = true;
        REQUIRE(format_rows(result) == "[]");
    }

    SECTION("Rows keep column order and use 2-space indentation") {
        QueryResult result;
        result.success = true;
        result.column_names = {"zeta", "alpha"};
        result.rows = {{CellValue{int64_t{1}}, CellValue{std::string("x")}}};
        REQUIRE(format_rows(result) ==
            "[\n"
            "  {\n"
            "    \"zeta\": 1,\n"
            "    \"alpha\": \"x\"\n"
            "  }\n"
            "]");
    }

    SECTION("Cell types") {
        CHECK(cell_to_json(CellValue{}).is_null());
        CHECK(cell_to_json(CellValue{int64_t{-7}}) == -7);
        CHECK(cell_to_json(CellValue{2.5}) == 2.5);
        CHECK(cell_to_json(CellValue{std::string("text")}) == "text");

        const auto blob = cell_to_json(CellValue{Blob{0x00, 0xff}});
        CHECK(dump_json(blob) == R"({"type":"Buffer","data":[0,255]})");
    }

    SECTION("Integral reals print without a fraction") {
        CHECK(dump_json(cell_to_json(CellValue{4.0})) == "4");
        CHECK(dump_json(cell_to_json(CellValue{-0.0})) == "0");
        CHECK(cell_to_json(CellValue{1e300}).is_number_float());
        CHECK(dump_json(cell_to_json(CellValue{2.5})) == "2.5");
    }

    SECTION("Affected rows") {
        QueryResult result;
        result.success = true;
        result.affected_rows = 3;
        REQUIRE(format_affected_rows(result) ==
            "[\n"
            "  {\n"
            "    \"affectedRows\": 3\n"
            "  }\n"
            "]");
    }
}
