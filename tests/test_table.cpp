#include <jsontab/core/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using jsontab::Cell;
using jsontab::Table;
using Names = std::vector<std::string>;

TEST_CASE("Table basic operations", "[core][table]") {
    Table table;
    table.append_row({{"a", Cell{std::int64_t{1}}}, {"b", Cell{std::string("x")}}});
    table.append_row({{"b", Cell{std::string("y")}}, {"c", Cell{2.5}}});

    SECTION("rows and columns") {
        REQUIRE(table.rows() == 2);
        REQUIRE(table.column_names() == Names{"a", "b", "c"});
        REQUIRE_FALSE(table.empty());
    }

    SECTION("every column has one cell per row") {
        for (const auto& entry : table.columns()) {
            REQUIRE(entry.cells.size() == table.rows());
        }
    }

    SECTION("missing cells read as null") {
        REQUIRE(jsontab::is_null(table.at(1, "a")));
        REQUIRE(jsontab::is_null(table.at(0, "c")));
        REQUIRE(jsontab::is_null(table.at(0, "not-a-column")));
    }

    SECTION("at() throws past the last row") {
        REQUIRE_THROWS_AS(table.at(2, "a"), std::out_of_range);
    }

    SECTION("find") {
        REQUIRE(table.find("b") != nullptr);
        REQUIRE(table.find("b")->cells.size() == 2);
        REQUIRE(table.find("zzz") == nullptr);
    }
}

TEST_CASE("Table duplicate names in one record keep the last value", "[core][table]") {
    Table table;
    table.append_row({{"k", Cell{std::int64_t{1}}}, {"k", Cell{std::int64_t{2}}}});
    REQUIRE(table.columns().size() == 1);
    REQUIRE(std::get<std::int64_t>(table.at(0, "k")) == 2);
}

TEST_CASE("Table broadcast", "[core][table]") {
    Table table;
    table.append_row({{"x", Cell{std::int64_t{1}}}});
    table.append_row({{"x", Cell{std::int64_t{2}}}});
    table.broadcast("meta__v", Cell{std::int64_t{7}});

    REQUIRE(table.column_names() == Names{"x", "meta__v"});
    REQUIRE(std::get<std::int64_t>(table.at(0, "meta__v")) == 7);
    REQUIRE(std::get<std::int64_t>(table.at(1, "meta__v")) == 7);

    table.broadcast("x", Cell{});
    REQUIRE(table.column_names() == Names{"x", "meta__v"});
    REQUIRE(jsontab::is_null(table.at(1, "x")));
}

TEST_CASE("Table broadcast on an empty table adds a column and no rows", "[core][table]") {
    Table table;
    table.broadcast("meta__v", Cell{true});
    REQUIRE(table.rows() == 0);
    REQUIRE(table.columns().size() == 1);
    REQUIRE(table.empty());
}

TEST_CASE("Table head", "[core][table]") {
    Table table;
    for (std::int64_t i = 0; i < 5; ++i) {
        table.append_row({{"i", Cell{i}}});
    }

    auto first = table.head(2);
    REQUIRE(first.rows() == 2);
    REQUIRE(first.column_names() == Names{"i"});
    REQUIRE(std::get<std::int64_t>(first.at(1, "i")) == 1);
    REQUIRE(first.find("i")->cells.size() == 2);

    REQUIRE(table.head(100).rows() == 5);
    REQUIRE(table.head(0).rows() == 0);
}

TEST_CASE("Table with rows but no columns is empty", "[core][table]") {
    Table table;
    table.append_row({});
    REQUIRE(table.rows() == 1);
    REQUIRE(table.empty());
}

TEST_CASE("Table default-constructs empty", "[core][table]") {
    Table table;
    REQUIRE(table.empty());
    REQUIRE(table.rows() == 0);
    REQUIRE(table.columns().empty());
}
