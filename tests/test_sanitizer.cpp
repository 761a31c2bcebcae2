#include <jsontab/flatten/flattener.hpp>
#include <jsontab/sanitize/sanitizer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using jsontab::Cell;
using jsontab::Structured;
using jsontab::Table;
using jsontab::sanitize::clean_string;
using jsontab::sanitize::sanitize;
using jsontab::sanitize::sanitize_cell;

namespace {

auto sample_table() -> Table {
    Table table;
    table.append_row({
        {"text", Cell{std::string("x\x07y")}},
        {"lines", Cell{std::string("line1\r\nline2\rline3")}},
        {"num", Cell{std::int64_t{7}}},
    });
    table.append_row({
        {"obj", Cell{Structured{jsontab::json::Value::parse(R"({"k": "Zoë", "a": [1]})")}}},
        {"flag", Cell{true}},
    });
    return table;
}

}  // namespace

TEST_CASE("clean_string strips control characters", "[sanitize]") {
    REQUIRE(clean_string("x\x07y") == "xy");
    REQUIRE(clean_string(std::string("a\0b", 3)) == "ab");
    REQUIRE(clean_string("a\x0B\x0C\x1F\x7F" "b") == "ab");
    REQUIRE(clean_string("tab\tstays") == "tab\tstays");
    REQUIRE(clean_string("plain text") == "plain text");
}

TEST_CASE("clean_string normalizes line endings", "[sanitize]") {
    REQUIRE(clean_string("line1\r\nline2") == "line1\nline2");
    REQUIRE(clean_string("a\rb") == "a\nb");
    REQUIRE(clean_string("a\r\r\nb") == "a\n\nb");
    REQUIRE(clean_string("keep\nlf") == "keep\nlf");
    REQUIRE(clean_string("end\r") == "end\n");
}

TEST_CASE("clean_string leaves UTF-8 untouched", "[sanitize]") {
    REQUIRE(clean_string("Zoë 東京 🚀") == "Zoë 東京 🚀");
}

TEST_CASE("sanitize_cell by cell kind", "[sanitize]") {
    SECTION("string") {
        Cell cell{std::string("x\x07y")};
        sanitize_cell(cell);
        REQUIRE(std::get<std::string>(cell) == "xy");
    }

    SECTION("structured becomes compact JSON without ASCII escaping") {
        Cell cell{Structured{jsontab::json::Value::parse(R"({"name": "Zoë", "n": [1, 2]})")}};
        sanitize_cell(cell);
        REQUIRE(std::get<std::string>(cell) == R"({"name":"Zoë","n":[1,2]})");
    }

    SECTION("structured with invalid UTF-8 degrades instead of throwing") {
        jsontab::json::Value value = jsontab::json::Value::array();
        value.push_back(std::string("bad\xFF"));
        Cell cell{Structured{value}};
        jsontab::sanitize::SanitizeStats stats;
        REQUIRE_NOTHROW(sanitize_cell(cell, &stats));
        REQUIRE(stats.degraded == 1);
        const auto* text = std::get_if<std::string>(&cell);
        REQUIRE(text != nullptr);
        REQUIRE(text->starts_with("[\"bad"));
    }

    SECTION("numbers, booleans and null pass through") {
        Cell number{1.25};
        Cell flag{false};
        Cell null;
        sanitize_cell(number);
        sanitize_cell(flag);
        sanitize_cell(null);
        REQUIRE(std::get<double>(number) == 1.25);
        REQUIRE_FALSE(std::get<bool>(flag));
        REQUIRE(jsontab::is_null(null));
    }
}

TEST_CASE("sanitize preserves table shape", "[sanitize]") {
    auto table = sample_table();
    const auto names = table.column_names();
    const auto rows = table.rows();

    auto stats = sanitize(table);

    REQUIRE(table.rows() == rows);
    REQUIRE(table.column_names() == names);
    REQUIRE(stats.strings_rewritten == 2);
    REQUIRE(stats.structured_serialized == 1);
    REQUIRE(std::get<std::string>(table.at(0, "text")) == "xy");
    REQUIRE(std::get<std::string>(table.at(0, "lines")) == "line1\nline2\nline3");
    REQUIRE(std::get<std::string>(table.at(1, "obj")) == R"({"k":"Zoë","a":[1]})");
    REQUIRE(jsontab::is_null(table.at(0, "obj")));
    REQUIRE(std::get<bool>(table.at(1, "flag")));
}

TEST_CASE("sanitize is idempotent", "[sanitize]") {
    auto once = sample_table();
    sanitize(once);
    auto twice = once;
    auto stats = sanitize(twice);

    REQUIRE(stats.strings_rewritten == 0);
    REQUIRE(stats.structured_serialized == 0);
    for (const auto& name : once.column_names()) {
        for (std::size_t r = 0; r < once.rows(); ++r) {
            REQUIRE(once.at(r, name) == twice.at(r, name));
        }
    }
}

TEST_CASE("sanitize serializes arrays kept by the flattener", "[sanitize]") {
    jsontab::flatten::FlattenOptions options;
    options.arrays = jsontab::flatten::ArrayPolicy::Keep;
    auto table = jsontab::flatten::flatten(
        jsontab::json::Value::parse(R"([{"a": ["p\u0007q", 2]}])"), options);
    REQUIRE(table.has_value());

    sanitize(*table);
    REQUIRE(std::get<std::string>(table->at(0, "a")) == R"(["p\u0007q",2])");
}

TEST_CASE("sanitize strips DEL from serialized structured cells", "[sanitize]") {
    Cell once{Structured{jsontab::json::Value::parse(R"(["x\u007fy"])")}};
    sanitize_cell(once);
    REQUIRE(std::get<std::string>(once) == R"(["xy"])");

    Cell twice = once;
    sanitize_cell(twice);
    REQUIRE(twice == once);

    jsontab::flatten::FlattenOptions options;
    options.arrays = jsontab::flatten::ArrayPolicy::Keep;
    auto table = jsontab::flatten::flatten(
        jsontab::json::Value::parse(R"([{"a": ["x\u007fy"]}])"), options);
    REQUIRE(table.has_value());
    sanitize(*table);
    auto first = std::get<std::string>(table->at(0, "a"));
    REQUIRE(first.find('\x7f') == std::string::npos);
    sanitize(*table);
    REQUIRE(std::get<std::string>(table->at(0, "a")) == first);
}
