#include <jsontab/flatten/flattener.hpp>
#include <jsontab/io/csv.hpp>
#include <jsontab/io/preview.hpp>
#include <jsontab/json/loader.hpp>
#include <jsontab/sanitize/sanitizer.hpp>

#include <fmt/core.h>

#include <iostream>

auto main() -> int {
    // A typical API response: one record array plus envelope fields.
    constexpr const char* kResponse = R"({
        "meta": {"page": 1},
        "items": [
            {"sku": "A-1", "price": {"amount": 9.5, "currency": "EUR"}, "tags": ["new"]},
            {"sku": "B-2", "price": {"amount": 12, "currency": "EUR"}, "note": "two\r\nlines"}
        ]
    })";

    fmt::print("=== Load ===\n");
    auto document = jsontab::json::load(kResponse);
    if (!document) {
        fmt::print("load failed: {}\n", document.error().format());
        return 1;
    }

    fmt::print("\n=== Flatten ===\n");
    auto table = jsontab::flatten::flatten(*document);
    if (!table) {
        fmt::print("flatten failed: {}\n", table.error().format());
        return 1;
    }
    for (const auto& name : table->column_names()) {
        fmt::print("  {}\n", name);
    }

    fmt::print("\n=== Sanitize + preview ===\n");
    auto stats = jsontab::sanitize::sanitize(*table);
    fmt::print("strings rewritten: {}\n", stats.strings_rewritten);
    jsontab::io::print_table(*table, 10, std::cout);

    fmt::print("\n=== CSV ===\n");
    jsontab::io::write_csv(*table, std::cout);

    return 0;
}
