#pragma once

#include <jsontab/json/value.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace jsontab {

/// An object or array value stored in a cell without being serialized.
struct Structured {
    json::Value value;

    friend auto operator==(const Structured& lhs, const Structured& rhs) -> bool {
        return lhs.value == rhs.value;
    }
};

/// A single table cell. std::monostate is null/absent.
using Cell = std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string,
                          Structured>;

[[nodiscard]] inline auto is_null(const Cell& cell) noexcept -> bool {
    return std::holds_alternative<std::monostate>(cell);
}

/// Build a cell from a JSON value: scalars map to their matching alternative,
/// objects and arrays become Structured.
[[nodiscard]] auto cell_from_json(const json::Value& value) -> Cell;

/// Text of a cell as written to CSV: null is empty, booleans are true/false,
/// numbers use their JSON spelling and structured cells their compact JSON.
[[nodiscard]] auto cell_text(const Cell& cell) -> std::string;

}  // namespace jsontab
