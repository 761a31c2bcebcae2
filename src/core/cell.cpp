#include <jsontab/core/cell.hpp>

#include <fmt/core.h>

#include <limits>
#include <type_traits>

namespace jsontab {

auto cell_from_json(const json::Value& value) -> Cell {
    switch (value.type()) {
        case json::Kind::null:
        case json::Kind::discarded:
            return std::monostate{};
        case json::Kind::boolean:
            return value.get<bool>();
        case json::Kind::number_integer:
            return value.get<std::int64_t>();
        case json::Kind::number_unsigned: {
            // Non-negative literals parse as unsigned; only values past the
            // signed range stay unsigned.
            const auto u = value.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::int64_t>(u);
            }
            return Cell{std::in_place_type<std::uint64_t>, u};
        }
        case json::Kind::number_float:
            return value.get<double>();
        case json::Kind::string:
            return value.get<std::string>();
        case json::Kind::object:
        case json::Kind::array:
        case json::Kind::binary:
            return Structured{value};
    }
    return std::monostate{};
}

auto cell_text(const Cell& cell) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                // Shortest round-trip spelling, with a trailing ".0" on integral values.
                return json::dump_compact(json::Value(v));
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Structured>) {
                return json::dump_lenient(v.value);
            } else {
                return fmt::format("{}", v);
            }
        },
        cell);
}

}  // namespace jsontab
