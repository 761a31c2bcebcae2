#pragma once

#include <jsontab/core/table.hpp>
#include <jsontab/json/value.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace jsontab::flatten {

/// What to do with an array found inside a record.
enum class ArrayPolicy : std::uint8_t {
    /// One cell holding the array's compact JSON text.
    Serialize,
    /// One column per element, named `<path><sep><index>`.
    Index,
    /// One Structured cell, left for the sanitizer to serialize.
    Keep,
};

struct FlattenOptions {
    std::string separator = "__";
    /// Meta columns are named `<meta_prefix><separator><key>`.
    std::string meta_prefix = "meta";
    ArrayPolicy arrays = ArrayPolicy::Serialize;
    /// Objects nested deeper than this stay as Structured cells. Unset = no limit.
    std::optional<std::size_t> max_level;
    /// Inputs nested deeper than this are rejected.
    std::size_t max_depth = 512;
};

struct FlattenError {
    std::string message;
    std::size_t depth = 0;

    [[nodiscard]] auto format() const -> std::string;
};

using FlattenResult = std::expected<Table, FlattenError>;

/// Column name used for a primitive root and for non-object array elements.
inline constexpr std::string_view kValueColumn = "value";

/// Flatten a parsed document into a table.
///
/// An array root yields one row per element. An object root with exactly one
/// array-valued key yields one row per element of that array, with every
/// other top-level key broadcast as a meta column. Any other object is one
/// row; a primitive is one row in column "value".
[[nodiscard]] auto flatten(const json::Value& root, const FlattenOptions& options = {})
    -> FlattenResult;

/// Flatten one record into (column, cell) pairs. Nested objects are joined
/// with the separator; arrays follow `options.arrays`.
[[nodiscard]] auto flatten_record(const json::Value& value, const FlattenOptions& options = {})
    -> Record;

/// Key of the single array-valued member of `root`, if there is exactly one.
[[nodiscard]] auto find_record_array(const json::Value& root) -> std::optional<std::string>;

/// Meta columns for every top-level member of `root` other than `records_key`.
/// Objects and arrays are stored as compact JSON text, scalars as-is. An
/// object under the key `options.meta_prefix` contributes its members, so
/// {"meta": {"v": 2}} gives column `meta__v` rather than `meta__meta`.
[[nodiscard]] auto meta_fields(const json::Value& root, std::string_view records_key,
                               const FlattenOptions& options = {}) -> Record;

/// Broadcast every meta field onto each row of `table`.
void broadcast_meta(Table& table, const Record& meta);

/// Deepest object/array nesting in `value` (a scalar is 0, `[]` is 1).
[[nodiscard]] auto nesting_depth(const json::Value& value) -> std::size_t;

[[nodiscard]] auto parse_array_policy(std::string_view text) -> std::optional<ArrayPolicy>;

}  // namespace jsontab::flatten
