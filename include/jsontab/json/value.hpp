#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace jsontab::json {

/// Parsed JSON document. Objects keep their keys in insertion order so that
/// column order follows the source text.
using Value = nlohmann::ordered_json;

/// Value type tag, one enumerator per JSON variant.
using Kind = nlohmann::ordered_json::value_t;

/// Compact serialization (no whitespace, non-ASCII emitted verbatim).
/// Throws Value::type_error on strings that are not valid UTF-8.
[[nodiscard]] auto dump_compact(const Value& value) -> std::string;

/// Compact serialization that never throws: invalid UTF-8 is replaced by U+FFFD.
[[nodiscard]] auto dump_lenient(const Value& value) -> std::string;

}  // namespace jsontab::json
