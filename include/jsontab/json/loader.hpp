#pragma once

#include <jsontab/json/value.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace jsontab::json {

/// Which grammar produced a load error.
enum class ParseMode : std::uint8_t {
    Document,
    Lines,
};

/// Failure to read the input as either a single JSON document or JSON Lines.
struct ParseError {
    std::string message;
    ParseMode mode = ParseMode::Document;
    std::size_t line = 0;
    std::size_t column = 0;
    /// Byte offset into the input (document mode only).
    std::size_t offset = 0;

    [[nodiscard]] auto format() const -> std::string;
};

using ParseResult = std::expected<Value, ParseError>;

/// Parse `text` as one JSON document.
[[nodiscard]] auto parse_document(std::string_view text) -> ParseResult;

/// Parse `text` as JSON Lines. Blank lines are skipped; the result is an array
/// holding one element per non-blank line, in line order.
[[nodiscard]] auto parse_lines(std::string_view text) -> ParseResult;

/// Parse `text` as a single document, falling back to JSON Lines.
///
/// A JSON Lines pass that finds no records reports the first document
/// error, which is the more useful diagnostic.
[[nodiscard]] auto load(std::string_view text) -> ParseResult;

}  // namespace jsontab::json
