#pragma once

#include <jsontab/core/table.hpp>
#include <jsontab/io/file.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace jsontab::io {

/// Quote a field when it contains a comma, a double quote, CR or LF
/// (RFC 4180). Embedded quotes are doubled.
[[nodiscard]] auto csv_field(std::string_view text) -> std::string;

/// Write a header row of column names followed by one line per row.
/// Lines end in LF; null cells are empty fields; there is no index column.
void write_csv(const Table& table, std::ostream& out);

/// Write `table` to `path`, replacing any existing file. Returns the number
/// of data rows written.
[[nodiscard]] auto write_csv_file(const Table& table, const std::filesystem::path& path)
    -> std::expected<std::size_t, IoError>;

}  // namespace jsontab::io
