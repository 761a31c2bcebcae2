#pragma once

#include <jsontab/core/table.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace jsontab::io {

/// Terminal text for a cell: null prints as "null", and LF, CR, tab and
/// backslash in strings are escaped so that each row stays on one line.
[[nodiscard]] auto preview_cell(const Cell& cell) -> std::string;

/// Number of UTF-8 code points in `text`.
[[nodiscard]] auto display_width(std::string_view text) noexcept -> std::size_t;

/// Render the first `max_rows` rows of `table` as a boxed grid.
void print_table(const Table& table, std::size_t max_rows, std::ostream& out);

}  // namespace jsontab::io
