#pragma once

#include <jsontab/core/cell.hpp>

#include <concepts>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsontab {

struct ColumnEntry {
    std::string name;
    std::vector<Cell> cells;
};

/// One flattened record: (column name, cell) pairs in first-seen order.
/// Duplicate names are allowed; the last one wins when the record is appended.
using Record = std::vector<std::pair<std::string, Cell>>;

/// A rectangular table of named columns.
///
/// Columns are kept in first-appearance order. Every column always holds
/// exactly rows() cells: a column first seen in a later row is back-filled
/// with null, and a row that lacks a column gets null in it.
class Table {
   public:
    Table() = default;

    /// Return the column named `name`, appending it (null-filled) if absent.
    auto add_column(std::string name) -> ColumnEntry&;

    /// Append one row.
    void append_row(Record record);

    /// Set `name` to `value` on every row, creating or replacing the column.
    void broadcast(std::string name, const Cell& value);

    [[nodiscard]] auto find(const std::string& name) -> ColumnEntry*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnEntry*;

    /// Cell at (row, name). A column the table does not have reads as null.
    /// Throws std::out_of_range when `row` is past the end.
    [[nodiscard]] auto at(std::size_t row, const std::string& name) const -> const Cell&;

    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnEntry>& {
        return columns_;
    }
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_; }

    /// True when there is nothing to output: no rows or no columns.
    [[nodiscard]] auto empty() const noexcept -> bool { return rows_ == 0 || columns_.empty(); }

    /// Copy of the first `n` rows (all rows when n >= rows()).
    [[nodiscard]] auto head(std::size_t n) const -> Table;

    /// Apply `func` to every cell in place. The shape cannot change.
    template <typename F>
        requires std::invocable<F&, Cell&>
    void for_each_cell(F&& func) {
        for (auto& entry : columns_) {
            for (auto& cell : entry.cells) {
                func(cell);
            }
        }
    }

   private:
    std::vector<ColumnEntry> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t rows_ = 0;
};

}  // namespace jsontab
