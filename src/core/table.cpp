#include <jsontab/core/table.hpp>

#include <algorithm>
#include <stdexcept>

namespace jsontab {

namespace {

const Cell kNullCell{};

}  // namespace

auto Table::add_column(std::string name) -> ColumnEntry& {
    if (auto it = index_.find(name); it != index_.end()) {
        return columns_[it->second];
    }
    std::size_t pos = columns_.size();
    columns_.push_back(ColumnEntry{.name = std::move(name), .cells = std::vector<Cell>(rows_)});
    index_[columns_.back().name] = pos;
    return columns_.back();
}

void Table::append_row(Record record) {
    for (auto& [name, cell] : record) {
        auto& entry = add_column(std::move(name));
        if (entry.cells.size() > rows_) {
            // Same path already written for this row.
            entry.cells.back() = std::move(cell);
        } else {
            entry.cells.push_back(std::move(cell));
        }
    }
    ++rows_;
    for (auto& entry : columns_) {
        entry.cells.resize(rows_);
    }
}

void Table::broadcast(std::string name, const Cell& value) {
    auto& entry = add_column(std::move(name));
    std::fill(entry.cells.begin(), entry.cells.end(), value);
}

auto Table::find(const std::string& name) -> ColumnEntry* {
    if (auto it = index_.find(name); it != index_.end()) {
        return &columns_[it->second];
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index_.find(name); it != index_.end()) {
        return &columns_[it->second];
    }
    return nullptr;
}

auto Table::at(std::size_t row, const std::string& name) const -> const Cell& {
    if (row >= rows_) {
        throw std::out_of_range("row index out of range");
    }
    const auto* entry = find(name);
    if (entry == nullptr) {
        return kNullCell;
    }
    return entry->cells[row];
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& entry : columns_) {
        names.push_back(entry.name);
    }
    return names;
}

auto Table::head(std::size_t n) const -> Table {
    Table out;
    out.rows_ = std::min(n, rows_);
    out.columns_.reserve(columns_.size());
    for (const auto& entry : columns_) {
        out.columns_.push_back(ColumnEntry{
            .name = entry.name,
            .cells = std::vector<Cell>(entry.cells.begin(),
                                       entry.cells.begin() + static_cast<std::ptrdiff_t>(out.rows_)),
        });
    }
    out.index_ = index_;
    return out;
}

}  // namespace jsontab
