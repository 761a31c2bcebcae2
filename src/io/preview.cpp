#include <jsontab/io/preview.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <vector>

namespace jsontab::io {

namespace {

auto escape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\t':
                out.append("\\t");
                break;
            case '\r':
                out.append("\\r");
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    return out;
}

void write_padded(std::ostream& out, std::string_view text, std::size_t width) {
    out << ' ' << text;
    const auto used = display_width(text);
    if (used < width) {
        out << std::string(width - used, ' ');
    }
    out << " |";
}

}  // namespace

auto preview_cell(const Cell& cell) -> std::string {
    if (is_null(cell)) {
        return "null";
    }
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return escape(*text);
    }
    return cell_text(cell);
}

auto display_width(std::string_view text) noexcept -> std::size_t {
    // Count every byte that is not a UTF-8 continuation byte.
    return static_cast<std::size_t>(std::ranges::count_if(
        text, [](char ch) { return (static_cast<unsigned char>(ch) & 0xC0) != 0x80; }));
}

void print_table(const Table& table, std::size_t max_rows, std::ostream& out) {
    const auto& columns = table.columns();
    if (columns.empty()) {
        out << "<empty>\n";
        return;
    }

    const std::size_t col_count = columns.size();
    const std::size_t shown_rows = std::min(table.rows(), max_rows);

    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = display_width(columns[c].name);
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = preview_cell(columns[c].cells[r]);
            widths[c] = std::max(widths[c], display_width(cell));
            cells[c].push_back(std::move(cell));
        }
    }

    auto print_sep = [&]() {
        out << '+';
        for (std::size_t c = 0; c < col_count; ++c) {
            out << fmt::format("{:-<{}}+", "", widths[c] + 2);
        }
        out << '\n';
    };

    print_sep();
    out << '|';
    for (std::size_t c = 0; c < col_count; ++c) {
        write_padded(out, columns[c].name, widths[c]);
    }
    out << '\n';
    print_sep();

    for (std::size_t r = 0; r < shown_rows; ++r) {
        out << '|';
        for (std::size_t c = 0; c < col_count; ++c) {
            write_padded(out, cells[c][r], widths[c]);
        }
        out << '\n';
    }
    print_sep();

    if (table.rows() > shown_rows) {
        out << fmt::format("... ({} more rows)\n", table.rows() - shown_rows);
    }
}

}  // namespace jsontab::io
