#include <jsontab/io/csv.hpp>

#include <fstream>

namespace jsontab::io {

namespace {

void write_line(std::ostream& out, const Table& table, std::size_t row) {
    const auto& columns = table.columns();
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) {
            out << ',';
        }
        out << csv_field(cell_text(columns[c].cells[row]));
    }
    out << '\n';
}

}  // namespace

auto csv_field(std::string_view text) -> std::string {
    if (text.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(text);
    }
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

void write_csv(const Table& table, std::ostream& out) {
    const auto& columns = table.columns();
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) {
            out << ',';
        }
        out << csv_field(columns[c].name);
    }
    out << '\n';

    for (std::size_t r = 0; r < table.rows(); ++r) {
        write_line(out, table, r);
    }
}

auto write_csv_file(const Table& table, const std::filesystem::path& path)
    -> std::expected<std::size_t, IoError> {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(IoError{.message = "cannot open for writing", .path = path});
    }
    write_csv(table, out);
    out.flush();
    if (!out) {
        return std::unexpected(IoError{.message = "write failed", .path = path});
    }
    return table.rows();
}

}  // namespace jsontab::io
