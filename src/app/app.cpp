#include <jsontab/app/app.hpp>
#include <jsontab/io/csv.hpp>
#include <jsontab/io/file.hpp>
#include <jsontab/io/preview.hpp>
#include <jsontab/json/loader.hpp>
#include <jsontab/sanitize/sanitizer.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

namespace jsontab::app {

namespace {

auto home_dir() -> std::filesystem::path {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home != nullptr && *home != '\0') {
        return home;
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path{"."} : cwd;
}

auto resolve(const std::filesystem::path& path) -> std::filesystem::path {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(expand_user(path), ec);
    if (ec) {
        return std::filesystem::absolute(expand_user(path), ec);
    }
    return resolved;
}

void print_preview(const Table& table, const std::filesystem::path& source, std::size_t max_rows,
                   std::ostream& out) {
    out << fmt::format("--- Data from {} (Total Rows: {}, Columns: {}) ---\n", source.string(),
                       table.rows(), table.columns().size());
    if (table.rows() > max_rows) {
        out << fmt::format("\nShowing the first {} rows:\n", max_rows);
        io::print_table(table.head(max_rows), max_rows, out);
    } else {
        out << "\nShowing all rows:\n";
        io::print_table(table, table.rows(), out);
    }
}

}  // namespace

auto expand_user(const std::filesystem::path& path) -> std::filesystem::path {
    const auto text = path.string();
    if (text == "~") {
        return home_dir();
    }
    if (text.starts_with("~/") || text.starts_with("~\\")) {
        return home_dir() / text.substr(2);
    }
    return path;
}

auto default_output_dir() -> std::filesystem::path {
    const char* env = std::getenv("JSONTAB_OUTPUT_DIR");
    if (env != nullptr && *env != '\0') {
        return expand_user(env);
    }
    return home_dir() / "Downloads";
}

auto resolve_output_path(const AppConfig& config) -> std::filesystem::path {
    if (config.output) {
        return resolve(*config.output);
    }
    const auto dir = config.output_dir ? expand_user(*config.output_dir) : default_output_dir();
    auto stem = config.input.stem().string();
    return dir / (stem + "_flat.csv");
}

auto run(const AppConfig& config, std::ostream& out, std::ostream& err) -> ExitCode {
    const auto in_path = resolve(config.input);
    std::error_code ec;
    if (!std::filesystem::exists(in_path, ec)) {
        err << fmt::format("Error: input file not found: {}\n", in_path.string());
        return ExitCode::InputNotFound;
    }

    auto text = io::read_text_file(in_path);
    if (!text) {
        err << fmt::format("Error: cannot read input file: {}\n", text.error().format());
        return ExitCode::InputNotFound;
    }
    spdlog::debug("read {} bytes from {}", text->size(), in_path.string());

    auto document = json::load(*text);
    if (!document) {
        err << fmt::format("Error: failed to parse JSON/JSON Lines: {}\n",
                           document.error().format());
        return ExitCode::ParseFailed;
    }

    auto table = flatten::flatten(*document, config.flatten);
    if (!table) {
        err << fmt::format("Error: failed to flatten input: {}\n", table.error().format());
        return ExitCode::ParseFailed;
    }
    spdlog::debug("flattened to {} rows x {} columns", table->rows(), table->columns().size());

    if (table->empty()) {
        err << fmt::format("No records found in {}.\n", in_path.string());
        return ExitCode::Ok;
    }

    auto stats = sanitize::sanitize(*table);
    if (stats.degraded > 0) {
        spdlog::warn("{} cells could not be serialized cleanly", stats.degraded);
    }

    if (config.save) {
        const auto out_path = resolve_output_path(config);
        auto written = io::write_csv_file(*table, out_path);
        if (!written) {
            err << fmt::format("Error: Failed to save file to {}: {}\n", out_path.generic_string(),
                               written.error().message);
            return ExitCode::WriteFailed;
        }
        out << fmt::format("Success! Flattened data saved to {} (Rows: {}).\n",
                           out_path.generic_string(), *written);
        return ExitCode::Ok;
    }

    print_preview(*table, in_path, config.preview_rows, out);
    return ExitCode::Ok;
}

}  // namespace jsontab::app
