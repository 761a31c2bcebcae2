#pragma once

#include <jsontab/flatten/flattener.hpp>

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>

namespace jsontab::app {

/// Process exit status for each outcome of a run.
enum class ExitCode : int {
    Ok = 0,
    InputNotFound = 2,
    ParseFailed = 3,
    WriteFailed = 4,
};

struct AppConfig {
    std::filesystem::path input;
    flatten::FlattenOptions flatten;
    /// Rows shown when printing instead of saving.
    std::size_t preview_rows = 10;
    /// Save as CSV instead of printing.
    bool save = false;
    /// Explicit CSV destination; when unset and `save` is true the automatic
    /// path `<output dir>/<input stem>_flat.csv` is used.
    std::optional<std::filesystem::path> output;
    /// Directory for the automatic path. Unset means default_output_dir().
    std::optional<std::filesystem::path> output_dir;
};

/// Replace a leading "~" with the home directory.
[[nodiscard]] auto expand_user(const std::filesystem::path& path) -> std::filesystem::path;

/// JSONTAB_OUTPUT_DIR when set, otherwise the Downloads folder in the home
/// directory.
[[nodiscard]] auto default_output_dir() -> std::filesystem::path;

/// Where the CSV for `config` goes.
[[nodiscard]] auto resolve_output_path(const AppConfig& config) -> std::filesystem::path;

/// Load, flatten, sanitize, then save or print.
[[nodiscard]] auto run(const AppConfig& config, std::ostream& out = std::cout,
                       std::ostream& err = std::cerr) -> ExitCode;

}  // namespace jsontab::app
