#include <jsontab/app/cli.hpp>
#include <jsontab/flatten/flattener.hpp>

#include <CLI/CLI.hpp>

#include <cstddef>
#include <string>

namespace jsontab::app {

namespace {

// Value CLI11 reports for a bare -o.
constexpr const char* kAutoOutput = "auto";

}  // namespace

auto parse_command_line(int argc, const char* const* argv, std::ostream& out, std::ostream& err)
    -> std::expected<CommandLine, int> {
    CLI::App app{"jsontab: flatten JSON or JSON Lines into a table for display or CSV export"};
    app.set_version_flag("--version", "jsontab 0.1.0");

    std::string input_path;
    std::string separator = "__";
    std::size_t rows = 10;
    std::string output_path;
    std::string arrays = "serialize";
    std::size_t max_level = 0;
    bool verbose = false;

    app.add_option("input", input_path, "Path to input JSON/JSONL file")->required();
    app.add_option("--sep", separator, "Separator for nested keys (default: __)");
    app.add_option("-n,--rows", rows, "Number of rows to display (default: 10)")
        ->check(CLI::NonNegativeNumber);
    auto* output_opt =
        app.add_option("-o,--output", output_path,
                       "Save as CSV. Without a path, writes <input stem>_flat.csv to the "
                       "Downloads folder (or JSONTAB_OUTPUT_DIR).")
            ->expected(0, 1)
            ->default_str(kAutoOutput);
    app.add_option("--arrays", arrays,
                   "How nested arrays become cells: serialize (one JSON cell), "
                   "index (one column per element) or keep (default: serialize)")
        ->check(CLI::IsMember({"serialize", "index", "keep"}));
    auto* max_level_opt =
        app.add_option("--max-level", max_level,
                       "Stop flattening objects below this nesting level (default: unlimited)")
            ->check(CLI::NonNegativeNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e, out, err));
    }

    CommandLine command;
    command.verbose = verbose;
    auto& config = command.config;
    config.input = input_path;
    config.flatten.separator = separator;
    config.preview_rows = rows;
    if (auto policy = flatten::parse_array_policy(arrays)) {
        config.flatten.arrays = *policy;
    }
    if (max_level_opt->count() > 0) {
        config.flatten.max_level = max_level;
    }
    if (output_opt->count() > 0) {
        config.save = true;
        if (!output_path.empty() && output_path != kAutoOutput) {
            config.output = output_path;
        }
    }
    return command;
}

}  // namespace jsontab::app
