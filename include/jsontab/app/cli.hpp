#pragma once

#include <jsontab/app/app.hpp>

#include <expected>
#include <iostream>
#include <ostream>

namespace jsontab::app {

struct CommandLine {
    AppConfig config;
    bool verbose = false;
};

/// Parse the command line into a run configuration.
///
/// When parsing ends the program instead (--help, --version or a usage
/// error), the message has been written to `out`/`err` and the error holds
/// the exit status to return.
[[nodiscard]] auto parse_command_line(int argc, const char* const* argv,
                                      std::ostream& out = std::cout,
                                      std::ostream& err = std::cerr)
    -> std::expected<CommandLine, int>;

}  // namespace jsontab::app
