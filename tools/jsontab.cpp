#include <jsontab/app/app.hpp>
#include <jsontab/app/cli.hpp>

#include <spdlog/spdlog.h>

auto main(int argc, char** argv) -> int {
    auto command = jsontab::app::parse_command_line(argc, argv);
    if (!command) {
        return command.error();
    }

    if (command->verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    return static_cast<int>(jsontab::app::run(command->config));
}
