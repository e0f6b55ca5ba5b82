#include "bootpack/app.hpp"
#include "bootpack/config.hpp"
#include "bootpack/process_exec.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <print>
#include <string_view>
#include <system_error>
#include <vector>

int main(const int argc, const char *const *argv) {
    std::vector<std::string_view> args = bootpack::collect_args(argc, argv);

    // Relative paths in the metadata query and the image builder resolve against here,
    // so the tool has to be started from the project root.
    std::error_code ec;
    std::filesystem::path project_dir = std::filesystem::current_path(ec);
    if (ec) {
        std::println(stderr, "Failed to determine working directory: {}", ec.message());
        return 1;
    }

    bootpack::SubprocessRunner runner;
    try {
        return bootpack::run_app(args, runner, project_dir, bootpack::OrchestratorConfig{});
    } catch (const std::exception &err) {
        std::println(stderr, "internal error: {}", err.what());
        return 1;
    }
}
