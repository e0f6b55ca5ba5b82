#pragma once

#include "bootpack/config.hpp"
#include "bootpack/process_exec.hpp"

#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace bootpack {

/** @brief The command line tokens after the program name. Empty when argc is 0. */
std::vector<std::string_view> collect_args(int argc, const char *const *argv);

/**
 * @brief Runs one orchestrator invocation end to end.
 *
 * Parses @p args, locates the bootloader dependency, derives the paths under
 * @p project_dir and drives the pipeline.
 *
 * @return The process exit code.
 */
int run_app(std::span<const std::string_view> args,
            ProcessRunner &runner,
            const std::filesystem::path &project_dir,
            const OrchestratorConfig &config = {});

} // namespace bootpack
