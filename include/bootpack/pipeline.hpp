#pragma once

#include "bootpack/config.hpp"
#include "bootpack/options.hpp"
#include "bootpack/paths.hpp"
#include "bootpack/process_exec.hpp"

#include <cstddef>
#include <ostream>
#include <string_view>

namespace bootpack {

enum class Stage {
    EnsureOutputDir,
    Compile,
    BuildImage,
    Run,
    Done,
};

/** @brief Stage following @p stage; Run is only reached when the config asks for it. */
Stage next_stage(Stage stage, const BuildConfig &build);

std::string_view stage_name(Stage stage);

/**
 * @brief Runs the build stages in order, stopping at the first failure.
 *
 * Stages are strictly sequential. A failing stage's exit status is returned as is;
 * when the emulator runs its status becomes the result of the whole pipeline.
 */
class Pipeline {
public:
    Pipeline(ProcessRunner &runner, BuildConfig build, ResolvedPaths paths, OrchestratorConfig config = {});

    int run();

    /** @brief The subprocess a stage spawns. Empty for stages that spawn none. */
    Command command_for(Stage stage) const;

    Stage last_stage() const {
        return current;
    }

private:
    int execute(Stage stage);
    int ensure_output_dir();
    void announce(std::ostream &tty, Stage stage, size_t index, size_t total) const;
    void report_artifacts() const;

    ProcessRunner &runner;
    BuildConfig build;
    ResolvedPaths paths;
    OrchestratorConfig config;
    Stage current = Stage::EnsureOutputDir;
};

} // namespace bootpack
