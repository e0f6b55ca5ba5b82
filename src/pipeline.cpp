#include "bootpack/pipeline.hpp"

#include "bootpack/process_exec.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <print>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace bootpack {

Stage next_stage(Stage stage, const BuildConfig &build) {
    switch (stage) {
    case Stage::EnsureOutputDir:
        return Stage::Compile;
    case Stage::Compile:
        return Stage::BuildImage;
    case Stage::BuildImage:
        return build.should_run ? Stage::Run : Stage::Done;
    case Stage::Run:
    case Stage::Done:
        return Stage::Done;
    }
    return Stage::Done;
}

std::string_view stage_name(Stage stage) {
    switch (stage) {
    case Stage::EnsureOutputDir:
        return "mkdir";
    case Stage::Compile:
        return "build";
    case Stage::BuildImage:
        return "image";
    case Stage::Run:
        return "run";
    case Stage::Done:
        return "done";
    }
    return "unknown";
}

Pipeline::Pipeline(ProcessRunner &runner, BuildConfig build, ResolvedPaths paths, OrchestratorConfig config)
    : runner(runner), build(build), paths(std::move(paths)), config(std::move(config)) {
}

Command Pipeline::command_for(Stage stage) const {
    switch (stage) {
    case Stage::Compile: {
        Command cmd{.args = {config.cargo, "build"}};
        if (build.optimized)
            cmd.args.push_back("--release");
        return cmd;
    }
    case Stage::BuildImage:
        return {.args = {config.cargo,
                         config.builder_subcommand,
                         "--kernel-manifest",
                         paths.manifest_path.string(),
                         "--kernel-binary",
                         paths.expected_binary_path.string(),
                         "--target-dir",
                         paths.target_dir.string(),
                         "--out-dir",
                         paths.out_dir.string()},
                .working_dir = paths.dependency_root_dir.string()};
    case Stage::Run: {
        // The firmware file is looked up relative to the project root.
        Command cmd{.args = {config.emulator, "-bios", config.bios_firmware, boot_artifacts(paths, config).uefi_image.string()},
                    .working_dir = paths.manifest_path.parent_path().string()};
        if (build.wait_for_debugger)
            cmd.args.insert(cmd.args.end(), {"-s", "-S"});
        return cmd;
    }
    case Stage::EnsureOutputDir:
    case Stage::Done:
        break;
    }
    return {};
}

int Pipeline::ensure_output_dir() {
    std::error_code ec;
    fs::create_directories(paths.out_dir, ec);
    if (ec) {
        std::println(stderr, "Failed to create {}: {}", paths.out_dir.string(), ec.message());
        return 1;
    }
    return 0;
}

void Pipeline::announce(std::ostream &tty, Stage stage, size_t index, size_t total) const {
    fs::path target;
    switch (stage) {
    case Stage::Compile:
        target = paths.expected_binary_path;
        break;
    case Stage::Run:
        target = boot_artifacts(paths, config).uefi_image;
        break;
    default:
        target = paths.out_dir;
        break;
    }

    tty << "\033[1m" << std::flush;
    std::cout << "[" << index << "/" << total << "] " << std::flush;
    tty << "\033[0m\033[1;32m" << std::flush;
    std::cout << std::setw(5) << stage_name(stage) << std::flush;
    tty << "\033[0m\033[0m" << std::flush;
    std::cout << " -> " << target.string() << std::endl;
}

void Pipeline::report_artifacts() const {
    const BootArtifacts artifacts = boot_artifacts(paths, config);
    for (const auto &image : {artifacts.bios_image, artifacts.uefi_executable, artifacts.uefi_fat, artifacts.uefi_image}) {
        if (fs::exists(image))
            std::println("      {}", image.string());
    }
}

int Pipeline::execute(Stage stage) {
    if (stage == Stage::EnsureOutputDir)
        return ensure_output_dir();

    auto res = runner.run(command_for(stage));
    if (!res) {
        std::println(stderr, "Failed to execute: {}", res.error());
        return 1;
    }

    int ec = *res;
    if (ec != 0 && stage != Stage::Run) {
        std::println(stderr, "Build failed: {} (exit code {})", stage_name(stage), ec);
    }
    return ec;
}

int Pipeline::run() {
#ifdef __linux__
    std::ofstream tty("/dev/tty");
#else
    std::ostream tty(nullptr);
#endif

    const size_t total = build.should_run ? 4 : 3;
    size_t index = 1;

    for (Stage stage = Stage::EnsureOutputDir; stage != Stage::Done; stage = next_stage(stage, build), ++index) {
        current = stage;
        announce(tty, stage, index, total);

        int ec = execute(stage);
        if (stage == Stage::Run)
            return ec;
        if (ec != 0)
            return ec;
        if (stage == Stage::BuildImage)
            report_artifacts();
    }
    return 0;
}

} // namespace bootpack
