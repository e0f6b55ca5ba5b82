#pragma once

#include "bootpack/config.hpp"
#include "bootpack/options.hpp"

#include <filesystem>

namespace bootpack {

struct ResolvedPaths {
    std::filesystem::path manifest_path;
    std::filesystem::path target_dir;
    std::filesystem::path out_dir;
    std::filesystem::path expected_binary_path;
    std::filesystem::path dependency_root_dir;

    bool operator==(const ResolvedPaths &) const = default;
};

/** @brief Disk images the bootloader's builder writes into the output directory. */
struct BootArtifacts {
    std::filesystem::path bios_image;
    std::filesystem::path uefi_executable;
    std::filesystem::path uefi_fat;
    std::filesystem::path uefi_image;
};

/**
 * @brief Derives every location the pipeline needs. Performs no I/O.
 *
 * The binary is expected under `target/<triple>/<profile>/<binary name>`, where the
 * profile is `release` for optimized builds and `debug` otherwise.
 */
ResolvedPaths resolve_paths(const BuildConfig &build,
                            const std::filesystem::path &dependency_root_dir,
                            const std::filesystem::path &project_dir,
                            const OrchestratorConfig &config = {});

BootArtifacts boot_artifacts(const ResolvedPaths &paths, const OrchestratorConfig &config = {});

} // namespace bootpack
