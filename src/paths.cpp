#include "bootpack/paths.hpp"

#include <format>

namespace fs = std::filesystem;

namespace bootpack {

ResolvedPaths resolve_paths(const BuildConfig &build,
                            const fs::path &dependency_root_dir,
                            const fs::path &project_dir,
                            const OrchestratorConfig &config) {
    ResolvedPaths paths;
    paths.manifest_path = project_dir / config.manifest_name;
    paths.target_dir = project_dir / "target";
    paths.out_dir = project_dir / "out";
    paths.expected_binary_path =
        paths.target_dir / config.target_triple / (build.optimized ? "release" : "debug") / config.binary_name;
    paths.dependency_root_dir = dependency_root_dir;
    return paths;
}

BootArtifacts boot_artifacts(const ResolvedPaths &paths, const OrchestratorConfig &config) {
    const std::string &bin = config.binary_name;
    return {
        .bios_image = paths.out_dir / std::format("boot-bios-{}.img", bin),
        .uefi_executable = paths.out_dir / std::format("boot-uefi-{}.efi", bin),
        .uefi_fat = paths.out_dir / std::format("boot-uefi-{}.fat", bin),
        .uefi_image = paths.out_dir / std::format("boot-uefi-{}.img", bin),
    };
}

} // namespace bootpack
