#include "bootpack/app.hpp"

#include "bootpack/metadata.hpp"
#include "bootpack/options.hpp"
#include "bootpack/paths.hpp"
#include "bootpack/pipeline.hpp"

#include <cstdio>
#include <print>
#include <vector>

namespace bootpack {

std::vector<std::string_view> collect_args(int argc, const char *const *argv) {
    if (argc <= 0)
        return {};
    return std::vector<std::string_view>(argv + 1, argv + argc);
}

int run_app(std::span<const std::string_view> args,
            ProcessRunner &runner,
            const std::filesystem::path &project_dir,
            const OrchestratorConfig &config) {
    auto parsed = parse_options(args);
    if (!parsed) {
        std::println("{}", describe(parsed.error()));
        print_usage();
        return 1;
    }
    if (parsed->show_help) {
        print_help();
        return 0;
    }

    auto dep_dir = resolve_dependency_path(runner, config, config.bootloader_package);
    if (!dep_dir) {
        std::println(stderr, "{}", dep_dir.error().message);
        return 1;
    }

    Pipeline pipeline{runner, parsed->config, resolve_paths(parsed->config, *dep_dir, project_dir, config), config};
    return pipeline.run();
}

} // namespace bootpack
