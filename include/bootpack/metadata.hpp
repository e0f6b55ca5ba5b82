#pragma once

#include "bootpack/config.hpp"
#include "bootpack/process_exec.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bootpack {

/**
 * @brief Typed view of the package manager's resolved dependency graph.
 *
 * Only the fields the orchestrator reads are kept. The document is validated
 * once by `parse_metadata`; traversal never sees raw JSON.
 */
struct DependencyGraph {
    struct DependencyEdge {
        std::string name;
        std::string pkg_id;
    };

    struct Node {
        std::string id;
        std::vector<DependencyEdge> deps;
    };

    struct Package {
        std::string id;
        std::string manifest_path;
    };

    std::optional<std::string> root_package_id; ///< Unset for a virtual workspace.
    std::vector<Node> nodes;
    std::vector<Package> packages;
};

struct MetadataError {
    enum class Kind {
        QueryFailed,
        MalformedMetadata,
        DependencyNotFound,
    };

    Kind kind;
    std::string message;
};

/**
 * @brief Parses the output of `cargo metadata`.
 *
 * @param json The captured standard output.
 * @return The graph, or `MalformedMetadata` if a required key is missing or mistyped.
 */
std::expected<DependencyGraph, MetadataError> parse_metadata(std::string_view json);

/**
 * @brief Finds the source directory of a direct dependency of the root package.
 *
 * The first edge named @p name under the root node is taken. The directory is the
 * parent of the matching package's manifest path.
 *
 * @throws std::logic_error If the edge points to a package id absent from the package list.
 */
std::expected<std::filesystem::path, MetadataError> find_dependency_dir(const DependencyGraph &graph,
                                                                        std::string_view name);

/**
 * @brief Queries the package manager and resolves the directory of dependency @p name.
 *
 * Must be called from the project root; the query fails otherwise.
 */
std::expected<std::filesystem::path, MetadataError>
resolve_dependency_path(ProcessRunner &runner, const OrchestratorConfig &config, std::string_view name);

} // namespace bootpack
