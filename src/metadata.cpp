#include "bootpack/metadata.hpp"

#include <expected>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace bootpack {

namespace {

using json = nlohmann::json;

DependencyGraph::Node parse_node(const json &node) {
    DependencyGraph::Node parsed;
    parsed.id = node.at("id").get<std::string>();

    const json &deps = node.at("deps");
    parsed.deps.reserve(deps.size());
    for (const auto &dep : deps) {
        parsed.deps.push_back({.name = dep.at("name").get<std::string>(), .pkg_id = dep.at("pkg").get<std::string>()});
    }
    return parsed;
}

} // namespace

std::expected<DependencyGraph, MetadataError> parse_metadata(std::string_view text) {
    DependencyGraph graph;
    try {
        json metadata = json::parse(text.begin(), text.end());

        // `resolve` is null when the metadata was requested without dependencies.
        const json &resolve = metadata.at("resolve");
        if (resolve.is_null()) {
            return std::unexpected(MetadataError{MetadataError::Kind::MalformedMetadata,
                                                 "Package metadata contains no dependency resolution"});
        }

        // A virtual workspace has no root package.
        if (const json &root = resolve.at("root"); !root.is_null()) {
            graph.root_package_id = root.get<std::string>();
        }

        const json &nodes = resolve.at("nodes");
        graph.nodes.reserve(nodes.size());
        for (const auto &node : nodes) {
            graph.nodes.push_back(parse_node(node));
        }

        const json &packages = metadata.at("packages");
        graph.packages.reserve(packages.size());
        for (const auto &package : packages) {
            graph.packages.push_back({.id = package.at("id").get<std::string>(),
                                      .manifest_path = package.at("manifest_path").get<std::string>()});
        }
    } catch (const json::exception &err) {
        return std::unexpected(
            MetadataError{MetadataError::Kind::MalformedMetadata, std::format("Invalid package metadata: {}", err.what())});
    }
    return graph;
}

std::expected<std::filesystem::path, MetadataError> find_dependency_dir(const DependencyGraph &graph,
                                                                        std::string_view name) {
    const std::string *dep_id = nullptr;
    for (const auto &node : graph.nodes) {
        if (!graph.root_package_id || node.id != *graph.root_package_id)
            continue;
        for (const auto &dep : node.deps) {
            if (dep.name == name) {
                dep_id = &dep.pkg_id;
                break;
            }
        }
        break;
    }

    if (!dep_id) {
        return std::unexpected(
            MetadataError{MetadataError::Kind::DependencyNotFound, std::format("No dependency '{}' found", name)});
    }

    for (const auto &package : graph.packages) {
        if (package.id == *dep_id) {
            return std::filesystem::path(package.manifest_path).parent_path();
        }
    }

    throw std::logic_error(std::format("Package metadata references '{}' but does not list it", *dep_id));
}

std::expected<std::filesystem::path, MetadataError>
resolve_dependency_path(ProcessRunner &runner, const OrchestratorConfig &config, std::string_view name) {
    auto res = runner.capture({.args = {config.cargo, "metadata"}});
    if (!res) {
        return std::unexpected(MetadataError{MetadataError::Kind::QueryFailed, res.error()});
    }
    if (res->status != 0) {
        // stderr was not captured, the package manager has already explained itself.
        return std::unexpected(MetadataError{MetadataError::Kind::QueryFailed,
                                             std::format("'{} metadata' exited with code {}", config.cargo, res->status)});
    }

    auto graph = parse_metadata(res->out);
    if (!graph) {
        return std::unexpected(graph.error());
    }
    return find_dependency_dir(*graph, name);
}

} // namespace bootpack
