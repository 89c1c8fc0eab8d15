#pragma once

#include "./config.hpp"
#include "./package.hpp"

#include <tagver/util/fs.hpp>

#include <exception>
#include <optional>
#include <vector>

namespace tagver {

/**
 * @brief The outcome of resolving one package of a workspace: either the package, or the
 * exception that prevented its resolution.
 */
struct package_result {
    fs::path                       directory;
    std::optional<tagver::package> package;
    std::exception_ptr             error;

    bool okay() const noexcept { return error == nullptr; }
};

/**
 * @brief A package directory found while expanding a workspace, with its loaded config or the
 * error that occurred while loading it.
 */
struct workspace_member {
    fs::path                      directory;
    std::optional<tagver::config> config;
    std::exception_ptr            error;
};

/**
 * @brief Expand the given package directories with the `workspace` children of their configs,
 * breadth-first.
 *
 * Directories are normalized, and each directory appears once, at its first occurrence. A member
 * whose config fails to load has no children.
 */
std::vector<workspace_member> expand_workspace(const std::vector<fs::path>& directories);

/**
 * @brief Resolve every package of the workspaces rooted at the given directories using up to
 * `jobs` threads.
 *
 * Results are in the order of `expand_workspace`. The failure of one package does not affect the
 * resolution of others.
 */
std::vector<package_result> resolve_workspace(const std::vector<fs::path>& directories, int jobs);

}  // namespace tagver
