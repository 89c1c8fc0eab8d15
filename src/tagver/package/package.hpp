#pragma once

#include "./config.hpp"

#include <tagver/git/commit.hpp>
#include <tagver/git/conventional.hpp>
#include <tagver/util/fs.hpp>

#include <semver/version.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tagver {

/**
 * @brief The most recent release of a package
 */
struct release {
    /// The released version. "0.0.0" if the package was never released.
    std::string version;
    /// The tag that marks the release. Absent if the package was never released.
    std::optional<git::tag> tag = std::nullopt;
};

/**
 * @brief A pending change in version since the most recent release
 */
struct update {
    /// The kind of version bump. Absent for a forced update that changes no version component.
    std::optional<semver::bump> type;
    std::string                 version;
    /// The qualifying commits since the release, newest first
    std::vector<git::conventional_commit> changelog;
};

/// The package declares no version, and nothing was resolved
struct unversioned {};

/// The package declares a version, but is not within a git repository
struct untracked {};

/// The package has a release, and no qualifying changes since
struct released {
    tagver::release release;
};

/// The declared version differs from the release, and is taken as the next version
struct forced_update {
    tagver::release release;
    tagver::update  update;
};

/// The next version is derived from the qualifying commits since the release
struct calculated_update {
    tagver::release release;
    tagver::update  update;
};

using resolution_state
    = std::variant<unversioned, untracked, released, forced_update, calculated_update>;

/**
 * @brief A package directory and the version information resolved for it
 */
class package {
    fs::path         _dir;
    std::string      _module;
    tagver::config   _config;
    resolution_state _state;

public:
    package(fs::path dir, std::string module, tagver::config cfg, resolution_state state)
        : _dir(std::move(dir))
        , _module(std::move(module))
        , _config(std::move(cfg))
        , _state(std::move(state)) {}

    path_ref directory() const noexcept { return _dir; }

    /// The short name of the package, used as the prefix of release tags and as a commit scope
    const std::string& module() const noexcept { return _module; }

    const tagver::config&   config() const noexcept { return _config; }
    const resolution_state& state() const noexcept { return _state; }

    /// The release, if one was resolved
    const tagver::release* release() const noexcept;
    /// The pending update, if any
    const tagver::update* update() const noexcept;

    /**
     * @brief The effective version of the package: The version of the update, if present,
     * otherwise the released version, otherwise the declared version.
     */
    std::optional<std::string> version() const;
};

/**
 * @brief Obtain the module name of a package from its config and directory
 */
std::string module_name(path_ref directory, const config& cfg);

/**
 * @brief Resolve the release and update of the package in the given directory.
 *
 * A package outside of any git repository resolves to `untracked`.
 *
 * @throws version_error if a release tag or the declared version is invalid, or if the declared
 * version is older than the release.
 * @throws git::git_error for failures of git other than the directory not being a repository.
 */
package resolve_package(path_ref directory, const config& cfg);

/**
 * @brief Load the config of the package in the given directory, and resolve the package.
 */
package resolve_package(path_ref directory);

}  // namespace tagver
