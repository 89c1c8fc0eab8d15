#pragma once

#include <tagver/util/fs.hpp>

#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}  // namespace YAML

namespace tagver {

/**
 * @brief The content of a package manifest
 */
struct config {
    /// The package name. The last path component of the name is the package's module name.
    std::optional<std::string> name;
    /// The version declared for the package, if the package is versioned
    std::optional<std::string> version;
    /// Directories of child packages, relative to the package directory
    std::vector<std::string> workspace;

    /**
     * @brief Load a config from parsed manifest data. Keys that are not recognized are ignored.
     *
     * @throws config_error if the data is not a mapping or a key has the wrong type.
     */
    static config from_yaml(const YAML::Node&);

    bool operator==(const config&) const = default;
};

/**
 * @brief Find the manifest file of the package in the given directory.
 *
 * `pkg.yaml` is preferred, followed by `pkg.json`. Returns nullopt if there is no manifest.
 */
std::optional<fs::path> find_manifest(path_ref directory);

/**
 * @brief Load the manifest of the package in the given directory.
 *
 * @throws config_error if the manifest is absent or invalid.
 */
config load_config(path_ref directory);

}  // namespace tagver
