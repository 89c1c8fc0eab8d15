#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace tagver {

/**
 * @brief A package's versions violate the rules of versioning, e.g. a release tag that does not
 * name a valid version, or a declared version that is older than the released version.
 */
class version_error : public std::runtime_error {
    using runtime_error::runtime_error;
};

/**
 * @brief A package manifest is missing or invalid
 */
class config_error : public std::runtime_error {
    using runtime_error::runtime_error;
};

struct e_package_directory {
    std::filesystem::path value;
};

struct e_manifest_path {
    std::filesystem::path value;
};

/// The manifest key that failed to load
struct e_manifest_key {
    std::string value;
};

struct e_release_version {
    std::string value;
};

struct e_declared_version {
    std::string value;
};

struct e_tag_name {
    std::string value;
};

}  // namespace tagver
