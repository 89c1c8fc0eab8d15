#pragma once

#include <semver/prerelease.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace semver {

class invalid_version : public std::runtime_error {
    std::string    _string;
    std::ptrdiff_t _offset = 0;

public:
    invalid_version(std::string string, std::ptrdiff_t n)
        : runtime_error("Invalid semantic version: '" + string + "'")
        , _string(std::move(string))
        , _offset(n) {}

    auto& string() const noexcept { return _string; }
    auto  offset() const noexcept { return _offset; }
};

/**
 * @brief The component of a version that is incremented by a release
 */
enum class bump {
    major,
    minor,
    patch,
};

struct version;
order compare(const version& lhs, const version& rhs) noexcept;

struct version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    // Prerelease tag is optional:
    class prerelease prerelease = {};
    // Build metadata is optional:
    class build_metadata build_metadata = {};

    /**
     * @brief Parse a version string. Throws `invalid_version` or `invalid_ident` on failure.
     */
    static version parse(std::string_view s);

    /**
     * @brief Parse a version string, returning nullopt if it is not a valid version.
     */
    static std::optional<version> try_parse(std::string_view s) noexcept;

    std::string to_string() const;
    bool        is_prerelease() const noexcept { return !prerelease.empty(); }

    /**
     * @brief Obtain the next version of the given bump kind.
     *
     * The prerelease and build metadata are dropped. A prerelease version is "completed" rather
     * than incremented if it is already a prerelease of the requested bump: `1.2.0-rc.1` bumped
     * by `minor` yields `1.2.0`, bumped by `patch` yields `1.2.0`, by `major` yields `2.0.0`.
     */
    version incremented(bump b) const noexcept;

    friend bool operator==(const version& lhs, const version& rhs) noexcept {
        return compare(lhs, rhs) == order::equivalent;
    }
    friend bool operator!=(const version& lhs, const version& rhs) noexcept {
        return !(lhs == rhs);
    }
    friend bool operator<(const version& lhs, const version& rhs) noexcept {
        return compare(lhs, rhs) == order::less;
    }
    friend bool operator>(const version& lhs, const version& rhs) noexcept { return rhs < lhs; }
    friend bool operator<=(const version& lhs, const version& rhs) noexcept {
        return !(rhs < lhs);
    }
    friend bool operator>=(const version& lhs, const version& rhs) noexcept {
        return !(lhs < rhs);
    }

    friend inline std::string to_string(const version& ver) { return ver.to_string(); }
};

}  // namespace semver
