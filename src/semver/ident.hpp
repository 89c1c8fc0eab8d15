#pragma once

#include <semver/order.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace semver {

class invalid_ident : public std::runtime_error {
    std::string _str;

public:
    explicit invalid_ident(std::string s)
        : std::runtime_error::runtime_error("Invalid version identifier: '" + s + "'")
        , _str(std::move(s)) {}

    auto& string() const noexcept { return _str; }
};

enum class ident_kind {
    // Contains at least one letter or hyphen
    alphanumeric,
    // Only digits, without a leading zero
    numeric,
    // Only digits, with a leading zero. Only valid in build metadata
    digits,
};

class ident;
order compare(const ident& lhs, const ident& rhs) noexcept;

/**
 * @brief A single dot-separated identifier of a prerelease or build-metadata tag.
 */
class ident {
    std::string _str;
    ident_kind  _kind = ident_kind::alphanumeric;

public:
    explicit ident(std::string_view str);
    explicit ident(std::uint64_t n)
        : _str(std::to_string(n))
        , _kind(ident_kind::numeric) {}

    auto        kind() const noexcept { return _kind; }
    const auto& string() const noexcept { return _str; }

    /// The value of a numeric identifier. Only valid if kind() is `numeric`
    std::uint64_t numeric_value() const noexcept;

    friend bool operator==(const ident& lhs, const ident& rhs) noexcept {
        return compare(lhs, rhs) == order::equivalent;
    }
    friend bool operator<(const ident& lhs, const ident& rhs) noexcept {
        return compare(lhs, rhs) == order::less;
    }

    static std::vector<ident> parse_dotted_seq(std::string_view s);
};

std::string join_idents(const std::vector<ident>& ids);

}  // namespace semver
