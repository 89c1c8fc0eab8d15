#pragma once

#include <semver/ident.hpp>
#include <semver/order.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace semver {

class prerelease;
order compare(const prerelease& lhs, const prerelease& rhs) noexcept;

/**
 * @brief The dotted prerelease tag of a version, as in the `pre.3` of `1.2.0-pre.3`.
 *
 * Prerelease tags participate in version precedence.
 */
class prerelease {
    std::vector<ident> _ids;

public:
    prerelease() = default;

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    void add_ident(ident id);
    void add_ident(std::string_view str) { add_ident(ident(str)); }

    auto&       idents() const noexcept { return _ids; }
    std::string to_string() const { return join_idents(_ids); }

    static prerelease parse(std::string_view str);

    friend bool operator==(const prerelease& lhs, const prerelease& rhs) noexcept {
        return compare(lhs, rhs) == order::equivalent;
    }
    friend bool operator<(const prerelease& lhs, const prerelease& rhs) noexcept {
        return compare(lhs, rhs) == order::less;
    }
};

/**
 * @brief The dotted build metadata of a version, as in the `a1b2c3d` of `1.2.0+a1b2c3d`.
 *
 * Build metadata never affects precedence.
 */
class build_metadata {
    std::vector<ident> _ids;

public:
    build_metadata() = default;

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    void add_ident(ident id) { _ids.push_back(std::move(id)); }
    void add_ident(std::string_view s) { add_ident(ident(s)); }

    auto&       idents() const noexcept { return _ids; }
    std::string to_string() const { return join_idents(_ids); }

    static build_metadata parse(std::string_view s) {
        build_metadata ret;
        ret._ids = ident::parse_dotted_seq(s);
        return ret;
    }
};

}  // namespace semver
