#include "./prerelease.hpp"

#include <algorithm>

using namespace semver;

void prerelease::add_ident(ident id) {
    if (id.kind() == ident_kind::digits) {
        throw invalid_ident(id.string());
    }
    _ids.push_back(std::move(id));
}

prerelease prerelease::parse(std::string_view s) {
    prerelease ret;
    for (auto& id : ident::parse_dotted_seq(s)) {
        if (id.kind() == ident_kind::digits) {
            throw invalid_ident("Prerelease tags may not have leading-zero identifiers: "
                                + std::string(s));
        }
        ret._ids.push_back(std::move(id));
    }
    return ret;
}

order semver::compare(const prerelease& lhs, const prerelease& rhs) noexcept {
    auto&       l = lhs.idents();
    auto&       r = rhs.idents();
    std::size_t n = std::min(l.size(), r.size());
    for (std::size_t i = 0; i < n; ++i) {
        auto ord = compare(l[i], r[i]);
        if (ord != order::equivalent) {
            return ord;
        }
    }
    // A longer set of identifiers has higher precedence when all preceding are equal
    return order_of(l.size(), r.size());
}
