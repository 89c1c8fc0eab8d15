#include "./version.hpp"

#include <fmt/format.h>

#include <charconv>
#include <tuple>

using namespace semver;

namespace {

/// Parse one numeric component, requiring that no leading zeros be present
int parse_component(std::string_view full, std::string_view& remaining) {
    const auto offset = full.size() - remaining.size();
    int        n      = 0;
    auto       res    = std::from_chars(remaining.data(), remaining.data() + remaining.size(), n);
    const auto nread  = static_cast<std::size_t>(res.ptr - remaining.data());
    if (res.ec != std::errc{} || n < 0 || nread == 0 || (nread > 1 && remaining[0] == '0')) {
        throw invalid_version(std::string(full), static_cast<std::ptrdiff_t>(offset));
    }
    remaining.remove_prefix(nread);
    return n;
}

void expect_dot(std::string_view full, std::string_view& remaining) {
    if (remaining.empty() || remaining.front() != '.') {
        throw invalid_version(std::string(full),
                              static_cast<std::ptrdiff_t>(full.size() - remaining.size()));
    }
    remaining.remove_prefix(1);
}

}  // namespace

version version::parse(std::string_view s) {
    version ret;
    auto    remaining = s;

    ret.major = parse_component(s, remaining);
    expect_dot(s, remaining);
    ret.minor = parse_component(s, remaining);
    expect_dot(s, remaining);
    ret.patch = parse_component(s, remaining);

    if (!remaining.empty() && remaining.front() == '-') {
        auto plus_pos  = remaining.find('+');
        auto pre_str   = remaining.substr(1, plus_pos == remaining.npos ? plus_pos : plus_pos - 1);
        ret.prerelease = prerelease::parse(pre_str);
        remaining.remove_prefix(pre_str.size() + 1);
    }

    if (!remaining.empty() && remaining.front() == '+') {
        ret.build_metadata = build_metadata::parse(remaining.substr(1));
        remaining          = {};
    }

    if (!remaining.empty()) {
        throw invalid_version(std::string(s),
                              static_cast<std::ptrdiff_t>(s.size() - remaining.size()));
    }
    return ret;
}

std::optional<version> version::try_parse(std::string_view s) noexcept {
    try {
        return parse(s);
    } catch (const invalid_version&) {
        return std::nullopt;
    } catch (const invalid_ident&) {
        return std::nullopt;
    }
}

std::string version::to_string() const {
    auto ret = fmt::format("{}.{}.{}", major, minor, patch);
    if (!prerelease.empty()) {
        ret += "-" + prerelease.to_string();
    }
    if (!build_metadata.empty()) {
        ret += "+" + build_metadata.to_string();
    }
    return ret;
}

version version::incremented(bump b) const noexcept {
    version ret{.major = major, .minor = minor, .patch = patch};
    switch (b) {
    case bump::major:
        if (!(is_prerelease() && minor == 0 && patch == 0)) {
            ++ret.major;
        }
        ret.minor = 0;
        ret.patch = 0;
        break;
    case bump::minor:
        if (!(is_prerelease() && patch == 0)) {
            ++ret.minor;
        }
        ret.patch = 0;
        break;
    case bump::patch:
        if (!is_prerelease()) {
            ++ret.patch;
        }
        break;
    }
    return ret;
}

order semver::compare(const version& lhs, const version& rhs) noexcept {
    auto ord = order_of(std::tie(lhs.major, lhs.minor, lhs.patch),
                        std::tie(rhs.major, rhs.minor, rhs.patch));
    if (ord != order::equivalent) {
        return ord;
    }
    if (lhs.is_prerelease() != rhs.is_prerelease()) {
        // A prerelease has lower precedence than the associated normal version
        return lhs.is_prerelease() ? order::less : order::greater;
    }
    return compare(lhs.prerelease, rhs.prerelease);
}
