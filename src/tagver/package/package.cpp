#include "./package.hpp"

#include "./error.hpp"

#include <tagver/error/on_error.hpp>
#include <tagver/git/error.hpp>
#include <tagver/git/repository.hpp>
#include <tagver/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>
#include <magic_enum.hpp>
#include <neo/overload.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cstdint>

using namespace tagver;

namespace {

const std::string no_release_version = "0.0.0";

/**
 * Find the most recent release of the module. Tags at HEAD are preferred, then tags that do not
 * contain HEAD.
 */
tagver::release find_release(const git::repository& repo, const std::string& mod) {
    const auto prefix  = mod + "@";
    const auto pattern = prefix + "*";

    auto tags = repo.tag_list({.name = pattern, .sort_by_version = true, .points_at = "HEAD"});
    if (tags.empty()) {
        tags = repo.tag_list({.name = pattern, .sort_by_version = true, .no_contains = "HEAD"});
    }
    if (tags.empty()) {
        tagver_log(debug, "No release tags for '{}'", mod);
        return tagver::release{.version = no_release_version};
    }

    std::optional<semver::version> best_version;
    git::tag*                      best_tag = nullptr;
    for (auto& tag : tags) {
        TAGVER_E_SCOPE(e_tag_name{tag.name});
        auto ver_str = std::string_view(tag.name).substr(prefix.size());
        auto ver     = semver::version::try_parse(ver_str);
        if (!ver) {
            BOOST_LEAF_THROW_EXCEPTION(
                version_error(fmt::format("Cannot parse semantic version from tag: {}", tag.name)));
        }
        if (!best_version || *ver > *best_version) {
            best_version = std::move(ver);
            best_tag     = &tag;
        }
    }
    tagver_log(debug, "Most recent release of '{}' is tag [{}]", mod, best_tag->name);
    return tagver::release{
        .version = best_tag->name.substr(prefix.size()),
        .tag     = std::move(*best_tag),
    };
}

std::vector<git::conventional_commit> collect_changelog(const git::repository& repo,
                                                        const std::string&     mod,
                                                        const tagver::release& rel) {
    auto log = rel.tag ? repo.log({.from = rel.tag->commit.hash}) : repo.log({.paths = {"."}});
    return log                                        //
        | ranges::views::transform(&git::conventional)  //
        | ranges::views::filter([&](const git::conventional_commit& c) {
               return c.has_scope(mod) || c.has_scope("*");
           })
        | ranges::to_vector;
}

semver::version parse_declared(const std::string& declared) {
    auto ver = semver::version::try_parse(declared);
    if (!ver) {
        BOOST_LEAF_THROW_EXCEPTION(
            version_error(fmt::format("Declared version '{}' is not a valid semantic version",
                                      declared)));
    }
    return *ver;
}

/// The first of the major/minor/patch components that differs between the versions
std::optional<semver::bump> differing_component(const semver::version& a,
                                                const semver::version& b) noexcept {
    if (a.major != b.major) {
        return semver::bump::major;
    } else if (a.minor != b.minor) {
        return semver::bump::minor;
    } else if (a.patch != b.patch) {
        return semver::bump::patch;
    }
    return std::nullopt;
}

resolution_state resolve_update(const git::repository& repo,
                                const std::string&     mod,
                                const std::string&     declared,
                                tagver::release        rel) {
    TAGVER_E_SCOPE(e_release_version{rel.version});
    TAGVER_E_SCOPE(e_declared_version{declared});
    auto changelog       = collect_changelog(repo, mod, rel);
    auto release_version = semver::version::parse(rel.version);

    if (declared != rel.version) {
        auto declared_version = parse_declared(declared);
        if (declared_version < release_version) {
            BOOST_LEAF_THROW_EXCEPTION(
                version_error(fmt::format("Cannot force update to an older version: The declared "
                                          "version {} is older than the released version {}",
                                          declared,
                                          rel.version)));
        }
        auto upd = tagver::update{
            .type      = differing_component(declared_version, release_version),
            .version   = declared,
            .changelog = std::move(changelog),
        };
        return forced_update{std::move(rel), std::move(upd)};
    }

    if (changelog.empty()) {
        return released{std::move(rel)};
    }

    auto is_breaking = [](auto& c) { return c.breaking.has_value(); };
    auto is_feature  = [](auto& c) { return c.type == "feat"; };

    semver::bump type = semver::bump::patch;
    if (std::any_of(changelog.begin(), changelog.end(), is_breaking)
        && release_version.major > 0) {
        type = semver::bump::major;
    } else if (std::any_of(changelog.begin(), changelog.end(), is_feature)
               || std::any_of(changelog.begin(), changelog.end(), is_breaking)) {
        type = semver::bump::minor;
    }

    auto candidate = [&](const semver::version& base) {
        auto ret = base.incremented(type);
        ret.prerelease.add_ident(semver::ident("pre"));
        ret.prerelease.add_ident(semver::ident(static_cast<std::uint64_t>(changelog.size())));
        ret.build_metadata = semver::build_metadata::parse(changelog.front().commit.short_hash);
        return ret;
    };
    auto next = candidate(release_version);
    if (!(next > release_version)) {
        // Completing a prerelease release can sort below it (`1.2.3-pre.1` < `1.2.3-rc.1`), so
        // bump from the release's core version instead
        next = candidate(semver::version{.major = release_version.major,
                                         .minor = release_version.minor,
                                         .patch = release_version.patch});
    }

    tagver_log(debug,
               "Calculated a {} update of '{}' from {} qualifying commit(s)",
               magic_enum::enum_name(type),
               mod,
               changelog.size());
    auto upd = tagver::update{
        .type      = type,
        .version   = next.to_string(),
        .changelog = std::move(changelog),
    };
    return calculated_update{std::move(rel), std::move(upd)};
}

}  // namespace

const tagver::release* package::release() const noexcept {
    return std::visit(neo::overload{
                          [](const released& r) -> const tagver::release* { return &r.release; },
                          [](const forced_update& f) -> const tagver::release* {
                              return &f.release;
                          },
                          [](const calculated_update& c) -> const tagver::release* {
                              return &c.release;
                          },
                          [](const auto&) -> const tagver::release* { return nullptr; },
                      },
                      _state);
}

const tagver::update* package::update() const noexcept {
    return std::visit(neo::overload{
                          [](const forced_update& f) -> const tagver::update* { return &f.update; },
                          [](const calculated_update& c) -> const tagver::update* {
                              return &c.update;
                          },
                          [](const auto&) -> const tagver::update* { return nullptr; },
                      },
                      _state);
}

std::optional<std::string> package::version() const {
    if (auto upd = update()) {
        return upd->version;
    } else if (auto rel = release()) {
        return rel->version;
    }
    return _config.version;
}

std::string tagver::module_name(path_ref directory, const config& cfg) {
    if (cfg.name) {
        return fs::path(*cfg.name).filename().string();
    }
    return normalize_path(directory).filename().string();
}

package tagver::resolve_package(path_ref directory_, const config& cfg) {
    auto directory = normalize_path(directory_);
    TAGVER_E_SCOPE(e_package_directory{directory});
    auto mod = module_name(directory, cfg);

    if (!cfg.version) {
        tagver_log(debug, "Package '{}' in [{}] is unversioned", mod, directory.string());
        return package{directory, mod, cfg, unversioned{}};
    }

    git::repository repo{directory};
    try {
        auto rel   = find_release(repo, mod);
        auto state = resolve_update(repo, mod, *cfg.version, std::move(rel));
        return package{directory, mod, cfg, std::move(state)};
    } catch (const git::not_a_repository_error&) {
        tagver_log(debug,
                   "Package '{}' in [{}] is not within a git repository",
                   mod,
                   directory.string());
        return package{directory, mod, cfg, untracked{}};
    }
}

package tagver::resolve_package(path_ref directory) {
    return resolve_package(directory, load_config(directory));
}
