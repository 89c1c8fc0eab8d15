#include "./resolve.hpp"

#include <tagver/git/conventional.hpp>
#include <tagver/git/testing.hpp>
#include <tagver/package/package.hpp>

#include <catch2/catch.hpp>

using namespace tagver;

namespace {

const config widgets_config{.name = "@acme/widgets", .version = "1.2.3"};

}  // namespace

TEST_CASE("Format resolved packages") {
    SECTION("Unversioned") {
        package pkg{"/w", "widgets", config{.name = "widgets"}, unversioned{}};
        CHECK(cli::format_package(pkg, true) == "widgets (unversioned)\n");
    }

    SECTION("Untracked") {
        package pkg{"/w", "widgets", widgets_config, untracked{}};
        CHECK(cli::format_package(pkg, true) == "widgets 1.2.3\n");
    }

    SECTION("Released") {
        package pkg{"/w", "widgets", widgets_config, released{release{.version = "1.2.3"}}};
        CHECK(cli::format_package(pkg, true) == "widgets 1.2.3\n");
    }

    auto fix  = git::conventional(git::testing::make_commit("fix(widgets): a fix"));
    auto feat = git::conventional(git::testing::make_commit("feat(widgets)!: a change"));

    SECTION("Calculated") {
        package pkg{"/w",
                    "widgets",
                    widgets_config,
                    calculated_update{
                        release{.version = "1.2.3"},
                        update{
                            .type      = semver::bump::major,
                            .version   = "2.0.0-pre.2+0123456",
                            .changelog = {feat, fix},
                        },
                    }};
        CHECK(cli::format_package(pkg, false) == "widgets 2.0.0-pre.2+0123456 (major)\n");
        CHECK(cli::format_package(pkg, true)
              == "widgets 2.0.0-pre.2+0123456 (major)\n"
                 "  0123456 feat(widgets)!: a change [breaking]\n"
                 "  0123456 fix(widgets): a fix\n");
    }

    SECTION("Forced") {
        package pkg{"/w",
                    "widgets",
                    widgets_config,
                    forced_update{
                        release{.version = "1.2.3"},
                        update{.type = std::nullopt, .version = "1.2.3+build", .changelog = {}},
                    }};
        CHECK(cli::format_package(pkg, true) == "widgets 1.2.3+build (forced)\n");
    }
}
