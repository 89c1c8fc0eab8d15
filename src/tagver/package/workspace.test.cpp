#include "./workspace.hpp"

#include "./error.hpp"

#include <tagver/git/testing.hpp>

#include <catch2/catch.hpp>

#include <algorithm>

using namespace tagver;
using tagver::git::testing::scratch_repository;

namespace {

std::vector<std::string> relative_dirs(const std::vector<workspace_member>& members,
                                       path_ref                             root) {
    std::vector<std::string> ret;
    for (auto& m : members) {
        ret.push_back(m.directory.lexically_relative(normalize_path(root)).generic_string());
    }
    return ret;
}

}  // namespace

TEST_CASE("Expand a workspace") {
    auto scratch = scratch_repository::create();
    scratch.write_file("pkg.yaml", "name: root\nworkspace: [libs/a, libs/b, libs/a/]\n");
    scratch.write_file("libs/a/pkg.yaml", "name: a\nversion: 1.0.0\nworkspace: [nested, ../b]\n");
    scratch.write_file("libs/a/nested/pkg.json", R"({"name": "nested"})");
    scratch.write_file("libs/b/pkg.yaml", "name: b\nversion: 0.1.0\n");

    auto members = expand_workspace({scratch.path()});
    CHECK(relative_dirs(members, scratch.path())
          == std::vector<std::string>{".", "libs/a", "libs/b", "libs/a/nested"});
    CHECK(std::all_of(members.begin(), members.end(), [](auto& m) { return !m.error; }));
    CHECK(members[3].config->name == "nested");

    SECTION("Listing a member directly does not duplicate it") {
        auto again = expand_workspace({scratch.path() / "libs/b", scratch.path()});
        CHECK(relative_dirs(again, scratch.path())
              == std::vector<std::string>{"libs/b", ".", "libs/a", "libs/a/nested"});
    }
}

TEST_CASE("Resolve a workspace") {
    auto scratch = scratch_repository::create();
    scratch.write_file("pkg.yaml", "name: root\nworkspace: [a, b, missing]\n");
    scratch.write_file("a/pkg.yaml", "name: a\nversion: 1.0.0\n");
    scratch.write_file("b/pkg.yaml", "name: b\nversion: 1.0.0\n");
    scratch.commit("chore: initial", "a/file.txt");
    scratch.tag("a@1.0.0");
    scratch.tag("b@2.0.0");
    scratch.commit("feat(a): a feature", "a/file.txt");

    auto jobs    = GENERATE(1, 4);
    auto results = resolve_workspace({scratch.path()}, jobs);
    REQUIRE(results.size() == 4);

    auto& root = results[0];
    REQUIRE(root.okay());
    CHECK(root.package->module() == "root");
    CHECK(std::holds_alternative<unversioned>(root.package->state()));

    auto& a = results[1];
    REQUIRE(a.okay());
    CHECK(a.package->module() == "a");
    REQUIRE(a.package->update());
    CHECK(a.package->update()->type == semver::bump::minor);

    // The declared version of 'b' is older than its release
    auto& b = results[2];
    CHECK_FALSE(b.okay());
    CHECK_FALSE(b.package.has_value());
    CHECK_THROWS_AS(std::rethrow_exception(b.error), version_error);

    auto& missing = results[3];
    CHECK(missing.directory == normalize_path(scratch.path() / "missing"));
    CHECK_FALSE(missing.okay());
    CHECK_THROWS_AS(std::rethrow_exception(missing.error), config_error);
}
