#include "./conventional.hpp"

#include "./testing.hpp"

#include <tagver/util/string.hpp>

#include <catch2/catch.hpp>

using namespace tagver::git;
using tagver::git::testing::make_commit;

using strings = std::vector<std::string>;

TEST_CASE("Parse conventional summaries") {
    struct case_ {
        std::string                summary;
        std::optional<std::string> type;
        strings                    scopes;
        std::string                description;
        bool                       breaking = false;
    };

    auto [summary, type, scopes, description, breaking] = GENERATE(Catch::Generators::values<case_>({
        {"feat(scope): description", "feat", {"scope"}, "description"},
        {"description", std::nullopt, {}, "description"},
        {"feat: description", "feat", {}, "description"},
        {"feat(): description", "feat", {}, "description"},
        {"feat(,): description", "feat", {}, "description"},
        {"feat(scope1,scope2): description", "feat", {"scope1", "scope2"}, "description"},
        {"FEAT(SCOPE): description", "feat", {"scope"}, "description"},
        {"feat:description", "feat", {}, "description"},
        {" feat(  scoPE1, SCOPe2  ):  description ", "feat", {"scope1", "scope2"}, "description "},
        {"feat(`scope`): description", "feat", {"`scope`"}, "description"},
        {"feat!: description", "feat", {}, "description", true},
        {"feat(scope)!: description", "feat", {"scope"}, "description", true},
        {"fix: Keep the: colons", "fix", {}, "Keep the: colons"},
        {"Merge branch 'main' into topic", std::nullopt, {}, "Merge branch 'main' into topic"},
    }));

    INFO("Parsing summary: " << summary);
    auto cc = conventional(make_commit(summary));
    CHECK(cc.type == type);
    CHECK(cc.scopes == scopes);
    CHECK(cc.description == description);
    CHECK(cc.breaking.has_value() == breaking);
    if (breaking) {
        CHECK(cc.breaking == description);
    }
}

TEST_CASE("A summary without a description is taken verbatim") {
    auto cc = conventional(make_commit("feat(scope): "));
    CHECK(cc.description == "feat(scope): ");
    CHECK_FALSE(cc.type.has_value());
    CHECK(cc.scopes.empty());
    CHECK_FALSE(cc.breaking.has_value());
}

TEST_CASE("Classification never fails") {
    auto summary = GENERATE(as<std::string>{},
                            "",
                            "   ",
                            ":",
                            "!:",
                            "()",
                            "feat(",
                            "feat(a)(b): c",
                            "feat!!: x",
                            "\t\t",
                            "(scope): nope",
                            "feat(scope)!:");
    INFO("Parsing summary: [" << summary << "]");
    auto cc = conventional(make_commit(summary));
    CHECK(cc.description == std::string(tagver::trim_left(summary)));
    CHECK_FALSE(cc.type.has_value());
    CHECK(cc.scopes.empty());
}

TEST_CASE("Breaking changes from trailers") {
    trailer_map trailers;
    trailers.set("BREAKING-CHANGE", "breaking");
    auto cc = conventional(make_commit("feat: description", std::nullopt, trailers));
    CHECK(cc.breaking == "breaking");
    REQUIRE(cc.footers.find("BREAKING-CHANGE"));
    CHECK(*cc.footers.find("BREAKING-CHANGE") == "breaking");
}

TEST_CASE("Breaking changes from body footers") {
    auto body = GENERATE(as<std::string>{},
                         "BREAKING-CHANGE: breaking",
                         "BREAKING CHANGE: breaking",
                         "Some explanation.\n\nBREAKING CHANGE: breaking\n");
    auto cc = conventional(make_commit("feat: description", body));
    CHECK(cc.breaking == "breaking");
    CHECK(cc.footers.size() == 1);
    REQUIRE(cc.footers.find("BREAKING-CHANGE"));
    CHECK(*cc.footers.find("BREAKING-CHANGE") == "breaking");
}

TEST_CASE("A breaking footer takes precedence over the summary") {
    auto cc = conventional(make_commit("feat!: description", "BREAKING CHANGE: the details"));
    CHECK(cc.breaking == "the details");
}

TEST_CASE("Parse footers from the final paragraph") {
    auto cc = conventional(make_commit("feat(scope): description",
                                       "Detailed commit explanation.\n\nFixes #123\nCloses #456"));
    CHECK_FALSE(cc.breaking);
    CHECK(cc.footers.size() == 2);
    REQUIRE(cc.footers.find("fixes"));
    CHECK(*cc.footers.find("fixes") == "123");
    REQUIRE(cc.footers.find("closes"));
    CHECK(*cc.footers.find("closes") == "456");
    // Order is preserved
    CHECK(cc.footers.begin()->first == "fixes");
}

TEST_CASE("A final paragraph of prose is not a footer block") {
    auto cc = conventional(
        make_commit("fix: description", "Reviewed-by: someone\n\nThis is not: a footer\nnope"));
    CHECK(cc.footers.empty());
    CHECK_FALSE(cc.breaking);
}

TEST_CASE("Footers are merged over trailers") {
    trailer_map trailers;
    trailers.set("Signed-off-by", "author-name <author-email>");
    trailers.set("Refs", "old");
    auto cc = conventional(make_commit("feat(scope): description", "Refs: new", trailers));
    CHECK(cc.footers.size() == 2);
    CHECK(*cc.footers.find("Signed-off-by") == "author-name <author-email>");
    CHECK(*cc.footers.find("Refs") == "new");
}

TEST_CASE("Classification is deterministic") {
    auto commit = make_commit("feat(a, b)!: thing", "Body text\n\nFixes #1");
    CHECK(conventional(commit) == conventional(commit));
}

TEST_CASE("Scope queries") {
    auto cc = conventional(make_commit("fix(core,cli): bug"));
    CHECK(cc.has_scope("core"));
    CHECK(cc.has_scope("cli"));
    CHECK_FALSE(cc.has_scope("*"));
}
