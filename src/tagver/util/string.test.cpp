#include <tagver/util/string.hpp>

#include <catch2/catch.hpp>

using namespace tagver;

TEST_CASE("Trimming") {
    CHECK(trim("  foo \n") == "foo");
    CHECK(trim("") == "");
    CHECK(trim("   ") == "");
    CHECK(trim_left("  foo ") == "foo ");
    CHECK(trim_right("  foo \n\n") == "  foo");
}

TEST_CASE("Splitting") {
    CHECK(split("a,b,,c", ",") == std::vector<std::string>{"a", "b", "", "c"});
    CHECK(split("abc", "<h>") == std::vector<std::string>{"abc"});
    CHECK(split_lines("one\ntwo\n") == std::vector<std::string>{"one", "two", ""});
}

TEST_CASE("Misc string utilities") {
    CHECK(to_lower("FEAT") == "feat");
    CHECK(replace("a-b-c", "-", "+") == "a+b+c");
    CHECK(joinstr(" ", std::vector<std::string>{"git", "log"}) == "git log");
    CHECK(contains("fatal: not a git repository", "not a git repository"));
}
