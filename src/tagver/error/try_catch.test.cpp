#include "./try_catch.hpp"

#include <boost/leaf/exception.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>

namespace {

struct e_answer {
    int value;
};

}  // namespace

TEST_CASE("Try-catch") {
    auto r = tagver_leaf_try { return 2; }
    tagver_leaf_catch_all->int { return 0; };
    CHECK(r == 2);
}

TEST_CASE("Try-catch selects the matching handler") {
    auto r = tagver_leaf_try->int {
        BOOST_LEAF_THROW_EXCEPTION(std::runtime_error("nope"), e_answer{42});
    }
    tagver_leaf_catch(std::logic_error const&)->int { return 1; }
    tagver_leaf_catch(std::runtime_error const&, e_answer ans)->int { return ans.value; }
    tagver_leaf_catch_all->int { return 0; };
    CHECK(r == 42);
}
