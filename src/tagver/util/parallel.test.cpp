#include <tagver/util/parallel.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>

TEST_CASE("Map in parallel, keeping order") {
    std::vector<int> items = {1, 2, 3, 4, 5, 6, 7, 8};
    auto results = tagver::parallel_map(items, 3, [](int i) { return i * 10; });
    REQUIRE(results.size() == items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        CHECK(results[i].okay());
        CHECK(results[i].value == items[i] * 10);
    }
}

TEST_CASE("A failing item does not abort the others") {
    std::vector<int> items = {1, 2, 3, 4};
    auto             results = tagver::parallel_map(items, 0, [](int i) {
        if (i == 2) {
            throw std::runtime_error("Item two failed");
        }
        return i;
    });
    REQUIRE(results.size() == 4);
    CHECK(results[0].value == 1);
    CHECK_FALSE(results[1].okay());
    CHECK_FALSE(results[1].value);
    CHECK_THROWS_WITH(std::rethrow_exception(results[1].error), "Item two failed");
    CHECK(results[2].value == 3);
    CHECK(results[3].value == 4);
}

TEST_CASE("Map over nothing") {
    std::vector<int> items;
    auto             results = tagver::parallel_map(items, 4, [](int i) { return i; });
    CHECK(results.empty());
}
