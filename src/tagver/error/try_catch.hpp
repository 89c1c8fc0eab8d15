#pragma once

#include <boost/leaf.hpp>

#include <exception>
#include <tuple>
#include <type_traits>

namespace tagver {

/**
 * @brief Accumulates a try-block and its handlers until the sequence is executed by
 * leaf_exec_try_catch. See `tagver_leaf_try` below.
 */
template <typename Try, typename... Handlers>
struct leaf_handler_seq {
    Try& try_block;

    std::tuple<Handlers&...> handlers{};

    template <typename Catch>
    constexpr auto operator*(Catch c) const noexcept {
        return leaf_handler_seq<Try, Handlers..., typename Catch::handler_type>{
            try_block, std::tuple_cat(handlers, std::tie(c.h))};
    }

    constexpr decltype(auto) invoke() const {
        static_assert(sizeof...(Handlers) != 0,
                      "tagver_leaf_try requires one or more tagver_leaf_catch blocks");
        return std::apply([&](auto&... hs) { return boost::leaf::try_catch(try_block, hs...); },
                          handlers);
    }
};

struct leaf_make_try_block {
    template <typename Func>
    constexpr decltype(auto) operator->*(Func&& block) const {
        return leaf_handler_seq<Func>{block};
    }
};

template <typename H>
struct leaf_catch_block {
    using handler_type = H;

    handler_type& h;

    leaf_catch_block(H& h)
        : h(h) {}
};

struct leaf_make_catch_block {
    template <typename Func>
    constexpr decltype(auto) operator->*(Func&& block) const {
        return leaf_catch_block<std::remove_cvref_t<Func>>{block};
    }
};

struct leaf_exec_try_catch {
    template <typename Try, typename... Handlers>
    constexpr decltype(auto) operator+(const leaf_handler_seq<Try, Handlers...> seq) const {
        return seq.invoke();
    }
};

}  // namespace tagver

/**
 * @brief Create a try {} block whose errors are handled by Boost.LEAF
 *
 * Follow it with one or more `tagver_leaf_catch` blocks. The value of the full expression is the
 * value of the try block, or of whichever handler was selected.
 */
#define tagver_leaf_try ::tagver::leaf_exec_try_catch{} + ::tagver::leaf_make_try_block{}->*[&]()

/**
 * @brief Create an error handling block for Boost.LEAF
 */
#define tagver_leaf_catch *::tagver::leaf_make_catch_block{}->*[&]

#define tagver_leaf_catch_all                                                                      \
    tagver_leaf_catch(::boost::leaf::verbose_diagnostic_info const& diagnostic_info                \
                      [[maybe_unused]])
