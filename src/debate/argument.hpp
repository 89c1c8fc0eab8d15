#pragma once

#include "./enum.hpp"
#include "./error.hpp"

#include <boost/leaf/exception.hpp>

#include <charconv>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace debate {

/**
 * The signature of argument actions: The first parameter is the value given for the argument (empty
 * for switches), and the second is the spelling used to name the argument.
 */
using argument_action = std::function<void(std::string_view, std::string_view)>;

template <typename Int>
class integer_putter {
    Int* _dest;

public:
    explicit integer_putter(Int& d) noexcept
        : _dest(&d) {}

    void operator()(std::string_view value, std::string_view spelling) const {
        Int  tmp{};
        auto res = std::from_chars(value.data(), value.data() + value.size(), tmp);
        if (res.ec != std::errc{} || res.ptr != value.data() + value.size()) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Invalid value given for an integer "
                                                         "argument"),
                                       e_arg_spelling{std::string(spelling)},
                                       e_invalid_arg_value{std::string(value)});
        }
        *_dest = tmp;
    }
};

/// Create an action that converts the argument value and assigns it to `dest`
template <typename T>
auto put_into(T& dest) {
    if constexpr (std::is_enum_v<T>) {
        return enum_putter<T>(dest);
    } else if constexpr (std::is_integral_v<T>) {
        return integer_putter<T>(dest);
    } else {
        return [&dest](std::string_view value, std::string_view) { dest = T(value); };
    }
}

/// Create an action that appends each value of the argument to a container
template <typename Container>
auto push_back_onto(Container& dest) {
    return [&dest](std::string_view value, std::string_view) { dest.emplace_back(value); };
}

template <typename T, typename V>
auto store_value(T& dest, V value) {
    return [&dest, value](std::string_view, std::string_view) { dest = value; };
}

template <typename T>
auto store_true(T& dest) {
    return store_value(dest, true);
}

template <typename T>
auto store_false(T& dest) {
    return store_value(dest, false);
}

/**
 * @brief A single command-line argument. An argument without any spellings is positional.
 */
struct argument {
    /// Spellings that follow a double hyphen, e.g. "jobs" for `--jobs`
    std::vector<std::string> long_spellings{};
    /// Spellings that follow a single hyphen, e.g. "j" for `-j`
    std::vector<std::string> short_spellings{};

    std::string help{};
    std::string valname{};

    bool required = false;
    /// The number of values that follow the argument. Zero for switches.
    int  nargs      = 1;
    bool can_repeat = false;

    argument_action action;

    bool is_positional() const noexcept {
        return long_spellings.empty() && short_spellings.empty();
    }

    /// The spelling used to refer to this argument in messages
    std::string preferred_spelling() const noexcept;
    /// The syntax of this argument as it appears in a usage string
    std::string syntax_string() const noexcept;
    /// The description of this argument as it appears in a help message
    std::string help_string() const noexcept;

    std::string_view match_long(std::string_view given) const noexcept;
    std::string_view match_short(std::string_view given) const noexcept;
};

}  // namespace debate
