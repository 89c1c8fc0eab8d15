#pragma once

#include "./error.hpp"

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

#include <algorithm>
#include <string>
#include <string_view>

namespace debate {

/**
 * @brief Obtain the command-line spelling of an enumerator: Underscores become hyphens, and
 * trailing underscores are dropped.
 */
inline std::string enum_spelling(std::string_view ident) {
    std::string ret{ident};
    std::ranges::replace(ret, '_', '-');
    while (!ret.empty() && ret.back() == '-') {
        ret.pop_back();
    }
    return ret;
}

template <typename E>
class enum_putter {
    E* _dest;

public:
    constexpr explicit enum_putter(E& e) noexcept
        : _dest(&e) {}

    void operator()(std::string_view given, std::string_view spelling) const {
        for (auto [value, name] : magic_enum::enum_entries<E>()) {
            if (enum_spelling(name) == given) {
                *_dest = value;
                return;
            }
        }
        BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Invalid value given for an enum argument"),
                                   e_invalid_arg_value{std::string(given)},
                                   e_arg_spelling{std::string(spelling)});
    }
};

}  // namespace debate
