#pragma once

#include "./argument.hpp"

#include <list>
#include <string>
#include <string_view>
#include <vector>

namespace debate {

/**
 * @brief A flat command-line parser. Arguments are dispatched to the actions of the registered
 * `argument` objects in the order they are given.
 *
 * `--help` and `-h` raise `help_request`. A bare `--` ends option parsing, and all following
 * strings are given to positional arguments.
 */
class argument_parser {
    // A list, so that references to added arguments remain valid
    std::list<argument> _arguments;
    std::string         _description;

    void _parse(const std::vector<std::string_view>& argv) const;

public:
    argument_parser() = default;

    explicit argument_parser(std::string description)
        : _description(std::move(description)) {}

    argument& add_argument(argument arg) noexcept;

    const std::list<argument>& arguments() const noexcept { return _arguments; }

    std::string usage_string(std::string_view progname) const noexcept;
    std::string help_string(std::string_view progname) const noexcept;

    template <typename Range>
    void parse_argv(const Range& range) const {
        _parse(std::vector<std::string_view>(std::begin(range), std::end(range)));
    }

    void parse_argv(std::initializer_list<std::string_view> ilist) const {
        _parse(std::vector<std::string_view>(ilist));
    }
};

}  // namespace debate
