#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace debate {

struct argument;
class argument_parser;

/// Thrown when `--help` or `-h` is given
struct help_request : std::exception {};

struct invalid_arguments : std::runtime_error {
    using runtime_error::runtime_error;
};

struct unrecognized_argument : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct missing_required : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct invalid_repetition : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// The argument being parsed when an error occurred
struct e_argument {
    const debate::argument& value;
};

/// The parser that was running when an error occurred
struct e_argument_parser {
    const debate::argument_parser& value;
};

struct e_invalid_arg_value {
    std::string value;
};

/// The number of values given to an argument that expected a different number
struct e_wrong_val_num {
    int value;
};

/// The command-line string that named the argument, e.g. `--jobs` or `-j`
struct e_arg_spelling {
    std::string value;
};

}  // namespace debate
