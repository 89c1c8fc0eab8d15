#include <tagver/cli/error_handler.hpp>
#include <tagver/cli/options.hpp>
#include <tagver/cli/resolve.hpp>
#include <tagver/error/try_catch.hpp>
#include <tagver/util/log.hpp>

#include <debate/argument_parser.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

int main_fn(std::string_view program_name, const std::vector<std::string>& argv) {
    tagver::log::init_logger();

    tagver::cli::options    opts;
    debate::argument_parser parser{
        "Resolve the next semantic version of packages from their release tags and the "
        "Conventional Commits made since."};
    opts.setup_parser(parser);

    auto result = tagver_leaf_try->std::optional<int> {
        parser.parse_argv(argv);
        return std::nullopt;
    }
    tagver_leaf_catch(debate::help_request) {
        std::cout << parser.help_string(program_name);
        return 0;
    }
    tagver_leaf_catch(debate::unrecognized_argument, debate::e_arg_spelling arg) {
        fmt::print(std::cerr,
                   "{}\nUnrecognized argument: \"{}\"\n",
                   parser.usage_string(program_name),
                   arg.value);
        return 2;
    }
    tagver_leaf_catch(debate::invalid_repetition, debate::e_arg_spelling spell) {
        fmt::print(std::cerr,
                   "{}\nArgument '{}' cannot be provided more than once\n",
                   parser.usage_string(program_name),
                   spell.value);
        return 2;
    }
    tagver_leaf_catch(debate::invalid_arguments,
                      debate::e_arg_spelling      spell,
                      debate::e_invalid_arg_value val) {
        fmt::print(std::cerr,
                   "{}\nInvalid value '{}' given for '{}'\n",
                   parser.usage_string(program_name),
                   val.value,
                   spell.value);
        return 2;
    }
    tagver_leaf_catch(debate::invalid_arguments,
                      debate::e_arg_spelling  spell,
                      debate::e_argument      arg,
                      debate::e_wrong_val_num given) {
        if (arg.value.nargs == 0) {
            fmt::print(std::cerr,
                       "{}\nArgument '{}' does not expect any values, but was given one\n",
                       parser.usage_string(program_name),
                       spell.value);
        } else {
            fmt::print(std::cerr,
                       "{}\nArgument '{}' expects {} value(s), but got {}\n",
                       parser.usage_string(program_name),
                       spell.value,
                       arg.value.nargs,
                       given.value);
        }
        return 2;
    }
    tagver_leaf_catch(debate::missing_required, debate::e_argument arg) {
        fmt::print(std::cerr,
                   "{}\nMissing required argument '{}'\n",
                   parser.usage_string(program_name),
                   arg.value.preferred_spelling());
        return 2;
    }
    tagver_leaf_catch(const debate::invalid_arguments& err) {
        fmt::print(std::cerr, "{}\nError: {}\n", parser.usage_string(program_name), err.what());
        return 2;
    };

    if (result) {
        // Argument parsing produced an exit code. Return it immediately.
        return *result;
    }
    tagver::log::current_log_level = opts.log_level;
    return tagver::handle_cli_errors([&] { return tagver::cli::resolve(opts); });
}

int main(int argc, char** argv) { return main_fn(argv[0], {argv + 1, argv + argc}); }
