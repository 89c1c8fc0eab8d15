#include "./argument_parser.hpp"

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>
#include <fmt/core.h>

#include <set>

using namespace debate;

using strv = std::string_view;

namespace {

class parse_engine {
    const argument_parser&               _parser;
    const std::vector<std::string_view>& _argv;

    std::size_t               _pos              = 0;
    std::size_t               _positional_index = 0;
    bool                      _options_ended    = false;
    std::set<const argument*> _seen;

    bool _at_end() const noexcept { return _pos == _argv.size(); }
    strv _current() const noexcept { return _argv[_pos]; }

    void _see(const argument& arg) {
        if (!_seen.insert(&arg).second && !arg.can_repeat) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_repetition("Argument given more than once"));
        }
    }

    /// Give the next `nargs` command-line strings to the argument
    void _take_values(const argument& arg, strv spelling) {
        for (int i = 0; i < arg.nargs; ++i) {
            if (_at_end()) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected a value for argument"),
                                           e_wrong_val_num{i});
            }
            arg.action(_current(), spelling);
            ++_pos;
        }
    }

    void _parse_long(strv given) {
        auto tail = given.substr(2);
        if (tail == "help") {
            BOOST_LEAF_THROW_EXCEPTION(help_request());
        }
        for (const argument& cand : _parser.arguments()) {
            auto matched = cand.match_long(tail);
            if (matched.empty()) {
                continue;
            }
            auto spelling = fmt::format("--{}", matched);
            auto value    = tail.substr(matched.size());
            auto _        = boost::leaf::on_error(e_argument{cand}, e_arg_spelling{spelling});
            _see(cand);
            ++_pos;
            if (value.empty()) {
                // '--name' followed by zero or more values
                _take_values(cand, spelling);
                if (cand.nargs == 0) {
                    cand.action("", spelling);
                }
            } else if (cand.nargs != 1) {
                // '--name=value' only applies to arguments of exactly one value
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Wrong number of argument values"),
                                           e_wrong_val_num{1});
            } else {
                cand.action(value.substr(1), spelling);
            }
            return;
        }
        BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                   e_arg_spelling{std::string(given)});
    }

    void _parse_short(strv given) {
        auto group = given.substr(1);
        if (group == "h") {
            BOOST_LEAF_THROW_EXCEPTION(help_request());
        }
        ++_pos;
        // A group of switches, e.g. '-abc', possibly ending with an argument that takes a value
        while (!group.empty()) {
            const argument* found   = nullptr;
            strv            matched = {};
            for (const argument& cand : _parser.arguments()) {
                matched = cand.match_short(group);
                if (!matched.empty()) {
                    found = &cand;
                    break;
                }
            }
            if (!found) {
                BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                           e_arg_spelling{std::string(given)});
            }
            auto spelling = fmt::format("-{}", matched);
            auto _        = boost::leaf::on_error(e_argument{*found}, e_arg_spelling{spelling});
            _see(*found);
            group.remove_prefix(matched.size());
            if (found->nargs == 0) {
                found->action("", spelling);
            } else if (group.empty()) {
                // '-j 4'
                _take_values(*found, spelling);
            } else if (found->nargs == 1) {
                // '-j4'
                found->action(group, spelling);
                return;
            } else {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Wrong number of argument values"),
                                           e_wrong_val_num{1});
            }
        }
    }

    void _parse_positional(strv given) {
        std::size_t idx = 0;
        for (const argument& arg : _parser.arguments()) {
            if (!arg.is_positional()) {
                continue;
            }
            if (idx++ != _positional_index) {
                continue;
            }
            auto _ = boost::leaf::on_error(e_argument{arg},
                                           e_arg_spelling{arg.preferred_spelling()});
            _see(arg);
            arg.action(given, given);
            // A repeatable positional consumes all remaining positional strings
            if (!arg.can_repeat) {
                ++_positional_index;
            }
            ++_pos;
            return;
        }
        BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unexpected positional argument"),
                                   e_arg_spelling{std::string(given)});
    }

    void _parse_one() {
        auto given = _current();
        if (_options_ended || given.size() < 2 || given[0] != '-') {
            _parse_positional(given);
        } else if (given == "--") {
            _options_ended = true;
            ++_pos;
        } else if (given[1] == '-') {
            _parse_long(given);
        } else {
            _parse_short(given);
        }
    }

public:
    parse_engine(const argument_parser& p, const std::vector<std::string_view>& argv)
        : _parser(p)
        , _argv(argv) {}

    void run() {
        auto _ = boost::leaf::on_error(e_argument_parser{_parser});
        while (!_at_end()) {
            _parse_one();
        }
        for (const argument& arg : _parser.arguments()) {
            if (arg.required && !_seen.contains(&arg)) {
                BOOST_LEAF_THROW_EXCEPTION(missing_required("Required argument is missing"),
                                           e_argument{arg});
            }
        }
    }
};

}  // namespace

argument& argument_parser::add_argument(argument arg) noexcept {
    _arguments.push_back(std::move(arg));
    return _arguments.back();
}

void argument_parser::_parse(const std::vector<std::string_view>& argv) const {
    parse_engine{*this, argv}.run();
}

std::string argument_parser::usage_string(std::string_view progname) const noexcept {
    auto        ret    = fmt::format("Usage: {}", progname);
    std::size_t indent = ret.size();
    std::size_t col    = indent;
    for (auto& arg : _arguments) {
        auto syntax = arg.syntax_string();
        if (col + syntax.size() + 1 > 79 && col > indent) {
            ret.push_back('\n');
            ret.append(indent, ' ');
            col = indent;
        }
        ret.append(" " + syntax);
        col += syntax.size() + 1;
    }
    return ret;
}

std::string argument_parser::help_string(std::string_view progname) const noexcept {
    auto ret = usage_string(progname) + "\n\n";
    if (!_description.empty()) {
        ret.append(_description + "\n\n");
    }
    for (bool required : {true, false}) {
        bool any = false;
        for (auto& arg : _arguments) {
            if (arg.required != required) {
                continue;
            }
            if (!any) {
                ret.append(required ? "required arguments:\n\n" : "optional arguments:\n\n");
                any = true;
            }
            ret.append(arg.help_string() + "\n");
        }
    }
    return ret;
}
