#include "./argument.hpp"

#include <fmt/core.h>

using namespace debate;

std::string argument::preferred_spelling() const noexcept {
    if (!long_spellings.empty()) {
        return "--" + long_spellings.front();
    } else if (!short_spellings.empty()) {
        return "-" + short_spellings.front();
    }
    return valname;
}

std::string argument::syntax_string() const noexcept {
    auto val = valname.empty() ? std::string("<value>") : valname;
    if (is_positional()) {
        auto one = can_repeat ? fmt::format("{} [...]", val) : val;
        return required ? one : fmt::format("[{}]", one);
    }
    auto spelling = preferred_spelling();
    if (nargs == 0) {
        return fmt::format("[{}]", spelling);
    }
    auto one = fmt::format("{}{}{}", spelling, spelling.starts_with("--") ? "=" : " ", val);
    if (can_repeat) {
        one = fmt::format("{} [...]", one);
    }
    return required ? one : fmt::format("[{}]", one);
}

std::string argument::help_string() const noexcept {
    auto        val = valname.empty() ? std::string("<value>") : valname;
    std::string ret;
    for (auto& l : long_spellings) {
        ret.append(nargs == 0 ? fmt::format("--{}\n", l) : fmt::format("--{}={}\n", l, val));
    }
    for (auto& s : short_spellings) {
        ret.append(nargs == 0 ? fmt::format("-{}\n", s) : fmt::format("-{} {}\n", s, val));
    }
    if (is_positional()) {
        ret.append(val + "\n");
    }
    // Indent every line of the help text
    ret.append("  ");
    for (auto c : help) {
        ret.push_back(c);
        if (c == '\n') {
            ret.append("  ");
        }
    }
    ret.push_back('\n');
    return ret;
}

std::string_view argument::match_long(std::string_view given) const noexcept {
    for (auto& cand : long_spellings) {
        if (!given.starts_with(cand)) {
            continue;
        }
        // Either '--name' or '--name=value'
        auto tail = given.substr(cand.size());
        if (tail.empty() || tail.front() == '=') {
            return cand;
        }
    }
    return {};
}

std::string_view argument::match_short(std::string_view given) const noexcept {
    for (auto& cand : short_spellings) {
        if (given.starts_with(cand)) {
            return cand;
        }
    }
    return {};
}
