#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace tagver {

inline namespace string_utils {

inline bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline std::string_view trim_left(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    return s;
}

inline std::string_view trim_right(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

inline std::string_view trim(std::string_view s) noexcept { return trim_left(trim_right(s)); }

inline bool contains(std::string_view s, std::string_view key) noexcept {
    return s.find(key) != s.npos;
}

inline std::string to_lower(std::string_view s) {
    std::string ret{s};
    std::ranges::transform(ret, ret.begin(), [](unsigned char c) { return std::tolower(c); });
    return ret;
}

inline std::vector<std::string> split(std::string_view str, std::string_view sep) {
    std::vector<std::string>    ret;
    std::string_view::size_type prev_pos = 0;
    auto                        pos      = prev_pos;
    while ((pos = str.find(sep, prev_pos)) != str.npos) {
        ret.emplace_back(str.substr(prev_pos, pos - prev_pos));
        prev_pos = pos + sep.length();
    }
    ret.emplace_back(str.substr(prev_pos));
    return ret;
}

inline std::vector<std::string> split_lines(std::string_view str) { return split(str, "\n"); }

inline std::string replace(std::string_view str, std::string_view key, std::string_view repl) {
    std::string                 ret;
    std::string_view::size_type pos      = 0;
    std::string_view::size_type prev_pos = 0;
    while (pos = str.find(key, pos), pos != key.npos) {
        ret.append(str.begin() + prev_pos, str.begin() + pos);
        ret.append(repl);
        prev_pos = pos += key.size();
    }
    ret.append(str.begin() + prev_pos, str.end());
    return ret;
}

template <typename Range>
std::string joinstr(std::string_view joiner, const Range& rng) {
    std::string ret;
    for (const auto& s : rng) {
        if (!ret.empty()) {
            ret.append(joiner);
        }
        ret.append(s);
    }
    return ret;
}

}  // namespace string_utils

}  // namespace tagver
