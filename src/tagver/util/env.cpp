#include "./env.hpp"

#include <tagver/util/log.hpp>

#include <charconv>
#include <cstdlib>

std::optional<std::string> tagver::getenv(const std::string& varname) noexcept {
    auto cptr = std::getenv(varname.data());
    if (cptr) {
        return std::string(cptr);
    }
    return {};
}

int tagver::getenv_int(const std::string& varname, int dflt) noexcept {
    auto s = getenv(varname);
    if (!s) {
        return dflt;
    }
    int  n   = 0;
    auto res = std::from_chars(s->data(), s->data() + s->size(), n);
    if (res.ec != std::errc{} || res.ptr != s->data() + s->size()) {
        tagver_log(warn, "Ignoring non-integer value '{}' of environment variable {}", *s, varname);
        return dflt;
    }
    return n;
}
