#include "./proc.hpp"

#include <tagver/util/string.hpp>

#include <algorithm>
#include <cctype>

using namespace tagver;

namespace {

bool is_shell_safe(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c))
        || std::string_view("@%+=:,./_-").find(c) != std::string_view::npos;
}

}  // namespace

std::string tagver::quote_argument(std::string_view arg) {
    if (!arg.empty() && std::ranges::all_of(arg, is_shell_safe)) {
        return std::string(arg);
    }
    // Single quotes cannot be escaped within single quotes. Close the quote, emit an escaped
    // quote, and re-open.
    return "'" + replace(arg, "'", "'\\''") + "'";
}
