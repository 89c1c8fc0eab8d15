#include "./ident.hpp"

#include <neo/assert.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

using namespace semver;

namespace {

bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
}

bool is_digit(char c) noexcept { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

}  // namespace

ident::ident(std::string_view str)
    : _str(str) {
    if (str.empty() || !std::ranges::all_of(str, is_ident_char)) {
        throw invalid_ident(std::string(str));
    }

    if (!std::ranges::all_of(str, is_digit)) {
        _kind = ident_kind::alphanumeric;
    } else if (str.size() > 1 && str[0] == '0') {
        _kind = ident_kind::digits;
    } else {
        _kind = ident_kind::numeric;
        // Numeric identifiers must be representable for comparison
        std::uint64_t n   = 0;
        auto          res = std::from_chars(str.data(), str.data() + str.size(), n);
        if (res.ec != std::errc{} || res.ptr != str.data() + str.size()) {
            throw invalid_ident(std::string(str));
        }
    }
}

std::uint64_t ident::numeric_value() const noexcept {
    neo_assert(expects,
               _kind == ident_kind::numeric,
               "Requested the numeric value of a non-numeric identifier",
               _str);
    std::uint64_t n = 0;
    std::from_chars(_str.data(), _str.data() + _str.size(), n);
    return n;
}

std::vector<ident> ident::parse_dotted_seq(const std::string_view s) {
    if (s.empty()) {
        throw invalid_ident(std::string(s));
    }
    std::vector<ident> acc;
    std::size_t        pos = 0;
    while (true) {
        auto next_dot = s.find('.', pos);
        auto part     = s.substr(pos, next_dot == s.npos ? s.npos : next_dot - pos);
        if (part.empty()) {
            // Leading, trailing, or doubled dots
            throw invalid_ident(std::string(s));
        }
        acc.emplace_back(part);
        if (next_dot == s.npos) {
            break;
        }
        pos = next_dot + 1;
    }
    return acc;
}

std::string semver::join_idents(const std::vector<ident>& ids) {
    std::string acc;
    for (auto& id : ids) {
        if (!acc.empty()) {
            acc.push_back('.');
        }
        acc.append(id.string());
    }
    return acc;
}

order semver::compare(const ident& lhs, const ident& rhs) noexcept {
    neo_assert(expects,
               lhs.kind() != ident_kind::digits && rhs.kind() != ident_kind::digits,
               "Ordering of leading-zero identifiers is undefined",
               lhs.string(),
               rhs.string());
    const bool lhs_num = lhs.kind() == ident_kind::numeric;
    const bool rhs_num = rhs.kind() == ident_kind::numeric;
    if (lhs_num && rhs_num) {
        return order_of(lhs.numeric_value(), rhs.numeric_value());
    } else if (lhs_num) {
        // Numeric identifiers always have lower precedence than alphanumeric ones
        return order::less;
    } else if (rhs_num) {
        return order::greater;
    }
    return order_of(lhs.string(), rhs.string());
}
