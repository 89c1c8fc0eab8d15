#pragma once

namespace semver {

enum class order {
    less,
    equivalent,
    greater,
};

/**
 * @brief Turn a three-way comparison of two ordered values into an `order`
 */
template <typename T>
constexpr order order_of(const T& lhs, const T& rhs) noexcept {
    if (lhs < rhs) {
        return order::less;
    } else if (rhs < lhs) {
        return order::greater;
    } else {
        return order::equivalent;
    }
}

}  // namespace semver
