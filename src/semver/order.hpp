#pragma once

namespace semver {

enum class order {
    less,
    equivalent,
    greater,
};

/// Convert a three-way comparison integer (as from std::string::compare) to an order
constexpr order order_of(int comparison) noexcept {
    if (comparison < 0) {
        return order::less;
    } else if (comparison > 0) {
        return order::greater;
    } else {
        return order::equivalent;
    }
}

/// Swap the sides of a comparison result
constexpr order invert(order o) noexcept {
    switch (o) {
    case order::less:
        return order::greater;
    case order::greater:
        return order::less;
    case order::equivalent:
        break;
    }
    return order::equivalent;
}

}  // namespace semver
