#pragma once

#include <semver/error/errors.hpp>
#include <semver/order.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <string>
#include <string_view>

namespace semver {

/**
 * @brief An unbounded non-negative integer, used for the major, minor, and patch fields.
 */
using number = boost::multiprecision::cpp_int;

/**
 * @brief Parse a numeric version component.
 *
 * Accepts exactly "0" or a run of digits without a leading zero. On failure, the error carries an
 * invalid_version_reason and the e_invalid_version_offset relative to the start of `digits`.
 */
result<number> parse_number(std::string_view digits);

std::string to_string(const number& n);

/**
 * @brief Compare two strings of decimal digits by their numeric value.
 *
 * Leading zeros are ignored. Neither string is converted, so there is no width limit.
 */
order compare_decimal(std::string_view lhs, std::string_view rhs) noexcept;

constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

constexpr bool is_ident_char(char c) noexcept {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

constexpr bool all_digits(std::string_view s) noexcept {
    for (auto c : s) {
        if (!is_digit(c)) {
            return false;
        }
    }
    return true;
}

}  // namespace semver
