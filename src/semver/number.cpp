#include "./number.hpp"

using namespace semver;

result<number> semver::parse_number(std::string_view digits) {
    if (digits.empty()) {
        return new_error(invalid_version_reason::bad_structure,
                         e_invalid_version_offset{0},
                         e_human_message{"Expected a number"});
    }
    if (digits.size() > 1 && digits[0] == '0') {
        return new_error(invalid_version_reason::leading_zero,
                         e_invalid_version_offset{0},
                         e_human_message{"Numbers may not have leading zeros"});
    }
    number acc = 0;
    for (auto it = digits.begin(); it != digits.end(); ++it) {
        if (!is_digit(*it)) {
            return new_error(invalid_version_reason::invalid_character,
                             e_invalid_version_offset{it - digits.begin()},
                             e_human_message{"Expected a decimal digit"});
        }
        acc *= 10;
        acc += *it - '0';
    }
    return acc;
}

std::string semver::to_string(const number& n) { return n.str(); }

order semver::compare_decimal(std::string_view lhs, std::string_view rhs) noexcept {
    auto strip_zeros = [](std::string_view s) {
        auto first = s.find_first_not_of('0');
        return first == s.npos ? std::string_view() : s.substr(first);
    };
    lhs = strip_zeros(lhs);
    rhs = strip_zeros(rhs);
    // Without leading zeros, the longer string is the larger number
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size() ? order::less : order::greater;
    }
    return order_of(lhs.compare(rhs));
}
