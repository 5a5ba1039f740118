#pragma once

#include <semver/error/result_fwd.hpp>
#include <semver/order.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace semver {

enum class ident_kind {
    /// Contains at least one non-digit character
    alphanumeric,
    /// All digits, without a leading zero (or exactly "0")
    numeric,
    /// All digits, with a leading zero. Only legal in build metadata.
    digits,
};

/**
 * @brief Classify the given identifier string. Does not check the character set.
 */
ident_kind classify(std::string_view str) noexcept;

order compare(ident_kind lhs, ident_kind rhs) noexcept;

class ident;
order compare(const ident& lhs, const ident& rhs) noexcept;

/**
 * @brief A single dot-separated identifier from a pre-release tag or build metadata.
 */
class ident {
    std::string _str;
    ident_kind  _kind = ident_kind::alphanumeric;

public:
    /**
     * @brief Create an identifier from the given string without validating it.
     */
    explicit ident(std::string_view str);

    auto        kind() const noexcept { return _kind; }
    const auto& string() const noexcept { return _str; }

    /**
     * @brief Parse a single identifier. Requires a non-empty string of [0-9A-Za-z-].
     */
    static result<ident> parse(std::string_view str);

    /**
     * @brief Parse a non-empty sequence of dot-separated identifiers.
     */
    static result<std::vector<ident>> parse_dotted_seq(std::string_view s);

    /**
     * @brief Split a string on '.' into identifiers without validating them.
     */
    static std::vector<ident> split_dotted_seq(std::string_view s);

    /// Identifiers are equal when they are spelled the same
    friend bool operator==(const ident& lhs, const ident& rhs) noexcept {
        return lhs.string() == rhs.string();
    }
    friend bool operator!=(const ident& lhs, const ident& rhs) noexcept { return !(lhs == rhs); }

#define DEF_OP(op, expr)                                                                           \
    inline friend bool operator op(const ident& lhs, const ident& rhs) noexcept {                  \
        auto o = compare(lhs, rhs);                                                                \
        return (expr);                                                                             \
    }                                                                                              \
    static_assert(true)

    DEF_OP(<, (o == order::less));
    DEF_OP(>, (o == order::greater));
    DEF_OP(<=, (o == order::less || o == order::equivalent));
    DEF_OP(>=, (o == order::greater || o == order::equivalent));
#undef DEF_OP
};

/**
 * @brief Join identifiers back into their dotted form
 */
std::string join_dotted_seq(const std::vector<ident>& ids);

}  // namespace semver
