#pragma once

#include <semver/error/result_fwd.hpp>
#include <semver/ident.hpp>
#include <semver/order.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semver {

class prerelease;
order compare(const prerelease& lhs, const prerelease& rhs) noexcept;

/**
 * @brief A pre-release tag: the dotted identifiers that follow a '-' in a version string.
 *
 * An empty prerelease denotes that the version has no pre-release tag.
 */
class prerelease {
    std::vector<ident> _ids;

public:
    prerelease() = default;
    explicit prerelease(std::vector<ident> ids) noexcept
        : _ids(std::move(ids)) {}

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    auto& idents() const noexcept { return _ids; }

    std::string to_string() const { return join_dotted_seq(_ids); }

    /**
     * @brief Parse a pre-release tag. Numeric identifiers may not carry leading zeros.
     */
    static result<prerelease> parse(std::string_view str);

    friend bool operator==(const prerelease& lhs, const prerelease& rhs) noexcept {
        return lhs.idents() == rhs.idents();
    }
    friend bool operator!=(const prerelease& lhs, const prerelease& rhs) noexcept {
        return !(lhs == rhs);
    }

#define DEF_OP(op, expr)                                                                           \
    inline friend bool operator op(const prerelease& lhs, const prerelease& rhs) noexcept {        \
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

}  // namespace semver
