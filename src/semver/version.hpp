#pragma once

#include <semver/build_metadata.hpp>
#include <semver/error/result.hpp>
#include <semver/number.hpp>
#include <semver/order.hpp>
#include <semver/prerelease.hpp>

#include <fmt/format.h>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace semver {

class version;
order compare(const version& lhs, const version& rhs) noexcept;

/**
 * @brief A Semantic Versioning 2.0.0 version.
 *
 * Relational operators (<, >, <=, >=) follow version precedence, in which build metadata does not
 * participate. Equality (==, !=) is structural and DOES consider build metadata, so two versions
 * may be neither less nor greater than each other while still comparing unequal. Use
 * `compare(a, b) == order::equivalent` to check for equal precedence.
 */
class version {
    number _major = 0;
    number _minor = 0;
    number _patch = 0;
    // Both of these are empty when absent
    class prerelease     _prerelease;
    class build_metadata _build_metadata;

public:
    version() = default;

    /**
     * @brief Construct a version from its components.
     *
     * No validation is performed. The caller is responsible for passing components that conform to
     * the grammar. Use version::parse() to validate a version string.
     */
    version(number                          major,
            number                          minor,
            number                          patch,
            std::optional<std::string_view> pre   = std::nullopt,
            std::optional<std::string_view> build = std::nullopt);

    version(number               major,
            number               minor,
            number               patch,
            class prerelease     pre,
            class build_metadata build) noexcept;

    /**
     * @brief Parse a semantic version string.
     *
     * The entire string must match. On failure, the error carries an e_invalid_version holding the
     * given string, an invalid_version_reason, and an e_invalid_version_offset.
     */
    static result<version> parse(std::string_view s);

    const number& major() const noexcept { return _major; }
    const number& minor() const noexcept { return _minor; }
    const number& patch() const noexcept { return _patch; }

    const class prerelease&     prerelease() const noexcept { return _prerelease; }
    const class build_metadata& build_metadata() const noexcept { return _build_metadata; }

    bool is_prerelease() const noexcept { return !_prerelease.empty(); }
    bool has_build_metadata() const noexcept { return !_build_metadata.empty(); }

    /// Render the canonical string form of the version
    std::string to_string() const;

    friend bool operator==(const version& lhs, const version& rhs) noexcept {
        return lhs._major == rhs._major && lhs._minor == rhs._minor && lhs._patch == rhs._patch
            && lhs._prerelease == rhs._prerelease && lhs._build_metadata == rhs._build_metadata;
    }
    friend bool operator!=(const version& lhs, const version& rhs) noexcept {
        return !(lhs == rhs);
    }

#define DEF_OP(op, expr)                                                                           \
    inline friend bool operator op(const version& lhs, const version& rhs) noexcept {              \
        auto o = compare(lhs, rhs);                                                                \
        return (expr);                                                                             \
    }                                                                                              \
    static_assert(true)

    DEF_OP(<, (o == order::less));
    DEF_OP(>, (o == order::greater));
    DEF_OP(<=, (o == order::less || o == order::equivalent));
    DEF_OP(>=, (o == order::greater || o == order::equivalent));
#undef DEF_OP

    friend inline std::string to_string(const version& ver) { return ver.to_string(); }

    friend std::ostream& operator<<(std::ostream& out, const version& self);
};

}  // namespace semver

template <>
struct fmt::formatter<semver::version> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const semver::version& ver, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(ver.to_string(), ctx);
    }
};
