#pragma once

#include "./human.hpp"
#include "./result.hpp"

#include <boost/leaf/pred.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace semver {

/**
 * @brief Refines why a string was rejected as a semantic version.
 *
 * Every parse failure is the same kind of error (an e_invalid_version). This enum is an additional
 * diagnostic that travels with it.
 */
enum class invalid_version_reason {
    /// Missing or extra segments, or the wrong separator
    bad_structure,
    /// A numeric component or numeric pre-release identifier with a leading zero
    leading_zero,
    /// An empty pre-release or build-metadata identifier
    empty_identifier,
    /// A character outside of [0-9A-Za-z-]
    invalid_character,
};

std::string_view describe(invalid_version_reason) noexcept;

/**
 * @brief The string that failed to parse as a semantic version, verbatim.
 */
struct e_invalid_version {
    std::string value;

    friend std::ostream& operator<<(std::ostream& out, const e_invalid_version& self) noexcept;
};

/**
 * @brief Byte offset of the first character that could not be accepted.
 */
struct e_invalid_version_offset {
    std::ptrdiff_t value = 0;
};

template <auto Val>
using matchv = boost::leaf::match<decltype(Val), Val>;

}  // namespace semver
