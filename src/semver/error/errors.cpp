#include "./errors.hpp"

#include <neo/assert.hpp>

#include <iomanip>
#include <ostream>

using namespace semver;

std::string_view semver::describe(invalid_version_reason r) noexcept {
    switch (r) {
    case invalid_version_reason::bad_structure:
        return "Expected MAJOR.MINOR.PATCH, optionally followed by '-' pre-release and/or '+' "
               "build metadata";
    case invalid_version_reason::leading_zero:
        return "Numeric components and numeric pre-release identifiers may not have leading "
               "zeros";
    case invalid_version_reason::empty_identifier:
        return "Pre-release and build metadata identifiers may not be empty";
    case invalid_version_reason::invalid_character:
        return "Identifiers may only contain ASCII alphanumerics and hyphens [0-9A-Za-z-]";
    }
    neo_assert_always(invariant,
                      false,
                      "Unhandled invalid_version_reason while generating a description",
                      int(r));
}

namespace semver {

std::ostream& operator<<(std::ostream& out, const e_invalid_version& self) noexcept {
    out << "semver::e_invalid_version: " << std::quoted(self.value);
    return out;
}

}  // namespace semver
