#include "./version.hpp"

#include <semver/error/on_error.hpp>
#include <semver/util/log.hpp>

#include <ostream>
#include <tuple>

using namespace semver;

namespace {

std::size_t digit_run_end(std::string_view str, std::size_t pos) noexcept {
    while (pos < str.size() && is_digit(str[pos])) {
        ++pos;
    }
    return pos;
}

/**
 * Parse one of MAJOR, MINOR, or PATCH beginning at `pos`. On success, `pos` is advanced to the
 * first character following the number.
 */
result<number> take_number(std::string_view str, std::size_t& pos) {
    const auto start = pos;
    const auto stop  = digit_run_end(str, pos);
    SEMVER_E_SHIFT_OFFSET(start);
    BOOST_LEAF_AUTO(n, parse_number(str.substr(start, stop - start)));
    pos = stop;
    return std::move(n);
}

result<void> expect_dot(std::string_view str, std::size_t pos) {
    if (pos == str.size() || str[pos] != '.') {
        return new_error(invalid_version_reason::bad_structure,
                         e_invalid_version_offset{static_cast<std::ptrdiff_t>(pos)},
                         e_human_message{"Expected a '.' separator"});
    }
    return {};
}

result<version> parse_version(std::string_view str) {
    std::size_t pos = 0;

    BOOST_LEAF_AUTO(major, take_number(str, pos));
    BOOST_LEAF_CHECK(expect_dot(str, pos));
    ++pos;
    BOOST_LEAF_AUTO(minor, take_number(str, pos));
    BOOST_LEAF_CHECK(expect_dot(str, pos));
    ++pos;
    BOOST_LEAF_AUTO(patch, take_number(str, pos));

    prerelease     pre;
    build_metadata build;

    if (pos < str.size() && str[pos] == '-') {
        ++pos;
        // The pre-release runs until the build metadata or the end of the string
        auto plus_pos = str.find('+', pos);
        auto pre_str  = str.substr(pos, plus_pos == str.npos ? str.npos : plus_pos - pos);
        SEMVER_E_SHIFT_OFFSET(pos);
        BOOST_LEAF_ASSIGN(pre, prerelease::parse(pre_str));
        pos += pre_str.size();
    }

    if (pos < str.size() && str[pos] == '+') {
        ++pos;
        SEMVER_E_SHIFT_OFFSET(pos);
        BOOST_LEAF_ASSIGN(build, build_metadata::parse(str.substr(pos)));
        pos = str.size();
    }

    if (pos != str.size()) {
        return new_error(invalid_version_reason::bad_structure,
                         e_invalid_version_offset{static_cast<std::ptrdiff_t>(pos)},
                         e_human_message{"Unexpected trailing characters"});
    }

    return version{std::move(major),
                   std::move(minor),
                   std::move(patch),
                   std::move(pre),
                   std::move(build)};
}

}  // namespace

version::version(number                          major,
                 number                          minor,
                 number                          patch,
                 std::optional<std::string_view> pre,
                 std::optional<std::string_view> build)
    : _major(std::move(major))
    , _minor(std::move(minor))
    , _patch(std::move(patch)) {
    if (pre.has_value()) {
        _prerelease = semver::prerelease{ident::split_dotted_seq(*pre)};
    }
    if (build.has_value()) {
        _build_metadata = semver::build_metadata{ident::split_dotted_seq(*build)};
    }
}

version::version(number               major,
                 number               minor,
                 number               patch,
                 class prerelease     pre,
                 class build_metadata build) noexcept
    : _major(std::move(major))
    , _minor(std::move(minor))
    , _patch(std::move(patch))
    , _prerelease(std::move(pre))
    , _build_metadata(std::move(build)) {}

result<version> version::parse(std::string_view s) {
    SEMVER_E_SCOPE(e_invalid_version{std::string(s)});
    auto res = parse_version(s);
    if (!res) {
        semver_log(trace, "Rejected invalid semantic version string '{}'", s);
    }
    return res;
}

std::string version::to_string() const {
    auto ret = fmt::format("{}.{}.{}",
                           semver::to_string(_major),
                           semver::to_string(_minor),
                           semver::to_string(_patch));
    if (is_prerelease()) {
        ret += "-" + _prerelease.to_string();
    }
    if (has_build_metadata()) {
        ret += "+" + _build_metadata.to_string();
    }
    return ret;
}

namespace semver {

std::ostream& operator<<(std::ostream& out, const version& self) {
    out << self.to_string();
    return out;
}

}  // namespace semver

order semver::compare(const version& lhs, const version& rhs) noexcept {
    auto lhs_tup = std::tie(lhs.major(), lhs.minor(), lhs.patch());
    auto rhs_tup = std::tie(rhs.major(), rhs.minor(), rhs.patch());
    if (lhs_tup < rhs_tup) {
        return order::less;
    } else if (lhs_tup > rhs_tup) {
        return order::greater;
    } else if (!lhs.is_prerelease() && rhs.is_prerelease()) {
        // No prerelease is greater than any prerelease
        return order::greater;
    } else if (lhs.is_prerelease() && !rhs.is_prerelease()) {
        return order::less;
    } else {
        // Both are prereleases, or both are empty (which compare equivalent)
        return compare(lhs.prerelease(), rhs.prerelease());
    }
}
