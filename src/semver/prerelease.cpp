#include "./prerelease.hpp"

#include <semver/error/on_error.hpp>

using namespace semver;

result<prerelease> prerelease::parse(std::string_view s) {
    BOOST_LEAF_AUTO(ids, ident::parse_dotted_seq(s));
    std::ptrdiff_t offset = 0;
    for (auto& id : ids) {
        if (id.kind() == ident_kind::digits) {
            return new_error(invalid_version_reason::leading_zero,
                             e_invalid_version_offset{offset},
                             e_human_message{"Numeric pre-release identifiers may not have leading "
                                             "zeros: "
                                             + id.string()});
        }
        offset += static_cast<std::ptrdiff_t>(id.string().size()) + 1;
    }
    return prerelease{std::move(ids)};
}

order semver::compare(const prerelease& lhs, const prerelease& rhs) noexcept {
    auto       lhs_iter = lhs.idents().cbegin();
    auto       rhs_iter = rhs.idents().cbegin();
    const auto lhs_end  = lhs.idents().cend();
    const auto rhs_end  = rhs.idents().cend();

    for (; lhs_iter != lhs_end && rhs_iter != rhs_end; ++lhs_iter, ++rhs_iter) {
        auto ord = compare(*lhs_iter, *rhs_iter);
        if (ord != order::equivalent) {
            return ord;
        }
    }
    if (lhs_iter != lhs_end) {
        // Left-hand is longer
        return order::greater;
    } else if (rhs_iter != rhs_end) {
        // Right-hand is longer
        return order::less;
    } else {
        return order::equivalent;
    }
}
