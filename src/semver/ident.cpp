#include "./ident.hpp"

#include <semver/error/on_error.hpp>
#include <semver/number.hpp>

#include <neo/assert.hpp>

using namespace semver;

ident_kind semver::classify(std::string_view str) noexcept {
    if (str.empty() || !all_digits(str)) {
        return ident_kind::alphanumeric;
    } else if (str.size() > 1 && str[0] == '0') {
        return ident_kind::digits;
    } else {
        return ident_kind::numeric;
    }
}

ident::ident(std::string_view str)
    : _str(str)
    , _kind(classify(str)) {}

result<ident> ident::parse(std::string_view str) {
    if (str.empty()) {
        return new_error(invalid_version_reason::empty_identifier,
                         e_invalid_version_offset{0},
                         e_human_message{"Empty identifier"});
    }
    for (auto it = str.begin(); it != str.end(); ++it) {
        if (!is_ident_char(*it)) {
            return new_error(invalid_version_reason::invalid_character,
                             e_invalid_version_offset{it - str.begin()},
                             e_human_message{"Invalid character in identifier"});
        }
    }
    return ident{str};
}

result<std::vector<ident>> ident::parse_dotted_seq(const std::string_view s) {
    std::vector<ident> acc;
    std::size_t        pos = 0;
    while (true) {
        auto next_dot = s.find('.', pos);
        auto id_sub   = s.substr(pos, next_dot == s.npos ? s.npos : next_dot - pos);
        {
            SEMVER_E_SHIFT_OFFSET(pos);
            BOOST_LEAF_AUTO(id, ident::parse(id_sub));
            acc.push_back(std::move(id));
        }
        if (next_dot == s.npos) {
            break;
        }
        pos = next_dot + 1;
    }
    return acc;
}

std::vector<ident> ident::split_dotted_seq(std::string_view s) {
    std::vector<ident> acc;
    while (true) {
        auto next_dot = s.find('.');
        acc.emplace_back(s.substr(0, next_dot));
        if (next_dot == s.npos) {
            break;
        }
        s = s.substr(next_dot + 1);
    }
    return acc;
}

std::string semver::join_dotted_seq(const std::vector<ident>& ids) {
    std::string acc;
    auto        it   = ids.cbegin();
    auto        stop = ids.cend();
    while (it != stop) {
        acc += it->string();
        ++it;
        if (it != stop) {
            acc += ".";
        }
    }
    return acc;
}

order semver::compare(ident_kind lhs, ident_kind rhs) noexcept {
    // Digit-only identifiers with leading zeros never appear in a valid prerelease, but a
    // directly-constructed version may contain one. Order it by value, like a number.
    auto rank = [](ident_kind k) { return k == ident_kind::alphanumeric ? 1 : 0; };
    return order_of(rank(lhs) - rank(rhs));
}

order semver::compare(const ident& lhs, const ident& rhs) noexcept {
    auto ord = compare(lhs.kind(), rhs.kind());
    if (ord != order::equivalent) {
        return ord;
    }
    if (lhs.kind() == ident_kind::alphanumeric) {
        neo_assert(invariant,
                   rhs.kind() == ident_kind::alphanumeric,
                   "Identifier kinds disagree after comparing equivalent",
                   lhs.string(),
                   rhs.string());
        return order_of(lhs.string().compare(rhs.string()));
    }
    return compare_decimal(lhs.string(), rhs.string());
}
