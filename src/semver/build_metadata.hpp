#pragma once

#include <semver/error/result_fwd.hpp>
#include <semver/ident.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semver {

/**
 * @brief The dotted identifiers that follow a '+' in a version string.
 *
 * Build metadata is carried and rendered, but has no ordering. Leading zeros are allowed.
 */
class build_metadata {
    std::vector<ident> _ids;

public:
    build_metadata() = default;
    explicit build_metadata(std::vector<ident> ids) noexcept
        : _ids(std::move(ids)) {}

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    auto& idents() const noexcept { return _ids; }

    std::string to_string() const { return join_dotted_seq(_ids); }

    static result<build_metadata> parse(std::string_view s);

    friend bool operator==(const build_metadata& lhs, const build_metadata& rhs) noexcept {
        return lhs.idents() == rhs.idents();
    }
    friend bool operator!=(const build_metadata& lhs, const build_metadata& rhs) noexcept {
        return !(lhs == rhs);
    }
};

}  // namespace semver
