#include "./build_metadata.hpp"

#include <semver/error/result.hpp>

using namespace semver;

result<build_metadata> build_metadata::parse(std::string_view s) {
    BOOST_LEAF_AUTO(ids, ident::parse_dotted_seq(s));
    return build_metadata{std::move(ids)};
}
