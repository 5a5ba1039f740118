#pragma once

namespace boost::leaf {

template <typename T>
class result;

}  // namespace boost::leaf

namespace semver {

using boost::leaf::result;

}  // namespace semver
