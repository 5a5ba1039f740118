#pragma once

#include "./result_fwd.hpp"

#include <boost/leaf/error.hpp>
#include <boost/leaf/result.hpp>

namespace semver {

using boost::leaf::new_error;

}  // namespace semver
