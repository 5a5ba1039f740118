#pragma once

#include "./errors.hpp"

#include <neo/pp.hpp>

#include <boost/leaf/on_error.hpp>

#include <cstddef>

/**
 * @brief Generate a callable object that returns the given expression.
 *
 * Use this as a parameter to leaf's error-loading APIs.
 */
#define SEMVER_E_ARG(...) ([&] { return __VA_ARGS__; })

/**
 * @brief Generate a leaf::on_error object that loads the given expression into the currently
 * in-flight error if the current scope is exitted via exception or a bad result<>
 */
#define SEMVER_E_SCOPE(...)                                                                        \
    auto NEO_CONCAT(_err_info_, __LINE__) = boost::leaf::on_error(SEMVER_E_ARG(__VA_ARGS__))

/**
 * @brief Rebase the e_invalid_version_offset of an error leaving the current scope by `Base` bytes.
 *
 * Component parsers report offsets relative to the component they were given. The enclosing parser
 * knows where that component starts within the full string.
 */
#define SEMVER_E_SHIFT_OFFSET(Base)                                                                \
    auto NEO_CONCAT(_err_shift_, __LINE__) = boost::leaf::on_error(                                \
        [_base = static_cast<std::ptrdiff_t>(Base)](::semver::e_invalid_version_offset& off) {     \
            off.value += _base;                                                                    \
        })
