#pragma once

#include <neo/pp.hpp>

#include <boost/leaf/on_error.hpp>

/**
 * @brief Attach the given error object to any error that leaves the enclosing scope.
 *
 * The expression is evaluated lazily, only if an error is actually in flight, so it may refer to
 * local variables that are still in scope. Use one TAGVER_E_SCOPE per error object.
 */
#define TAGVER_E_SCOPE(...)                                                                        \
    auto NEO_CONCAT(_tagver_e_scope_, __LINE__)                                                    \
        = boost::leaf::on_error([&] { return __VA_ARGS__; })
