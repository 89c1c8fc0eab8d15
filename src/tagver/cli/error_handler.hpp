#pragma once

#include <functional>

namespace tagver {

/**
 * @brief Run `fn`, and log any error that escapes it.
 *
 * Returns the value of `fn`, or a non-zero exit code if an error was handled.
 */
int handle_cli_errors(std::function<int()> fn) noexcept;

}  // namespace tagver
