#pragma once

#include <optional>
#include <string>

namespace tagver {

std::optional<std::string> getenv(const std::string& env) noexcept;

/**
 * @brief Obtain an integer from the named environment variable, or `dflt` if it is unset or is
 * not a valid integer.
 */
int getenv_int(const std::string& env, int dflt) noexcept;

}  // namespace tagver
