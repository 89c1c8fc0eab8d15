#pragma once

#include <string>

namespace tagver {

class package;

namespace cli {

struct options;

/**
 * @brief Render the resolved version of a package as printed by the CLI, e.g.
 * `widgets 1.3.0-pre.2+abc1234 (minor)`, optionally followed by one line per changelog entry.
 */
std::string format_package(const package& pkg, bool with_changelog);

/**
 * @brief Resolve and print every package named by the options.
 *
 * Returns non-zero if any package failed to resolve.
 */
int resolve(const options& opts);

}  // namespace cli

}  // namespace tagver
