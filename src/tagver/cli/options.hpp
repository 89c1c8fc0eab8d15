#pragma once

#include <tagver/util/fs.hpp>
#include <tagver/util/log.hpp>

#include <vector>

namespace debate {
class argument_parser;
}  // namespace debate

namespace tagver::cli {

/**
 * @brief Complete aggregate of the tagver command-line options
 */
struct options {
    options() noexcept;

    // All `--package` arguments. Defaults to the working directory if none are given.
    std::vector<fs::path> packages;
    // The `--jobs` argument. Less than one selects a default based on the hardware.
    int jobs = 0;
    // The `--changelog` switch
    bool changelog = false;
    // The `--log-level` argument
    log::level log_level = log::level::info;

    /// The package directories to resolve, with the default applied
    std::vector<fs::path> package_dirs() const noexcept;

    void setup_parser(debate::argument_parser& parser) noexcept;
};

}  // namespace tagver::cli
