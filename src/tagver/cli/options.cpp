#include "./options.hpp"

#include <tagver/util/env.hpp>

#include <debate/argument_parser.hpp>

#include <magic_enum.hpp>

using namespace tagver;
using namespace tagver::cli;

options::options() noexcept {
    jobs = getenv_int("TAGVER_JOBS", 0);

    auto ll = getenv("TAGVER_LOG_LEVEL");
    if (ll.has_value()) {
        auto llo = magic_enum::enum_cast<log::level>(*ll);
        if (llo.has_value()) {
            log_level = *llo;
        }
    }
}

std::vector<fs::path> options::package_dirs() const noexcept {
    if (packages.empty()) {
        return {fs::path(".")};
    }
    return packages;
}

void options::setup_parser(debate::argument_parser& parser) noexcept {
    parser.add_argument({
        .long_spellings  = {"package"},
        .short_spellings = {"p"},
        .help            = "The directory of a package to resolve. May be given more than once.\n"
                           "Packages listed in the 'workspace' of a package are also resolved.\n"
                           "Default is the working directory.",
        .valname         = "<directory>",
        .can_repeat      = true,
        .action          = debate::push_back_onto(packages),
    });
    parser.add_argument({
        .long_spellings  = {"jobs"},
        .short_spellings = {"j"},
        .help            = "Set the maximum number of packages to resolve in parallel.\n"
                           "Default is taken from TAGVER_JOBS, or from the number of processors.",
        .valname         = "<job-count>",
        .action          = debate::put_into(jobs),
    });
    parser.add_argument({
        .long_spellings = {"changelog"},
        .help           = "Print the commits that make up the update of each package",
        .nargs          = 0,
        .action         = debate::store_true(changelog),
    });
    parser.add_argument({
        .long_spellings  = {"log-level"},
        .short_spellings = {"l"},
        .help            = "Set the tagver logging level. One of 'trace', 'debug', 'info', \n"
                           "'warn', 'error', 'critical', or 'silent'",
        .valname         = "<level>",
        .action          = debate::put_into(log_level),
    });
}
