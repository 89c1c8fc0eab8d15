#include "./resolve.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <tagver/package/workspace.hpp>
#include <tagver/util/log.hpp>

#include <fmt/core.h>
#include <magic_enum.hpp>

using namespace tagver;

std::string cli::format_package(const package& pkg, bool with_changelog) {
    auto version = pkg.version();
    if (!version) {
        return fmt::format("{} (unversioned)\n", pkg.module());
    }
    auto upd = pkg.update();
    if (!upd) {
        return fmt::format("{} {}\n", pkg.module(), *version);
    }

    auto kind = upd->type ? std::string(magic_enum::enum_name(*upd->type)) : "forced";
    auto ret  = fmt::format("{} {} ({})\n", pkg.module(), *version, kind);
    if (with_changelog) {
        for (auto& entry : upd->changelog) {
            ret += fmt::format("  {} {}{}\n",
                               entry.commit.short_hash,
                               entry.commit.summary,
                               entry.breaking ? " [breaking]" : "");
        }
    }
    return ret;
}

int cli::resolve(const options& opts) {
    auto results = resolve_workspace(opts.package_dirs(), opts.jobs);

    int n_failed = 0;
    for (auto& res : results) {
        if (res.okay()) {
            fmt::print("{}", format_package(*res.package, opts.changelog));
            continue;
        }
        ++n_failed;
        tagver_log(error, "Failed to resolve the package in [{}]:", res.directory.string());
        handle_cli_errors([&]() -> int { std::rethrow_exception(res.error); });
    }

    if (n_failed) {
        tagver_log(error, "{} of {} package(s) failed to resolve", n_failed, results.size());
        return 1;
    }
    return 0;
}
