#include "./workspace.hpp"

#include <tagver/util/log.hpp>
#include <tagver/util/parallel.hpp>

#include <deque>
#include <set>

using namespace tagver;

std::vector<workspace_member> tagver::expand_workspace(const std::vector<fs::path>& directories) {
    std::vector<workspace_member> ret;
    std::set<fs::path>            seen;
    std::deque<fs::path>          queue;

    auto enqueue = [&](path_ref dir) {
        auto norm = normalize_path(dir);
        if (seen.insert(norm).second) {
            queue.push_back(std::move(norm));
        } else {
            tagver_log(trace, "Package directory [{}] is already listed", norm.string());
        }
    };

    for (auto& dir : directories) {
        enqueue(dir);
    }

    while (!queue.empty()) {
        workspace_member member{.directory = std::move(queue.front())};
        queue.pop_front();
        try {
            member.config = load_config(member.directory);
        } catch (const std::exception&) {
            // Reported when the member is resolved
            member.error = std::current_exception();
        }
        if (member.config) {
            for (auto& child : member.config->workspace) {
                enqueue(member.directory / child);
            }
        }
        ret.push_back(std::move(member));
    }
    return ret;
}

std::vector<package_result> tagver::resolve_workspace(const std::vector<fs::path>& directories,
                                                      int                          jobs) {
    auto members = expand_workspace(directories);
    tagver_log(debug, "Resolving {} package(s)", members.size());

    auto results = parallel_map(members, jobs, [](const workspace_member& member) {
        if (member.error) {
            std::rethrow_exception(member.error);
        }
        return resolve_package(member.directory, *member.config);
    });

    std::vector<package_result> ret;
    ret.reserve(results.size());
    for (std::size_t idx = 0; idx < results.size(); ++idx) {
        ret.push_back(package_result{
            .directory = members[idx].directory,
            .package   = std::move(results[idx].value),
            .error     = results[idx].error,
        });
    }
    return ret;
}
