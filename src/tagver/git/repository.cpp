#include "./repository.hpp"

#include "./error.hpp"

#include <tagver/util/log.hpp>
#include <tagver/util/proc.hpp>
#include <tagver/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

using namespace tagver;
using namespace tagver::git;
using namespace std::literals;

namespace {

std::vector<std::string> git_command(path_ref dir, std::vector<std::string> args) {
    std::vector<std::string> command = {"git"s, "-C"s, dir.string(), "--no-pager"s};
    command.insert(command.end(),
                   std::make_move_iterator(args.begin()),
                   std::make_move_iterator(args.end()));
    return command;
}

template <typename Error>
[[noreturn]] void throw_git_error(std::string_view                message,
                                  const std::vector<std::string>& command,
                                  int                             retc,
                                  std::string                     output) {
    BOOST_LEAF_THROW_EXCEPTION(Error(std::string(message), command, retc, std::move(output)),
                               e_git_command{quote_command(command)},
                               e_git_exit_code{retc});
}

/// Run git with untranslated messages, so that its diagnostics can be recognized
proc_result run_git(std::vector<std::string> command) {
    return run_proc(proc_options{
        .command     = std::move(command),
        .environment = {{"LC_ALL"s, "C"s}},
    });
}

bool has_any_commits(path_ref dir) {
    auto res = run_git(git_command(dir, {"rev-parse"s, "--verify"s, "--quiet"s, "HEAD"s}));
    return res.okay();
}

}  // namespace

std::string repository::_run(std::vector<std::string> args) const {
    const auto subcommand = args.empty() ? ""s : args.front();
    const auto command    = git_command(_dir, std::move(args));
    tagver_log(trace, "Running git command: {}", quote_command(command));
    auto res = run_git(command);
    if (!res.okay()) {
        auto& output  = res.error_output.empty() ? res.output : res.error_output;
        auto  message = fmt::format("Error running git command: {}\n\n{}",
                                   subcommand,
                                   trim_right(output));
        if (contains(output, "not a git repository")) {
            throw_git_error<not_a_repository_error>(message, command, res.retc, output);
        }
        throw_git_error<git_error>(message, command, res.retc, output);
    }
    return std::move(res.output);
}

std::vector<commit> repository::log(const log_options& opts) const {
    std::vector<std::string> args = {"log"s, "--no-color"s, "--format=" + format_arg(commit_format())};
    if (opts.max_count) {
        args.push_back(fmt::format("--max-count={}", *opts.max_count));
    }
    if (opts.from) {
        args.push_back(fmt::format("{}..{}", *opts.from, opts.to.value_or("HEAD")));
    } else if (opts.to) {
        args.push_back(*opts.to);
    }
    args.push_back("--"s);
    args.insert(args.end(), opts.paths.begin(), opts.paths.end());

    std::string output;
    try {
        output = _run(std::move(args));
    } catch (const not_a_repository_error&) {
        throw;
    } catch (const git_error&) {
        if (!has_any_commits(_dir)) {
            tagver_log(debug, "Repository [{}] has no commits yet", _dir.string());
            return {};
        }
        throw;
    }

    std::vector<commit> ret;
    for (auto& rec : decode(commit_format(), output)) {
        ret.push_back(commit_from_record(rec));
    }
    return ret;
}

std::optional<commit> repository::commit_at(std::string_view ref) const {
    auto commits = log({.to = std::string(ref), .max_count = 1});
    if (commits.empty()) {
        return std::nullopt;
    }
    return std::move(commits.front());
}

commit repository::head() const {
    auto c = commit_at("HEAD");
    if (!c) {
        throw_git_error<git_error>("Current branch does not have any commits",
                                   git_command(_dir, {"log"s, "HEAD"s}),
                                   0,
                                   "");
    }
    return std::move(*c);
}

std::vector<tag> repository::tag_list(const tag_list_options& opts) const {
    std::vector<std::string> args = {"tag"s, "--list"s, "--format=" + format_arg(tag_format())};
    if (opts.contains) {
        args.insert(args.end(), {"--contains"s, *opts.contains});
    }
    if (opts.no_contains) {
        args.insert(args.end(), {"--no-contains"s, *opts.no_contains});
    }
    if (opts.points_at) {
        args.insert(args.end(), {"--points-at"s, *opts.points_at});
    }
    if (opts.sort_by_version) {
        args.push_back("--sort=-version:refname"s);
    }
    if (opts.name) {
        args.push_back(*opts.name);
    }

    std::string output;
    try {
        output = _run(args);
    } catch (const not_a_repository_error&) {
        throw;
    } catch (const git_error&) {
        // Revision filters fail to resolve HEAD in a repository without commits
        if (!has_any_commits(_dir)) {
            return {};
        }
        throw;
    }

    std::vector<tag> ret;
    for (auto& rec : decode(tag_format(), output)) {
        auto t = tag_from_record(rec);
        auto c = commit_at(t.commit.hash);
        if (!c) {
            throw_git_error<git_error>(fmt::format("Cannot find commit {} for tag {}",
                                                   t.commit.hash,
                                                   t.name),
                                       git_command(_dir, args),
                                       0,
                                       "");
        }
        t.commit = std::move(*c);
        ret.push_back(std::move(t));
    }
    tagver_log(trace, "Found {} tag(s) in [{}]", ret.size(), _dir.string());
    return ret;
}
