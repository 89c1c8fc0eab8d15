#include "./testing.hpp"

#include <tagver/util/fs.hpp>
#include <tagver/util/proc.hpp>
#include <tagver/util/string.hpp>

#include <fmt/core.h>

#include <stdexcept>

using namespace tagver;
using namespace tagver::git;
using namespace tagver::git::testing;
using namespace std::literals;

commit testing::make_commit(std::string_view                summary,
                            std::optional<std::string_view> body,
                            trailer_map                     trailers) {
    return commit{
        .hash       = "0123456789abcdef0123456789abcdef01234567",
        .short_hash = "0123456",
        .author     = {.name = "author-name", .email = "author@example.com"},
        .committer  = {.name = "committer-name", .email = "committer@example.com"},
        .summary    = std::string(summary),
        .body       = body ? std::optional<std::string>(std::string(*body)) : std::nullopt,
        .trailers   = std::move(trailers),
    };
}

scratch_repository scratch_repository::create() {
    scratch_repository ret{temporary_dir::create()};
    ret.run({"init"s, "--quiet"s});
    ret.run({"config"s, "user.name"s, "Test User"s});
    ret.run({"config"s, "user.email"s, "test@example.com"s});
    ret.run({"config"s, "commit.gpgsign"s, "false"s});
    ret.run({"config"s, "tag.gpgsign"s, "false"s});
    return ret;
}

std::string scratch_repository::run(std::vector<std::string> args) const {
    std::vector<std::string> command = {"git"s, "-C"s, path().string()};
    command.insert(command.end(), args.begin(), args.end());
    auto res = run_proc(command);
    if (!res.okay()) {
        throw std::runtime_error(fmt::format("Test git command failed [{}] (exited {}):\n{}",
                                             quote_command(command),
                                             res.retc,
                                             res.error_output));
    }
    return res.output;
}

void scratch_repository::write_file(std::string_view relpath, std::string_view content) const {
    auto fpath = path() / relpath;
    fs::create_directories(fpath.parent_path());
    tagver::write_file(fpath, content);
}

std::string scratch_repository::commit(std::string_view message, std::string_view file) {
    write_file(file, fmt::format("change #{}\n", ++_n_changes));
    run({"add"s, "--"s, std::string(file)});
    run({"commit"s, "--quiet"s, "--message"s, std::string(message)});
    return std::string(trim_right(run({"rev-parse"s, "HEAD"s})));
}

void scratch_repository::tag(std::string_view name, std::optional<std::string_view> message) {
    if (message) {
        run({"tag"s, "--annotate"s, "--message"s, std::string(*message), std::string(name)});
    } else {
        run({"tag"s, std::string(name)});
    }
}
