#pragma once

#include "./commit.hpp"
#include "./repository.hpp"

#include <tagver/temp.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagver::git::testing {

/**
 * @brief Create an in-memory commit with fixed placeholder hashes and users
 */
commit make_commit(std::string_view summary,
                   std::optional<std::string_view> body = std::nullopt,
                   trailer_map                     trailers = {});

/**
 * @brief A freshly initialized git repository in a temporary directory, removed along with this
 * object.
 */
class scratch_repository {
    temporary_dir _tmp;
    int           _n_changes = 0;

    explicit scratch_repository(temporary_dir tmp)
        : _tmp(std::move(tmp)) {}

public:
    static scratch_repository create();

    path_ref path() const noexcept { return _tmp.path(); }

    git::repository repository() const { return git::repository{path()}; }

    /// Run a git command in the repository. Throws if git fails. Returns the git output.
    std::string run(std::vector<std::string> args) const;

    /**
     * @brief Create a commit with the given message, modifying a file at the given relative
     * path so that the commit is never empty. Returns the hash of the new commit.
     */
    std::string commit(std::string_view message, std::string_view file = "file.txt");

    /// Create a lightweight tag, or an annotated tag if given a message
    void tag(std::string_view name, std::optional<std::string_view> message = std::nullopt);

    void write_file(std::string_view relpath, std::string_view content) const;
};

}  // namespace tagver::git::testing
