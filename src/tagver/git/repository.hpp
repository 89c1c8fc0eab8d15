#pragma once

#include "./commit.hpp"

#include <tagver/util/fs.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagver::git {

struct tag_list_options {
    /// A glob pattern to match against tag names
    std::optional<std::string> name = std::nullopt;
    /// Order tags by their name as a version, highest first
    bool sort_by_version = false;
    /// Only tags that point at this commit
    std::optional<std::string> points_at = std::nullopt;
    /// Only tags that do not contain this commit
    std::optional<std::string> no_contains = std::nullopt;
    /// Only tags that contain this commit
    std::optional<std::string> contains = std::nullopt;
};

struct log_options {
    /// Exclusive starting point of the log
    std::optional<std::string> from = std::nullopt;
    /// Inclusive ending point of the log. Defaults to HEAD.
    std::optional<std::string> to = std::nullopt;
    /// Only commits touching these paths, relative to the repository directory
    std::vector<std::string> paths = {};
    std::optional<int>       max_count = std::nullopt;
};

/**
 * @brief Read-only access to the metadata of a git repository.
 *
 * Every query spawns a git subprocess. Nothing is cached between queries.
 */
class repository {
    fs::path _dir;

    std::string _run(std::vector<std::string> args) const;

public:
    explicit repository(fs::path dir)
        : _dir(std::move(dir)) {}

    path_ref directory() const noexcept { return _dir; }

    /**
     * @brief List tags, newest first if sorting by version. Each tag's commit is fully loaded.
     *
     * A repository without any commits has no tags.
     */
    std::vector<tag> tag_list(const tag_list_options& = {}) const;

    /**
     * @brief Obtain the commit log, newest first. A repository without any commits has an empty log.
     */
    std::vector<commit> log(const log_options& = {}) const;

    /**
     * @brief Obtain the commit at the given revision, or nullopt if there is none
     */
    std::optional<commit> commit_at(std::string_view ref) const;

    /**
     * @brief Obtain the commit at HEAD. Throws git_error if there are no commits yet.
     */
    commit head() const;
};

}  // namespace tagver::git
