#pragma once

#include "./commit.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tagver::git {

/**
 * @brief A commit along with the information encoded in its message following the Conventional
 * Commits convention.
 */
struct conventional_commit {
    git::commit commit;
    /// The description from the summary line. Never absent, but may be empty.
    std::string description;
    /// The lowercase type from the summary line (e.g. "feat", "fix")
    std::optional<std::string> type;
    /// The lowercase scopes from the summary line. Possibly empty.
    std::vector<std::string> scopes;
    /// If the commit is breaking, the text describing the breaking change
    std::optional<std::string> breaking;
    /// The commit's trailers, with footers parsed from the message body merged over them
    trailer_map footers;

    bool has_scope(std::string_view scope) const noexcept;

    bool operator==(const conventional_commit&) const = default;
};

/**
 * @brief Parse the Conventional Commits information from a commit.
 *
 * This never fails: A commit message that does not follow the convention produces a result
 * with no type and no scopes, and the full summary as its description.
 */
conventional_commit conventional(const commit&);

}  // namespace tagver::git
