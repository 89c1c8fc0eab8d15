#pragma once

#include "./format.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagver::git {

struct user {
    std::string name;
    std::string email;

    bool operator==(const user&) const = default;
};

/**
 * @brief An ordered mapping of trailer keys to values. Setting an existing key replaces its value
 * in-place.
 */
class trailer_map {
    std::vector<std::pair<std::string, std::string>> _items;

public:
    void set(std::string key, std::string value);

    [[nodiscard]] const std::string* find(std::string_view key) const noexcept;

    [[nodiscard]] bool        empty() const noexcept { return _items.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return _items.size(); }

    auto begin() const noexcept { return _items.begin(); }
    auto end() const noexcept { return _items.end(); }

    bool operator==(const trailer_map&) const = default;
};

struct commit_ref {
    std::string hash;
    std::string short_hash;

    bool operator==(const commit_ref&) const = default;
};

struct commit {
    std::string               hash;
    std::string               short_hash;
    std::optional<commit_ref> parent;
    user                      author;
    user                      committer;
    std::string               summary;
    std::optional<std::string> body;
    trailer_map               trailers;

    bool operator==(const commit&) const = default;
};

struct tag {
    std::string                name;
    git::commit                commit;
    std::optional<user>        tagger;
    std::optional<std::string> subject;
    std::optional<std::string> body;
    trailer_map                trailers;
};

/**
 * @brief The descriptor of the `git log` output from which commits are decoded
 */
const format_descriptor& commit_format();

/**
 * @brief The descriptor of the `git tag --list` output from which tags are decoded.
 *
 * Only the hash of a tag's commit is decoded. The rest of the commit must be looked up separately.
 */
const format_descriptor& tag_format();

commit commit_from_record(const record&);
tag    tag_from_record(const record&);

/**
 * @brief Parse a block of `Key: value` lines. An empty block yields no value.
 */
std::optional<field_value> parse_trailers(std::string_view block);

/// Precedes the anchor that ends a message body in the raw text emitted by git
inline constexpr std::string_view anchor_mark{"\0", 1};

/**
 * @brief Obtain a message body from raw text of the form `<body><mark><anchor><trailers>`, where
 * the anchor is the value of the sibling found at the given path of keys.
 *
 * The trailers are removed from the end of the body text, as git includes them in both places.
 */
field_transform body_before_anchor(std::vector<std::string> anchor_path);

}  // namespace tagver::git
