#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tagver::git {

/**
 * @brief The single character that a field may emit in place of a value to mark itself absent.
 */
inline constexpr std::string_view absent_sentinel{"\0", 1};

struct field_value;

/**
 * @brief A decoded object: an ordered sequence of named values, each either a string or a nested
 * record.
 *
 * Fields that decoded as absent do not appear in the record at all.
 */
class record {
    std::vector<std::pair<std::string, field_value>> _fields;

public:
    record() = default;

    /// Set the value of the named field, replacing an existing value in-place
    void set(std::string key, field_value value);

    [[nodiscard]] const field_value* find(std::string_view key) const noexcept;
    [[nodiscard]] const std::string* string_at(std::string_view key) const noexcept;
    [[nodiscard]] const record*      record_at(std::string_view key) const noexcept;

    [[nodiscard]] bool        empty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    using const_iterator = std::vector<std::pair<std::string, field_value>>::const_iterator;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    friend bool operator==(const record&, const record&) noexcept;
};

struct field_value {
    std::variant<std::string, record> value;

    [[nodiscard]] const std::string* as_string() const noexcept {
        return std::get_if<std::string>(&value);
    }
    [[nodiscard]] const record* as_record() const noexcept { return std::get_if<record>(&value); }

    bool operator==(const field_value&) const noexcept = default;
};

inline bool        record::empty() const noexcept { return _fields.empty(); }
inline std::size_t record::size() const noexcept { return _fields.size(); }

inline record::const_iterator record::begin() const noexcept { return _fields.begin(); }
inline record::const_iterator record::end() const noexcept { return _fields.end(); }

/**
 * @brief Convert the raw text of a field into its final value.
 *
 * The second argument is the record of the siblings that were decoded before this field within
 * the same enclosing object. Returning nullopt marks the field absent.
 */
using field_transform
    = std::function<std::optional<field_value>(std::string_view raw, const record& siblings)>;

/// A field that is not requested from git, and does not appear in the decoded record
struct skip_field {};

/// A leaf field, expanded by git from a single format placeholder
struct string_field {
    std::string     format;
    bool            optional = false;
    field_transform transform{};
};

struct named_field;

/// An object of ordered named child fields
struct object_field {
    std::vector<named_field> fields;
    bool                     optional = false;
};

using field_descriptor = std::variant<skip_field, string_field, object_field>;

struct named_field {
    std::string      name;
    field_descriptor field;
};

/**
 * @brief Describes a complete record that git will emit for each object that it lists.
 *
 * The delimiter is a placeholder that expands to a full object hash, and is used to wrap each
 * record and to separate every field of a record.
 */
struct format_descriptor {
    std::string  delimiter;
    object_field root;
};

/**
 * @brief Obtain the format placeholders of every leaf of the given descriptor, depth-first.
 */
std::vector<std::string> leaf_formats(const field_descriptor&);

/**
 * @brief Generate the pretty-format string that should be given to git for the descriptor.
 */
std::string format_arg(const format_descriptor&);

/**
 * @brief Decode the output of git that was generated using the `format_arg()` of the descriptor.
 *
 * @throws decode_error if the output does not have the expected structure.
 */
std::vector<record> decode(const format_descriptor&, std::string_view output);

}  // namespace tagver::git
