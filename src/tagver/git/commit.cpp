#include "./commit.hpp"

#include "./error.hpp"

#include <tagver/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

#include <algorithm>

using namespace tagver;
using namespace tagver::git;

void trailer_map::set(std::string key, std::string value) {
    auto it = std::find_if(_items.begin(), _items.end(), [&](auto& pair) {
        return pair.first == key;
    });
    if (it != _items.end()) {
        it->second = std::move(value);
    } else {
        _items.emplace_back(std::move(key), std::move(value));
    }
}

const std::string* trailer_map::find(std::string_view key) const noexcept {
    auto it = std::find_if(_items.begin(), _items.end(), [&](auto& pair) {
        return pair.first == key;
    });
    return it == _items.end() ? nullptr : &it->second;
}

std::optional<field_value> git::parse_trailers(std::string_view block) {
    if (block.empty()) {
        return std::nullopt;
    }
    record ret;
    for (auto& line : split_lines(block)) {
        auto        sep = line.find(": ");
        std::string key{trim(std::string_view(line).substr(0, sep))};
        if (key.empty()) {
            continue;
        }
        std::string value;
        if (sep != line.npos) {
            value = std::string(trim(std::string_view(line).substr(sep + 2)));
        }
        ret.set(std::move(key), field_value{std::move(value)});
    }
    return field_value{std::move(ret)};
}

field_transform git::body_before_anchor(std::vector<std::string> anchor_path) {
    return [anchor_path = std::move(anchor_path)](std::string_view raw,
                                                  const record&    siblings)
               -> std::optional<field_value> {
        const record*      cur    = &siblings;
        const std::string* anchor = nullptr;
        for (auto it = anchor_path.begin(); cur && it != anchor_path.end(); ++it) {
            if (std::next(it) == anchor_path.end()) {
                anchor = cur->string_at(*it);
            } else {
                cur = cur->record_at(*it);
            }
        }
        if (!anchor || anchor->empty()) {
            BOOST_LEAF_THROW_EXCEPTION(
                decode_error(fmt::format("Message body has no anchor field '{}' to split upon",
                                         joinstr(".", anchor_path))));
        }
        // Messages cannot contain a NUL, so the marked anchor only ever appears where git put it
        const auto marked = std::string(anchor_mark) + *anchor;
        auto       pos    = raw.find(marked);
        if (pos == raw.npos) {
            BOOST_LEAF_THROW_EXCEPTION(
                decode_error(fmt::format("Message body is missing its anchor [{}]", *anchor)));
        }
        auto body     = trim_right(raw.substr(0, pos));
        auto trailers = trim_right(raw.substr(pos + marked.size()));
        if (!trailers.empty() && body.ends_with(trailers)) {
            body.remove_suffix(trailers.size());
            body = trim_right(body);
        }
        if (body.empty()) {
            return std::nullopt;
        }
        return field_value{std::string(body)};
    };
}

namespace {

std::optional<field_value> sentinel_if_empty(std::string_view raw, const record&) {
    if (raw.empty()) {
        return field_value{std::string(absent_sentinel)};
    }
    return field_value{std::string(raw)};
}

std::optional<field_value> trailers_transform(std::string_view raw, const record&) {
    return parse_trailers(raw);
}

const std::string& require_string(const record& rec, std::string_view key) {
    auto str = rec.string_at(key);
    if (!str) {
        BOOST_LEAF_THROW_EXCEPTION(
            decode_error(fmt::format("Missing required field '{}' in git output", key)));
    }
    return *str;
}

const record& require_record(const record& rec, std::string_view key) {
    auto r = rec.record_at(key);
    if (!r) {
        BOOST_LEAF_THROW_EXCEPTION(
            decode_error(fmt::format("Missing required object '{}' in git output", key)));
    }
    return *r;
}

std::optional<std::string> opt_string(const record& rec, std::string_view key) {
    auto str = rec.string_at(key);
    if (str) {
        return *str;
    }
    return std::nullopt;
}

user user_from_record(const record& rec) {
    return user{
        .name  = require_string(rec, "name"),
        .email = require_string(rec, "email"),
    };
}

trailer_map trailers_from_record(const record& rec) {
    trailer_map ret;
    if (auto trailers = rec.record_at("trailers")) {
        for (auto& [key, value] : *trailers) {
            if (auto str = value.as_string()) {
                ret.set(key, *str);
            }
        }
    }
    return ret;
}

}  // namespace

const format_descriptor& git::commit_format() {
    static const format_descriptor fmt{
        .delimiter = "<%H>",
        .root      = {{
            {"hash", string_field{"%H"}},
            {"short", string_field{"%h"}},
            {"parent",
             object_field{
                 {
                     {"hash", string_field{"%P", false, sentinel_if_empty}},
                     {"short", string_field{"%p", false, sentinel_if_empty}},
                 },
                 true,
             }},
            {"author",
             object_field{{
                 {"name", string_field{"%an"}},
                 {"email", string_field{"%ae"}},
             }}},
            {"committer",
             object_field{{
                 {"name", string_field{"%cn"}},
                 {"email", string_field{"%ce"}},
             }}},
            {"summary", string_field{"%s"}},
            {"body", string_field{"%b%x00%H%(trailers)", true, body_before_anchor({"hash"})}},
            {"trailers",
             string_field{"%(trailers:only=true,unfold=true,key_value_separator=: )",
                          true,
                          trailers_transform}},
        }},
    };
    return fmt;
}

const format_descriptor& git::tag_format() {
    static const format_descriptor fmt{
        .delimiter = "<%(objectname)>",
        .root      = {{
            {"name", string_field{"%(refname:short)"}},
            {"commit",
             object_field{{
                 {"hash", string_field{"%(if)%(object)%(then)%(object)%(else)%(objectname)%(end)"}},
                 {"short", skip_field{}},
                 {"summary", skip_field{}},
             }}},
            {"tagger",
             object_field{
                 {
                     {"name",
                      string_field{"%(if)%(object)%(then)%(taggername)%(else)%00%(end)", true}},
                     {"email",
                      string_field{"%(if)%(object)%(then)%(taggeremail:trim)%(else)%00%(end)",
                                   true}},
                 },
                 true,
             }},
            {"subject", string_field{"%(if)%(object)%(then)%(subject)%(else)%00%(end)", true}},
            {"body",
             string_field{"%(if)%(object)%(then)%(body)%00%(object)%(trailers)%(else)%00%(end)",
                          true,
                          body_before_anchor({"commit", "hash"})}},
            {"trailers",
             string_field{"%(if)%(trailers)%(then)%(trailers)%(else)%00%(end)",
                          true,
                          trailers_transform}},
        }},
    };
    return fmt;
}

commit git::commit_from_record(const record& rec) {
    commit ret{
        .hash       = require_string(rec, "hash"),
        .short_hash = require_string(rec, "short"),
        .author     = user_from_record(require_record(rec, "author")),
        .committer  = user_from_record(require_record(rec, "committer")),
        .summary    = require_string(rec, "summary"),
        .body       = opt_string(rec, "body"),
        .trailers   = trailers_from_record(rec),
    };
    if (auto parent = rec.record_at("parent")) {
        // Merge commits list every parent. Only the first parent is kept.
        auto first_word = [](std::string_view s) { return std::string(s.substr(0, s.find(' '))); };
        ret.parent      = commit_ref{
            .hash       = first_word(require_string(*parent, "hash")),
            .short_hash = first_word(require_string(*parent, "short")),
        };
    }
    return ret;
}

tag git::tag_from_record(const record& rec) {
    tag ret{
        .name     = require_string(rec, "name"),
        .subject  = opt_string(rec, "subject"),
        .body     = opt_string(rec, "body"),
        .trailers = trailers_from_record(rec),
    };
    ret.commit.hash = require_string(require_record(rec, "commit"), "hash");
    if (auto tagger = rec.record_at("tagger")) {
        ret.tagger = user_from_record(*tagger);
    }
    return ret;
}
