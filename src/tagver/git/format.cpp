#include "./format.hpp"

#include "./error.hpp"

#include <tagver/error/on_error.hpp>
#include <tagver/util/log.hpp>
#include <tagver/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>
#include <neo/overload.hpp>

#include <algorithm>

using namespace tagver;
using namespace tagver::git;

void record::set(std::string key, field_value value) {
    auto it = std::find_if(_fields.begin(), _fields.end(), [&](auto& pair) {
        return pair.first == key;
    });
    if (it != _fields.end()) {
        it->second = std::move(value);
    } else {
        _fields.emplace_back(std::move(key), std::move(value));
    }
}

const field_value* record::find(std::string_view key) const noexcept {
    auto it = std::find_if(_fields.begin(), _fields.end(), [&](auto& pair) {
        return pair.first == key;
    });
    if (it == _fields.end()) {
        return nullptr;
    }
    return &it->second;
}

const std::string* record::string_at(std::string_view key) const noexcept {
    auto val = find(key);
    return val ? val->as_string() : nullptr;
}

const record* record::record_at(std::string_view key) const noexcept {
    auto val = find(key);
    return val ? val->as_record() : nullptr;
}

bool tagver::git::operator==(const record& lhs, const record& rhs) noexcept {
    return lhs._fields == rhs._fields;
}

namespace {

void collect_formats(const field_descriptor& desc, std::vector<std::string>& out) {
    std::visit(neo::overload{
                   [&](const string_field& str) { out.push_back(str.format); },
                   [&](const object_field& obj) {
                       for (auto& child : obj.fields) {
                           collect_formats(child.field, out);
                       }
                   },
                   [](const skip_field&) {},
               },
               desc);
}

/// Whether a decoded value counts as "nothing" when deciding to collapse an optional object
bool is_vacant(const field_value& val) noexcept {
    if (auto str = val.as_string()) {
        return *str == absent_sentinel;
    }
    return val.as_record()->empty();
}

/**
 * Consumes the split parts of a single record in the order that the leaves were emitted.
 */
struct record_decoder {
    const std::vector<std::string_view>& parts;
    std::size_t                          next_part = 0;

    std::string_view pop() {
        if (next_part >= parts.size()) {
            BOOST_LEAF_THROW_EXCEPTION(decode_error("Fewer fields in git output than expected"));
        }
        return parts[next_part++];
    }

    std::optional<field_value> decode_field(const field_descriptor& desc, const record& siblings) {
        return std::visit([&](const auto& field) { return decode_one(field, siblings); }, desc);
    }

    std::optional<field_value> decode_one(const skip_field&, const record&) { return std::nullopt; }

    std::optional<field_value> decode_one(const string_field& field, const record& siblings) {
        auto raw = pop();
        if (field.optional && raw == absent_sentinel) {
            return std::nullopt;
        }
        if (field.transform) {
            return field.transform(raw, siblings);
        }
        return field_value{std::string(raw)};
    }

    std::optional<field_value> decode_one(const object_field& field, const record&) {
        record result;
        for (auto& child : field.fields) {
            auto value = decode_field(child.field, result);
            if (value.has_value()) {
                result.set(child.name, std::move(*value));
            }
        }
        if (field.optional
            && std::all_of(result.begin(), result.end(), [](auto& pair) {
                   return is_vacant(pair.second);
               })) {
            return std::nullopt;
        }
        return field_value{std::move(result)};
    }
};

}  // namespace

std::vector<std::string> git::leaf_formats(const field_descriptor& desc) {
    std::vector<std::string> ret;
    collect_formats(desc, ret);
    return ret;
}

std::string git::format_arg(const format_descriptor& desc) {
    auto leaves = leaf_formats(desc.root);
    return fmt::format("{0}!{1}{0}", desc.delimiter, joinstr(desc.delimiter, leaves));
}

std::vector<record> git::decode(const format_descriptor& desc, std::string_view output) {
    TAGVER_E_SCOPE(e_git_output{std::string(output)});
    const auto n_fields = leaf_formats(desc.root).size();

    std::vector<record>           ret;
    std::vector<std::string_view> parts;
    auto                          remaining = output;
    while (!remaining.empty()) {
        auto bang = remaining.find('!');
        if (bang == remaining.npos || bang == 0) {
            BOOST_LEAF_THROW_EXCEPTION(decode_error("Missing record delimiter in git output"));
        }
        auto delim = remaining.substr(0, bang);
        remaining.remove_prefix(bang + 1);

        parts.clear();
        for (std::size_t i = 0; i < n_fields; ++i) {
            auto pos = remaining.find(delim);
            if (pos == remaining.npos) {
                BOOST_LEAF_THROW_EXCEPTION(
                    decode_error(fmt::format("Truncated record in git output: Expected {} fields, "
                                             "but only found {}",
                                             n_fields,
                                             i)));
            }
            parts.push_back(remaining.substr(0, pos));
            remaining.remove_prefix(pos + delim.size());
        }

        record_decoder dec{parts};
        auto           rec = dec.decode_one(desc.root, record{});
        if (!rec.has_value() || !rec->as_record()) {
            BOOST_LEAF_THROW_EXCEPTION(decode_error("Git output record decoded to nothing"));
        }
        ret.push_back(std::get<record>(std::move(rec->value)));
        remaining = trim_left(remaining);
    }
    tagver_log(trace, "Decoded {} record(s) from git output", ret.size());
    return ret;
}
