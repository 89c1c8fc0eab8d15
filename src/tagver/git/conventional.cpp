#include "./conventional.hpp"

#include <tagver/util/string.hpp>

#include <ctre.hpp>

#include <algorithm>

using namespace tagver;
using namespace tagver::git;

namespace {

constexpr ctll::fixed_string SUMMARY_RE
    = R"(\s*(?:(?<type>[a-zA-Z]+)(?:\((?<scopes>[^()]*)\))?(?<bang>!?):\s*)?(?<description>\S.*))";

constexpr ctll::fixed_string COLON_FOOTER_RE = R"((?<key>BREAKING CHANGE|[\w\-]+):\s+(?<value>.*))";
constexpr ctll::fixed_string HASH_FOOTER_RE  = R"((?<key>[\w\-]+) #(?<value>.*))";

/**
 * Parse the final paragraph of the body as footer lines, if every line in that paragraph is a
 * footer. Otherwise returns nothing.
 */
std::optional<trailer_map> parse_footers(std::string_view body) {
    body          = trim_right(body);
    auto para_pos = body.rfind("\n\n");
    auto para     = para_pos == body.npos ? body : body.substr(para_pos + 2);

    trailer_map ret;
    for (auto& line_str : split_lines(para)) {
        std::string_view line = trim_right(line_str);
        if (trim(line).empty()) {
            continue;
        }
        if (auto colon = ctre::match<COLON_FOOTER_RE>(line)) {
            auto key = colon.get<"key">().to_view();
            ret.set(key == "BREAKING CHANGE" ? "BREAKING-CHANGE" : std::string(key),
                    std::string(trim(colon.get<"value">().to_view())));
        } else if (auto hash = ctre::match<HASH_FOOTER_RE>(line)) {
            ret.set(to_lower(hash.get<"key">().to_view()),
                    std::string(trim(hash.get<"value">().to_view())));
        } else {
            return std::nullopt;
        }
    }
    if (ret.empty()) {
        return std::nullopt;
    }
    return ret;
}

std::vector<std::string> parse_scopes(std::string_view scopes) {
    std::vector<std::string> ret;
    for (auto& part : split(scopes, ",")) {
        auto scope = trim(part);
        if (!scope.empty()) {
            ret.push_back(to_lower(scope));
        }
    }
    return ret;
}

}  // namespace

bool conventional_commit::has_scope(std::string_view scope) const noexcept {
    return std::find(scopes.begin(), scopes.end(), scope) != scopes.end();
}

conventional_commit git::conventional(const git::commit& c) {
    conventional_commit ret{.commit = c, .footers = c.trailers};
    if (c.body) {
        if (auto footers = parse_footers(*c.body)) {
            for (auto& [key, value] : *footers) {
                ret.footers.set(key, value);
            }
        }
    }

    bool bang = false;
    if (auto m = ctre::match<SUMMARY_RE>(c.summary)) {
        ret.description = std::string(m.get<"description">().to_view());
        if (auto type = m.get<"type">()) {
            ret.type = to_lower(trim(type.to_view()));
            ret.scopes = parse_scopes(m.get<"scopes">().to_view());
            bang       = !m.get<"bang">().to_view().empty();
        }
    } else {
        ret.description = std::string(trim_left(c.summary));
    }

    if (auto breaking = ret.footers.find("BREAKING-CHANGE")) {
        ret.breaking = *breaking;
    } else if (bang) {
        ret.breaking = ret.description;
    }
    return ret;
}
