#include "./format.hpp"

#include "./error.hpp"

#include <tagver/util/string.hpp>

#include <catch2/catch.hpp>

using namespace tagver::git;

namespace {

const std::string sentinel{absent_sentinel};

/// Produce the text that git would emit for one record with the given leaf values
std::string emit_record(std::string_view hash, const std::vector<std::string>& values) {
    std::string delim = "<" + std::string(hash) + ">";
    std::string out   = delim + "!";
    for (auto& v : values) {
        out += v;
        out += delim;
    }
    return out + "\n";
}

field_value str(std::string s) { return field_value{std::move(s)}; }

record make_record(std::vector<std::pair<std::string, field_value>> fields) {
    record ret;
    for (auto& [key, value] : fields) {
        ret.set(key, std::move(value));
    }
    return ret;
}

field_value obj(std::vector<std::pair<std::string, field_value>> fields) {
    return field_value{make_record(std::move(fields))};
}

struct nested_case {
    std::string              name;
    object_field             root;
    std::vector<std::string> values;
    record                   expected;
};

std::vector<nested_case> nested_cases() {
    return {
        {
            "An object within an object",
            {{
                {"id", string_field{"%H"}},
                {"outer",
                 object_field{{
                     {"a", string_field{"%a"}},
                     {"inner",
                      object_field{{
                          {"b", string_field{"%b"}},
                          {"c", string_field{"%c"}},
                      }}},
                 }}},
            }},
            {"1", "A", "B", "C"},
            make_record({
                {"id", str("1")},
                {"outer", obj({{"a", str("A")}, {"inner", obj({{"b", str("B")}, {"c", str("C")}})}})},
            }),
        },
        {
            "An optional object collapses within a required object",
            {{
                {"id", string_field{"%H"}},
                {"outer",
                 object_field{{
                     {"inner",
                      object_field{
                          {
                              {"b", string_field{"%b", true}},
                              {"c", string_field{"%c", true}},
                          },
                          true,
                      }},
                     {"d", string_field{"%d"}},
                 }}},
            }},
            {"1", sentinel, sentinel, "D"},
            make_record({{"id", str("1")}, {"outer", obj({{"d", str("D")}})}}),
        },
        {
            "A required object is kept when all of its children are absent",
            {{
                {"id", string_field{"%H"}},
                {"outer",
                 object_field{{
                     {"inner", object_field{{{"b", string_field{"%b", true}}}, true}},
                 }}},
            }},
            {"1", sentinel},
            make_record({{"id", str("1")}, {"outer", obj({})}}),
        },
        {
            "Optional objects collapse through several levels",
            {{
                {"id", string_field{"%H"}},
                {"l1",
                 object_field{
                     {{"l2",
                       object_field{
                           {{"l3", object_field{{{"x", string_field{"%x", true}}}, true}}},
                           true,
                       }}},
                     true,
                 }},
                {"after", string_field{"%y"}},
            }},
            {"1", sentinel, "Y"},
            make_record({{"id", str("1")}, {"after", str("Y")}}),
        },
        {
            "Skipped fields at depth",
            {{
                {"id", string_field{"%H"}},
                {"outer",
                 object_field{{
                     {"skipped", skip_field{}},
                     {"a", string_field{"%a"}},
                     {"inner",
                      object_field{{
                          {"skipped", skip_field{}},
                          {"b", string_field{"%b"}},
                          {"also-skipped", skip_field{}},
                      }}},
                 }}},
            }},
            {"1", "A", "B"},
            make_record({
                {"id", str("1")},
                {"outer", obj({{"a", str("A")}, {"inner", obj({{"b", str("B")}})}})},
            }),
        },
        {
            "A partially present optional object at depth",
            {{
                {"outer",
                 object_field{{
                     {"inner",
                      object_field{
                          {
                              {"b", string_field{"%b", true}},
                              {"c", string_field{"%c", true}},
                          },
                          true,
                      }},
                     {"e", string_field{"%e", true}},
                 }}},
            }},
            {"B", sentinel, ""},
            make_record({{"outer", obj({{"inner", obj({{"b", str("B")}})}, {"e", str("")}})}}),
        },
    };
}

const format_descriptor person_format{
    .delimiter = "<%H>",
    .root      = {{
        {"name", string_field{"%an"}},
        {"email", string_field{"%ae"}},
    }},
};

}  // namespace

TEST_CASE("Generate a format argument") {
    CHECK(format_arg(person_format) == "<%H>!%an<%H>%ae<%H>");

    format_descriptor nested{
        .delimiter = "<%(objectname)>",
        .root      = {{
            {"name", string_field{"%(refname:short)"}},
            {"ignored", skip_field{}},
            {"inner",
             object_field{{
                 {"a", string_field{"%(a)"}},
                 {"b", string_field{"%(b)"}},
             }}},
        }},
    };
    CHECK(leaf_formats(nested.root).size() == 3);
    CHECK(format_arg(nested)
          == "<%(objectname)>!%(refname:short)<%(objectname)>%(a)<%(objectname)>%(b)<%("
             "objectname)>");
}

TEST_CASE("Decode flat records") {
    auto out = emit_record("abc", {"Joe", "joe@example.com"})
        + emit_record("def", {"Jane", "jane@example.com"});
    auto recs = decode(person_format, out);
    REQUIRE(recs.size() == 2);
    CHECK(*recs[0].string_at("name") == "Joe");
    CHECK(*recs[0].string_at("email") == "joe@example.com");
    CHECK(*recs[1].string_at("name") == "Jane");
    CHECK(*recs[1].string_at("email") == "jane@example.com");
}

TEST_CASE("Decode empty output") {
    CHECK(decode(person_format, "").empty());
}

TEST_CASE("Values may contain text that resembles the delimiter") {
    auto out  = emit_record("abc", {"<def>!<ab", "a\nmultiline <c> value\n"});
    auto recs = decode(person_format, out);
    REQUIRE(recs.size() == 1);
    CHECK(*recs[0].string_at("name") == "<def>!<ab");
    CHECK(*recs[0].string_at("email") == "a\nmultiline <c> value\n");
}

TEST_CASE("Decode nested objects with optional fields") {
    format_descriptor fmt{
        .delimiter = "<%H>",
        .root      = {{
            {"hash", string_field{"%H"}},
            {"skipped", skip_field{}},
            {"parent",
             object_field{
                 {
                     {"hash", string_field{"%P", true}},
                     {"short", string_field{"%p", true}},
                 },
                 true,
             }},
            {"note", string_field{"%N", true}},
        }},
    };

    SECTION("All present") {
        auto recs = decode(fmt, emit_record("1234", {"1234", "5678", "56", "hello"}));
        REQUIRE(recs.size() == 1);
        auto& rec = recs[0];
        CHECK(rec.size() == 3);
        CHECK(*rec.string_at("hash") == "1234");
        CHECK(rec.find("skipped") == nullptr);
        auto parent = rec.record_at("parent");
        REQUIRE(parent);
        CHECK(*parent->string_at("hash") == "5678");
        CHECK(*parent->string_at("short") == "56");
        CHECK(*rec.string_at("note") == "hello");
    }

    SECTION("Absent leaves and a collapsed object") {
        auto recs = decode(fmt, emit_record("1234", {"1234", sentinel, sentinel, sentinel}));
        REQUIRE(recs.size() == 1);
        auto& rec = recs[0];
        CHECK(rec.size() == 1);
        CHECK(rec.find("parent") == nullptr);
        CHECK(rec.find("note") == nullptr);
    }

    SECTION("A partially present optional object is kept") {
        auto recs = decode(fmt, emit_record("1234", {"1234", "5678", sentinel, ""}));
        REQUIRE(recs.size() == 1);
        auto parent = recs[0].record_at("parent");
        REQUIRE(parent);
        CHECK(parent->size() == 1);
        CHECK(*parent->string_at("hash") == "5678");
        // An empty value is not the sentinel
        CHECK(*recs[0].string_at("note") == "");
    }
}

TEST_CASE("The sentinel is kept verbatim for required fields") {
    auto recs = decode(person_format, emit_record("1", {sentinel, "x"}));
    REQUIRE(recs.size() == 1);
    CHECK(*recs[0].string_at("name") == sentinel);
}

TEST_CASE("Transforms see earlier siblings") {
    format_descriptor fmt{
        .delimiter = "<%H>",
        .root      = {{
            {"hash", string_field{"%H"}},
            {"body",
             string_field{
                 "%b%H",
                 true,
                 [](std::string_view raw, const record& siblings) -> std::optional<field_value> {
                     auto hash = siblings.string_at("hash");
                     REQUIRE(hash);
                     auto pos = raw.rfind(*hash);
                     REQUIRE(pos != raw.npos);
                     auto body = tagver::trim_right(raw.substr(0, pos));
                     if (body.empty()) {
                         return std::nullopt;
                     }
                     return field_value{std::string(body)};
                 },
             }},
        }},
    };
    auto out  = emit_record("cafe", {"cafe", "Some body\n\ncafe"}) + emit_record("beef", {"beef", "beef"});
    auto recs = decode(fmt, out);
    REQUIRE(recs.size() == 2);
    CHECK(*recs[0].string_at("body") == "Some body");
    CHECK(recs[1].find("body") == nullptr);
}

TEST_CASE("Transforms may produce nested records") {
    format_descriptor fmt{
        .delimiter = "<%H>",
        .root      = {{
            {"pair",
             string_field{
                 "%x",
                 false,
                 [](std::string_view raw, const record&) -> std::optional<field_value> {
                     record r;
                     r.set("raw", field_value{std::string(raw)});
                     return field_value{std::move(r)};
                 },
             }},
        }},
    };
    auto recs = decode(fmt, emit_record("1", {"v"}));
    REQUIRE(recs.size() == 1);
    auto inner = recs[0].record_at("pair");
    REQUIRE(inner);
    CHECK(*inner->string_at("raw") == "v");
}

TEST_CASE("Reject malformed output") {
    CHECK_THROWS_AS(decode(person_format, "garbage"), decode_error);
    CHECK_THROWS_AS(decode(person_format, "!Joe<>x<>"), decode_error);
    CHECK_THROWS_AS(decode(person_format, "<a>!Joe<a>"), decode_error);
    CHECK_THROWS_AS(decode(person_format, emit_record("a", {"Joe", "x"}) + "junk"),
                    decode_error);
}

TEST_CASE("Nested records decode to their original values") {
    const auto cases = nested_cases();
    auto       idx   = GENERATE(range(std::size_t(0), std::size_t(6)));
    REQUIRE(idx < cases.size());
    auto& c = cases[idx];
    INFO(c.name);

    format_descriptor desc{.delimiter = "<%H>", .root = c.root};
    REQUIRE(leaf_formats(desc.root).size() == c.values.size());

    auto out  = emit_record("aaaa", c.values) + emit_record("bbbb", c.values);
    auto recs = decode(desc, out);
    REQUIRE(recs.size() == 2);
    CHECK(recs[0] == c.expected);
    CHECK(recs[1] == c.expected);
}
