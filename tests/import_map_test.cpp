#include "errors.hpp"
#include "import_map.hpp"

#include <gtest/gtest.h>

namespace jsxform {
namespace {

TEST(ImportMapTest, ExactKeyBeatsPrefix) {
    ImportMap map({{"react", "/deps/react.js"}, {"react/", "/deps/react/"}}, {});

    EXPECT_EQ(map.resolve("react", "/app.jsx").value(), "/deps/react.js");
    EXPECT_EQ(map.resolve("react/jsx-runtime", "/app.jsx").value(), "/deps/react/jsx-runtime");
    EXPECT_FALSE(map.resolve("preact", "/app.jsx").has_value());
}

TEST(ImportMapTest, LongestPrefixWins) {
    ImportMap map({{"lib/", "/a/"}, {"lib/util/", "/b/"}}, {});

    EXPECT_EQ(map.resolve("lib/util/x.js", "/app.js").value(), "/b/x.js");
    EXPECT_EQ(map.resolve("lib/y.js", "/app.js").value(), "/a/y.js");
}

TEST(ImportMapTest, ScopeOverridesTopLevel) {
    ImportMap map({{"foo", "/deps/foo.js"}},
                  {{"/legacy/", {{"foo", "/deps/foo-1.0.js"}}}});

    EXPECT_EQ(map.resolve("foo", "/legacy/page.js").value(), "/deps/foo-1.0.js");
    EXPECT_EQ(map.resolve("foo", "/src/page.js").value(), "/deps/foo.js");
}

TEST(ImportMapTest, ScopeFallsBackToTopLevel) {
    ImportMap map({{"foo", "/deps/foo.js"}, {"bar", "/deps/bar.js"}},
                  {{"/legacy/", {{"foo", "/deps/foo-1.0.js"}}}});

    EXPECT_EQ(map.resolve("bar", "/legacy/page.js").value(), "/deps/bar.js");
}

TEST(ImportMapTest, ScopeMatchIsSegmentAligned) {
    ImportMap map({}, {{"/vendor", {{"foo", "/v/foo.js"}}}});

    EXPECT_EQ(map.resolve("foo", "/vendor/x.js").value(), "/v/foo.js");
    EXPECT_FALSE(map.resolve("foo", "/vendor2/x.js").has_value());
}

TEST(ImportMapTest, MalformedTargetIsNoMatch) {
    ImportMap map({{"bad", "has space"}}, {});

    std::string debug;
    EXPECT_FALSE(map.resolve("bad", "/app.js", &debug).has_value());
    EXPECT_NE(debug.find("malformed"), std::string::npos);
}

TEST(ImportMapTest, RejectsInvalidEntries) {
    EXPECT_THROW(ImportMap({{"", "/x.js"}}, {}), ConfigError);
    EXPECT_THROW(ImportMap({{"a", ""}}, {}), ConfigError);
    EXPECT_THROW(ImportMap({{"a", "/x.js"}, {"a", "/y.js"}}, {}), ConfigError);
    EXPECT_THROW(ImportMap({{"lib/", "/lib"}}, {}), ConfigError);
    EXPECT_THROW(ImportMap({}, {{"", {{"a", "/x.js"}}}}), ConfigError);
    EXPECT_THROW(ImportMap({}, {{"/s/", {}}}), ConfigError);
    EXPECT_THROW(ImportMap({{"a", "/x.js"}}, {{"/s/", {{"a", "/x.js"}}}}), ConfigError);
}

TEST(ImportMapTest, ParsesJsonDocument) {
    auto map = ImportMap::parse(R"({
        "imports": {"react": "https://esm.sh/react@18", "utils/": ["", "/src/utils/"]},
        "scopes": {"/old/": {"react": "https://esm.sh/react@16"}}
    })");

    EXPECT_EQ(map.resolve("react", "/app.js").value(), "https://esm.sh/react@18");
    EXPECT_EQ(map.resolve("utils/a.js", "/app.js").value(), "/src/utils/a.js");
    EXPECT_EQ(map.resolve("react", "/old/app.js").value(), "https://esm.sh/react@16");
}

TEST(ImportMapTest, JsonRejectsDuplicateKeys) {
    EXPECT_THROW((void)ImportMap::parse(R"({"imports": {"foo": "/a.js", "foo": "/b.js"}})"), ConfigError);
}

TEST(ImportMapTest, JsonRejectsUnknownFieldsAndBadTypes) {
    EXPECT_THROW((void)ImportMap::parse(R"({"import": {}})"), ConfigError);
    EXPECT_THROW((void)ImportMap::parse(R"({"imports": {"a": 1}})"), ConfigError);
    EXPECT_THROW((void)ImportMap::parse(R"({"imports": []})"), ConfigError);
    EXPECT_THROW((void)ImportMap::parse("{"), ConfigError);
}

TEST(ImportMapTest, WellFormedSpecifiers) {
    EXPECT_TRUE(ImportMap::is_well_formed_specifier("https://esm.sh/react"));
    EXPECT_TRUE(ImportMap::is_well_formed_specifier("/deps/a.js"));
    EXPECT_FALSE(ImportMap::is_well_formed_specifier(""));
    EXPECT_FALSE(ImportMap::is_well_formed_specifier("1http:x"));
    EXPECT_FALSE(ImportMap::is_well_formed_specifier("a\\b"));
}

}  // namespace
}  // namespace jsxform
