#include "errors.hpp"
#include "options.hpp"
#include "request.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace jsxform {
namespace {

TEST(RequestTest, ParsesFullRequest) {
    auto request = parse_request(R"({
        "filename": "/src/app.jsx",
        "importMap": {"imports": {"react": "https://esm.sh/react@18"}},
        "swcOptions": {"target": "ES2022", "jsxFactory": "h", "jsxFragmentFactory": "Fragment",
                       "isDev": false, "sourceMap": true},
        "sourceText": "export default 1;"
    })");

    EXPECT_EQ(request.filename, "/src/app.jsx");
    EXPECT_EQ(request.source_text, "export default 1;");
    EXPECT_EQ(request.import_map.resolve("react", "/src/app.jsx").value(), "https://esm.sh/react@18");
    EXPECT_EQ(request.options.target, TargetLevel::ES2022);
    EXPECT_EQ(request.options.jsx_factory, "h");
    EXPECT_EQ(request.options.jsx_fragment_factory, "Fragment");
    EXPECT_FALSE(request.options.is_dev);
    EXPECT_TRUE(request.options.source_map);
}

TEST(RequestTest, OptionalFieldsKeepDefaults) {
    auto request = parse_request(R"({"filename": "a.js", "sourceText": ""})");
    EXPECT_TRUE(request.import_map.empty());
    EXPECT_EQ(request.options.target, TargetLevel::ES2020);
    EXPECT_EQ(request.options.jsx_factory, "React.createElement");
    EXPECT_TRUE(request.options.is_dev);
    EXPECT_FALSE(request.options.source_map);
    EXPECT_FALSE(request.options.source_type.has_value());
}

TEST(RequestTest, SourceTypeOption) {
    auto options = [](const char* text) { return parse_swc_options(nlohmann::json::parse(text)); };

    EXPECT_EQ(options(R"({"sourceType": "tsx"})").source_type, SourceType::TSX);
    EXPECT_EQ(options(R"({"sourceType": "TS"})").source_type, SourceType::TS);
    EXPECT_THROW(options(R"({"sourceType": "coffee"})"), ConfigError);
    EXPECT_THROW(options(R"({"sourceType": 1})"), ConfigError);
}

TEST(RequestTest, RejectsMalformedRequests) {
    EXPECT_THROW((void)parse_request("not json"), ConfigError);
    EXPECT_THROW((void)parse_request("[]"), ConfigError);
    EXPECT_THROW((void)parse_request(R"({"sourceText": "x"})"), ConfigError);
    EXPECT_THROW((void)parse_request(R"({"filename": "", "sourceText": "x"})"), ConfigError);
    EXPECT_THROW((void)parse_request(R"({"filename": "a.js", "sourceText": 1})"), ConfigError);
    EXPECT_THROW((void)parse_request(R"({"filename": "a.js", "sourceText": "", "extra": 1})"), ConfigError);
    EXPECT_THROW((void)parse_request(R"({"filename": "a.js", "filename": "b.js", "sourceText": ""})"), ConfigError);
}

TEST(RequestTest, RejectsDuplicateImportMapKeys) {
    EXPECT_THROW((void)parse_request(R"({"filename": "a.js", "sourceText": "",
                                  "importMap": {"imports": {"foo": "/a.js", "foo": "/b.js"}}})"),
                 ConfigError);
}

TEST(RequestTest, RejectsBadOptions) {
    auto options = [](const char* text) { return parse_swc_options(nlohmann::json::parse(text)); };

    EXPECT_THROW(options(R"({"target": "es5"})"), ConfigError);
    EXPECT_THROW(options(R"({"target": "es2099"})"), ConfigError);
    EXPECT_THROW(options(R"({"target": 2020})"), ConfigError);
    EXPECT_THROW(options(R"({"isDev": "yes"})"), ConfigError);
    EXPECT_THROW(options(R"({"jsxFactory": "1h"})"), ConfigError);
    EXPECT_THROW(options(R"({"minify": true})"), ConfigError);
    EXPECT_THROW(options("[]"), ConfigError);
    EXPECT_NO_THROW(options("null"));
}

TEST(RequestTest, EncodesResponse) {
    TransformResult result;
    result.output.code = "export {};";
    result.dependencies.push_back({"react", "https://esm.sh/react", false, false});
    result.dependencies.push_back({"lodash", "lodash", true, true});
    result.warnings.push_back({"x", "not mapped"});

    auto json = nlohmann::json::parse(encode_response(result));
    EXPECT_EQ(json["code"], "export {};");
    EXPECT_FALSE(json.contains("map"));
    ASSERT_EQ(json["deps"].size(), 2u);
    EXPECT_EQ(json["deps"][0]["resolved"], "https://esm.sh/react");
    EXPECT_FALSE(json["deps"][0].contains("pending"));
    EXPECT_EQ(json["deps"][1]["isDynamic"], true);
    EXPECT_EQ(json["deps"][1]["pending"], true);
    EXPECT_EQ(json["warnings"][0]["message"], "not mapped");

    result.output.map = "{}";
    EXPECT_TRUE(nlohmann::json::parse(encode_response(result)).contains("map"));
}

TEST(RequestTest, EncodesErrors) {
    auto config = nlohmann::json::parse(encode_error("ConfigError", "bad target"));
    EXPECT_EQ(config["error"], "ConfigError");
    EXPECT_EQ(config["message"], "bad target");

    auto parse = nlohmann::json::parse(encode_error(ParseError("unexpected ')'", 3, 7)));
    EXPECT_EQ(parse["error"], "ParseError");
    EXPECT_EQ(parse["message"], "unexpected ')'");
    EXPECT_EQ(parse["line"], 3);
    EXPECT_EQ(parse["column"], 7);
}

TEST(OptionsTest, TargetNames) {
    EXPECT_EQ(parse_target_level("esnext"), TargetLevel::ESNext);
    EXPECT_EQ(parse_target_level("ES2016"), TargetLevel::ES2016);
    EXPECT_FALSE(parse_target_level("es7").has_value());
    EXPECT_EQ(to_string(TargetLevel::ES2021), "es2021");
    EXPECT_FALSE(is_supported_target(TargetLevel::ES5));
    EXPECT_TRUE(is_supported_target(TargetLevel::ES2015));
}

TEST(OptionsTest, SourceTypeFromFilename) {
    EXPECT_EQ(source_type_for("/src/app.jsx"), SourceType::JSX);
    EXPECT_EQ(source_type_for("/src/app.tsx"), SourceType::TSX);
    EXPECT_EQ(source_type_for("/src/util.ts"), SourceType::TS);
    EXPECT_EQ(source_type_for("/src/util.MTS?v=2"), SourceType::TS);
    EXPECT_EQ(source_type_for("/src/main.js"), SourceType::JS);
    EXPECT_EQ(source_type_for("/src.ts/main"), SourceType::JS);
    EXPECT_EQ(parse_source_type("jsx"), SourceType::JSX);
    EXPECT_FALSE(parse_source_type("flow").has_value());
    EXPECT_EQ(to_string(SourceType::TSX), "tsx");
}

TEST(OptionsTest, FactoryNames) {
    EXPECT_TRUE(is_valid_factory_name("h"));
    EXPECT_TRUE(is_valid_factory_name("preact.h"));
    EXPECT_TRUE(is_valid_factory_name("$jsx._create"));
    EXPECT_FALSE(is_valid_factory_name(""));
    EXPECT_FALSE(is_valid_factory_name("a..b"));
    EXPECT_FALSE(is_valid_factory_name("a.b."));
    EXPECT_FALSE(is_valid_factory_name("h()"));
}

}  // namespace
}  // namespace jsxform
