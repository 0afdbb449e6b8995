#include "jsx_lowering.hpp"
#include "syntax_engine.hpp"
#include "transform.hpp"

#include <gtest/gtest.h>

namespace jsxform {
namespace {

std::string lower(std::string_view source, TargetLevel target = TargetLevel::ES2020) {
    BuiltinSyntaxEngine engine;
    Transformer transformer(engine);

    TransformRequest request;
    request.filename = "/app.jsx";
    request.source_text = std::string(source);
    request.options.is_dev = false;
    request.options.target = target;
    return transformer.transform(request).output.code;
}

TEST(JsxLoweringTest, EmptyIntrinsicElement) {
    EXPECT_EQ(lower("const a = <div />;"), "const a = React.createElement(\"div\", null);");
}

TEST(JsxLoweringTest, AttributesAndChildren) {
    EXPECT_EQ(lower("const a = <div className=\"x\">hi {name}</div>;"),
              "const a = React.createElement(\"div\", { className: \"x\" }, \"hi \", name);");
}

TEST(JsxLoweringTest, ComponentTagsAndBooleanAttributes) {
    EXPECT_EQ(lower("const a = <App.Item x={1} disabled />;"),
              "const a = React.createElement(App.Item, { x: 1, disabled: true });");
}

TEST(JsxLoweringTest, DashedNamesAreQuoted) {
    EXPECT_EQ(lower("const a = <my-el data-id=\"1\" />;"),
              "const a = React.createElement(\"my-el\", { \"data-id\": \"1\" });");
}

TEST(JsxLoweringTest, ObjectSpreadFromEs2018) {
    EXPECT_EQ(lower("const a = <div {...p} a=\"1\" />;", TargetLevel::ES2018),
              "const a = React.createElement(\"div\", { ...p, a: \"1\" });");
}

TEST(JsxLoweringTest, ObjectAssignBeforeEs2018) {
    EXPECT_EQ(lower("const a = <div {...p} a=\"1\" />;", TargetLevel::ES2017),
              "const a = React.createElement(\"div\", Object.assign({}, p, { a: \"1\" }));");
}

TEST(JsxLoweringTest, FragmentsAndNesting) {
    EXPECT_EQ(lower("const a = <><b>x</b></>;"),
              "const a = React.createElement(React.Fragment, null, React.createElement(\"b\", null, \"x\"));");
}

TEST(JsxLoweringTest, ElementAsAttributeValue) {
    EXPECT_EQ(lower("const a = <A icon=<B /> />;"),
              "const a = React.createElement(A, { icon: React.createElement(B, null) });");
}

TEST(JsxLoweringTest, MultilineTextCollapses) {
    EXPECT_EQ(lower("const a = <p>\n  Hello\n  world\n</p>;"),
              "const a = React.createElement(\"p\", null, \"Hello world\");");
}

TEST(JsxLoweringTest, ExpressionChildren) {
    EXPECT_EQ(lower("const a = <p>{a}{b}{/* gone */}{...rest}</p>;"),
              "const a = React.createElement(\"p\", null, a, b, ...rest);");
}

TEST(JsxLoweringTest, JsxInsideExpressionContainers) {
    EXPECT_EQ(lower("const a = <ul>{items.map(i => <li>{i}</li>)}</ul>;"),
              "const a = React.createElement(\"ul\", null, items.map(i => React.createElement(\"li\", null, i)));");
}

TEST(JsxLoweringTest, TextIsQuotedAndDecoded) {
    EXPECT_EQ(lower("const a = <p>say \"hi\" &amp; go</p>;"),
              "const a = React.createElement(\"p\", null, \"say \\\"hi\\\" & go\");");
}

TEST(JsxLoweringTest, PragmaOverridesFactory) {
    EXPECT_EQ(lower("/** @jsx h */\nconst a = <div />;"),
              "/** @jsx h */\nconst a = h(\"div\", null);");
}

TEST(JsxLoweringTest, ConfiguredFactories) {
    BuiltinSyntaxEngine engine;
    Transformer transformer(engine);

    TransformRequest request;
    request.filename = "/app.jsx";
    request.source_text = "const a = <><i /></>;";
    request.options.is_dev = false;
    request.options.jsx_factory = "h";
    request.options.jsx_fragment_factory = "Fragment";
    EXPECT_EQ(transformer.transform(request).output.code,
              "const a = h(Fragment, null, h(\"i\", null));");
}

TEST(JsxLoweringTest, DecodeEntities) {
    EXPECT_EQ(JsxLowering::decode_entities("&lt;a&gt; &amp;&#65;&#x42; &bogus; &"), "<a> &AB &bogus; &");
    EXPECT_EQ(JsxLowering::decode_entities("&nbsp;"), "\xC2\xA0");
    EXPECT_EQ(JsxLowering::decode_entities("&#x1F600;"), "\xF0\x9F\x98\x80");
}

TEST(JsxLoweringTest, CleanText) {
    EXPECT_EQ(JsxLowering::clean_text("  a  \n   b  "), "  a b  ");
    EXPECT_EQ(JsxLowering::clean_text("\n   \n"), "");
    EXPECT_EQ(JsxLowering::clean_text("one"), "one");
    EXPECT_EQ(JsxLowering::clean_text("\n\t x\n\n y \n"), "x y");
}

TEST(JsxLoweringTest, IntrinsicTags) {
    EXPECT_TRUE(JsxLowering::is_intrinsic_tag("div"));
    EXPECT_TRUE(JsxLowering::is_intrinsic_tag("my-el"));
    EXPECT_TRUE(JsxLowering::is_intrinsic_tag("svg:path"));
    EXPECT_FALSE(JsxLowering::is_intrinsic_tag("Div"));
    EXPECT_FALSE(JsxLowering::is_intrinsic_tag("a.b"));
}

}  // namespace
}  // namespace jsxform
