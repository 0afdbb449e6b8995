#include "errors.hpp"
#include "parser.hpp"

#include <gtest/gtest.h>

namespace jsxform {
namespace {

Module parse(std::string_view source, TargetLevel target = TargetLevel::ES2020) {
    Parser parser(source, target, SourceType::JSX);
    return parser.parse("/src/app.jsx");
}

Module parse_ts(std::string_view source, SourceType type = SourceType::TSX) {
    Parser parser(source, TargetLevel::ES2020, type);
    return parser.parse("/src/app.tsx");
}

// Token texts of a module joined with their leading trivia
std::string tokens_text(const Module& module) {
    std::string text;
    for (const auto& statement : module.body) {
        for (const auto& node : statement.items) {
            text += node.token.leading;
            text += node.is_jsx() ? std::string("<jsx>") : node.token.text;
        }
    }
    return text + module.trailing;
}

const Token* find_token(const Module& module, TokenKind kind) {
    for (const auto& statement : module.body) {
        for (const auto& node : statement.items) {
            if (node.is_token() && node.token.kind == kind) {
                return &node.token;
            }
        }
    }
    return nullptr;
}

std::vector<const Token*> specifiers(const Module& module) {
    std::vector<const Token*> found;
    for (const auto& statement : module.body) {
        for (const auto& node : statement.items) {
            if (node.is_token() && node.token.role != SpecifierRole::None) {
                found.push_back(&node.token);
            }
        }
    }
    return found;
}

const JsxElement* first_element(const Module& module) {
    for (const auto& statement : module.body) {
        for (const auto& node : statement.items) {
            if (node.is_jsx()) {
                return node.jsx.get();
            }
        }
    }
    return nullptr;
}

TEST(ParserTest, SplitsStatementsWithoutSemicolons) {
    auto module = parse("const a = 1\nlet b = a\n++b\nfoo()");
    ASSERT_EQ(module.body.size(), 4u);
    EXPECT_EQ(module.body[0].kind, StatementKind::Variable);
    EXPECT_EQ(module.body[0].name, "a");
    EXPECT_EQ(module.body[1].name, "b");
    EXPECT_EQ(module.body[3].kind, StatementKind::Other);
}

TEST(ParserTest, ContinuesAcrossLines) {
    auto module = parse("a = b\n(c)\nx = y +\nz");
    EXPECT_EQ(module.body.size(), 2u);
}

TEST(ParserTest, IfElseIsOneStatement) {
    auto module = parse("if (a)\n  b()\nelse\n  c()\nfoo()");
    EXPECT_EQ(module.body.size(), 2u);
}

TEST(ParserTest, TryCatchAndDoWhile) {
    auto module = parse("try { a() } catch (e) { b() } finally { c() }\ndo { x++ } while (x < 3)\ndone()");
    EXPECT_EQ(module.body.size(), 3u);
}

TEST(ParserTest, FunctionDeclarationEndsAtItsBrace) {
    auto module = parse("function f() { return 1 }\n(1)");
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(module.body[0].kind, StatementKind::Function);
    EXPECT_EQ(module.body[0].name, "f");
}

TEST(ParserTest, ImportDeclarations) {
    auto module = parse("import React, { useState } from 'react';\nimport './app.css'\n");
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(module.body[0].kind, StatementKind::Import);
    EXPECT_EQ(module.body[1].kind, StatementKind::Import);

    auto found = specifiers(module);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0]->text, "'react'");
    EXPECT_EQ(found[0]->role, SpecifierRole::Import);
    EXPECT_EQ(found[1]->text, "'./app.css'");
    EXPECT_EQ(module.trailing, "\n");
}

TEST(ParserTest, ExportForms) {
    auto module = parse(
        "export * from './all.js';\n"
        "export { a, b as c } from './some.js';\n"
        "export { d, e as f };\n"
        "export default App;\n"
        "export const g = 1;\n");
    ASSERT_EQ(module.body.size(), 5u);

    EXPECT_EQ(module.body[0].kind, StatementKind::ExportFrom);
    EXPECT_EQ(module.body[1].kind, StatementKind::ExportFrom);
    EXPECT_EQ(module.body[2].kind, StatementKind::ExportNamed);
    EXPECT_EQ(module.body[2].export_names, (std::vector<std::string>{"d", "e"}));
    EXPECT_EQ(module.body[3].kind, StatementKind::ExportDefault);
    EXPECT_EQ(module.body[3].name, "App");
    EXPECT_EQ(module.body[4].kind, StatementKind::Variable);
    EXPECT_TRUE(module.body[4].exported);

    auto found = specifiers(module);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0]->role, SpecifierRole::Export);
}

TEST(ParserTest, DefaultExportedDeclarations) {
    auto module = parse("export default function () {}\nexport default class extends Base {}");
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(module.body[0].kind, StatementKind::Function);
    EXPECT_TRUE(module.body[0].default_export);
    EXPECT_TRUE(module.body[0].name.empty());
    EXPECT_EQ(module.body[1].kind, StatementKind::Class);
    EXPECT_EQ(module.body[1].heritage, "Base");
}

TEST(ParserTest, ClassHeritage) {
    auto module = parse("class Page extends React.Component { render() { return null } }");
    ASSERT_EQ(module.body.size(), 1u);
    EXPECT_EQ(module.body[0].name, "Page");
    EXPECT_EQ(module.body[0].heritage, "React.Component");
}

TEST(ParserTest, DynamicImportWithStringArgument) {
    auto module = parse("const m = import('./lazy.js');\nconst n = import(base + '/x.js');\nconst o = import('./a' + x);");
    auto found = specifiers(module);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0]->text, "'./lazy.js'");
    EXPECT_EQ(found[0]->role, SpecifierRole::Dynamic);
}

TEST(ParserTest, MemberCalledImportIsNotDynamicImport) {
    auto module = parse("loader.import('./x.js');");
    EXPECT_TRUE(specifiers(module).empty());
}

TEST(ParserTest, JsxElementTree) {
    auto module = parse("const a = <div className=\"box\" {...rest} hidden>hi {name}<br /></div>;");
    const JsxElement* element = first_element(module);
    ASSERT_NE(element, nullptr);

    EXPECT_EQ(element->tag, "div");
    ASSERT_EQ(element->attributes.size(), 3u);
    EXPECT_EQ(element->attributes[0].name, "className");
    EXPECT_EQ(element->attributes[0].value_kind, JsxValueKind::String);
    EXPECT_EQ(element->attributes[0].string_value, "box");
    EXPECT_TRUE(element->attributes[1].spread);
    ASSERT_EQ(element->attributes[1].expression.size(), 1u);
    EXPECT_EQ(element->attributes[1].expression[0].token.text, "rest");
    EXPECT_EQ(element->attributes[2].value_kind, JsxValueKind::None);

    ASSERT_EQ(element->children.size(), 3u);
    EXPECT_EQ(element->children[0].kind, JsxChildKind::Text);
    EXPECT_EQ(element->children[0].text, "hi ");
    EXPECT_EQ(element->children[1].kind, JsxChildKind::Expression);
    EXPECT_EQ(element->children[2].kind, JsxChildKind::Element);
    EXPECT_EQ(element->children[2].element->tag, "br");

    EXPECT_TRUE(module.body[0].items.back().token.is_punct(";"));
}

TEST(ParserTest, LessThanAfterValueIsComparison) {
    auto module = parse("const t = a < b;\nif (x) y = c <d;");
    EXPECT_EQ(first_element(module), nullptr);
}

TEST(ParserTest, FragmentsAndMemberTags) {
    auto module = parse("const f = <><Foo.Bar x={1} /></>;");
    const JsxElement* element = first_element(module);
    ASSERT_NE(element, nullptr);
    EXPECT_TRUE(element->fragment);
    ASSERT_EQ(element->children.size(), 1u);
    EXPECT_EQ(element->children[0].element->tag, "Foo.Bar");
}

TEST(ParserTest, JsxTextKeepsSourceVerbatim) {
    auto module = parse("const a = <p>\n  a &amp; b\n  {x}  </p>;");
    const JsxElement* element = first_element(module);
    ASSERT_NE(element, nullptr);
    ASSERT_EQ(element->children.size(), 3u);
    EXPECT_EQ(element->children[0].text, "\n  a &amp; b\n  ");
    EXPECT_EQ(element->children[2].text, "  ");
}

TEST(ParserTest, JsxSpreadChildAndNestedElementAttribute) {
    auto module = parse("const a = <A icon=<B /> x={ y }>{...items}</A>;");
    const JsxElement* element = first_element(module);
    ASSERT_NE(element, nullptr);
    ASSERT_EQ(element->attributes.size(), 2u);
    EXPECT_EQ(element->attributes[0].value_kind, JsxValueKind::Element);
    EXPECT_EQ(element->attributes[0].element->tag, "B");
    ASSERT_EQ(element->attributes[1].expression.size(), 1u);
    EXPECT_EQ(element->attributes[1].expression[0].token.leading, "");
    ASSERT_EQ(element->children.size(), 1u);
    EXPECT_EQ(element->children[0].kind, JsxChildKind::Spread);
}

TEST(ParserTest, JsxPragmas) {
    auto module = parse("/** @jsx h */\n/** @jsxFrag Fragment */\nconst a = <div />;");
    EXPECT_EQ(module.jsx_pragma.value_or(""), "h");
    EXPECT_EQ(module.jsx_fragment_pragma.value_or(""), "Fragment");
}

TEST(ParserTest, PragmaThatIsNotAFactoryNameIsIgnored) {
    auto module = parse("/** @jsx h;x() */\n/** @jsxFrag 1 */\nconst a = <div />;");
    EXPECT_FALSE(module.jsx_pragma.has_value());
    EXPECT_FALSE(module.jsx_fragment_pragma.has_value());
}

TEST(ParserTest, MismatchedJsxClosingTag) {
    EXPECT_THROW(parse("const a = <a></b>;"), ParseError);
    EXPECT_THROW(parse("const a = <a>"), ParseError);
}

TEST(ParserTest, UnbalancedBrackets) {
    EXPECT_THROW(parse("foo("), ParseError);
    EXPECT_THROW(parse("foo)"), ParseError);
    EXPECT_THROW(parse("[1, 2)"), ParseError);
}

TEST(ParserTest, MalformedDeclarations) {
    EXPECT_THROW(parse("const = 1;"), ParseError);
    EXPECT_THROW(parse("import;"), ParseError);
    EXPECT_THROW(parse("export 42;"), ParseError);
}

TEST(ParserTest, AsyncFunctionNeedsEs2017) {
    EXPECT_THROW(parse("async function f() {}", TargetLevel::ES2016), ParseError);
    EXPECT_NO_THROW(parse("async function f() {}", TargetLevel::ES2017));
}

TEST(ParserTest, ErrorPositionIsOneBased) {
    try {
        (void)parse("const a = 1;\nfoo(]");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 2u);
        EXPECT_GE(e.column(), 1u);
    }
}

TEST(ParserTest, RejectsInvalidExpressions) {
    EXPECT_THROW(parse("let x = 1 + ;\nfoo(,,);"), ParseError);
    EXPECT_THROW(parse("let x = 1 + ;"), ParseError);
    EXPECT_THROW(parse("a b c"), ParseError);
}

TEST(ParserTest, RegexAfterClosingParenOfCondition) {
    auto module = parse("if (ok) /[)}]/.test(s)\nwhile (x) /}/.exec(s)\ndone()");
    ASSERT_EQ(module.body.size(), 3u);
    const Token* regex = find_token(module, TokenKind::Regex);
    ASSERT_NE(regex, nullptr);
    EXPECT_EQ(regex->text, "/[)}]/");
}

TEST(ParserTest, DivisionAfterValue) {
    auto module = parse("const r = a / b / c;");
    EXPECT_EQ(find_token(module, TokenKind::Regex), nullptr);
}

TEST(ParserTest, TemplatePieces) {
    auto module = parse("const s = `a${b}c${ d }e`;");
    std::vector<std::string> pieces;
    for (const auto& node : module.body[0].items) {
        if (node.token.kind == TokenKind::Template) {
            pieces.push_back(node.token.text);
        }
    }
    EXPECT_EQ(pieces, (std::vector<std::string>{"`a${", "}c${", "}e`"}));
    EXPECT_EQ(tokens_text(module), "const s = `a${b}c${ d }e`;");
}

TEST(ParserTest, CommentsAndWhitespaceBecomeLeadingTrivia) {
    const std::string source = "// head\nconst a = /* one */ 1;\n\n/* tail */\n";
    auto module = parse(source);
    ASSERT_EQ(module.body.size(), 1u);
    EXPECT_EQ(module.body[0].items[0].token.leading, "// head\n");
    EXPECT_EQ(module.body[0].items[3].token.leading, " /* one */ ");
    EXPECT_EQ(module.trailing, "\n\n/* tail */\n");
    EXPECT_EQ(tokens_text(module), source);
}

TEST(ParserTest, ColumnsCountCodePoints) {
    auto module = parse("const s = \"\xC3\xA9\"; x");
    ASSERT_EQ(module.body.size(), 2u);
    const Token& x = module.body[1].items[0].token;
    EXPECT_EQ(x.pos.line, 0u);
    EXPECT_EQ(x.pos.column, 15u);
    EXPECT_EQ(x.pos.offset, 16u);
    EXPECT_FALSE(x.newline_before);
}

TEST(ParserTest, TokenKinds) {
    auto module = parse("class A { #n = 10n; m() { return this.#n ?? null } }", TargetLevel::ES2022);
    EXPECT_NE(find_token(module, TokenKind::PrivateName), nullptr);
    EXPECT_EQ(find_token(module, TokenKind::Number)->text, "10n");
    EXPECT_EQ(find_token(module, TokenKind::Keyword)->text, "class");
    EXPECT_EQ(find_token(module, TokenKind::Identifier)->text, "A");
}

TEST(ParserTest, FeatureGates) {
    EXPECT_THROW(parse("a ** b", TargetLevel::ES2015), ParseError);
    EXPECT_NO_THROW(parse("a ** b", TargetLevel::ES2016));
    EXPECT_THROW(parse("a?.b", TargetLevel::ES2019), ParseError);
    EXPECT_THROW(parse("x = 10n", TargetLevel::ES2019), ParseError);
    EXPECT_THROW(parse("a ||= b", TargetLevel::ES2020), ParseError);
    EXPECT_THROW(parse("x = 1_000", TargetLevel::ES2020), ParseError);
    EXPECT_NO_THROW(parse("x = 1_000", TargetLevel::ES2021));
    EXPECT_THROW(parse("class A { #secret = 1 }", TargetLevel::ES2021), ParseError);
    EXPECT_NO_THROW(parse("class A { #secret = 1 }", TargetLevel::ES2022));
    EXPECT_NO_THROW(parse("const async = 1; async + 1", TargetLevel::ES2015));
}

TEST(ParserTest, GateErrorNamesTheFeature) {
    try {
        (void)parse("x ?? y", TargetLevel::ES2017);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(e.message().find("nullish coalescing"), std::string::npos);
        EXPECT_NE(e.message().find("es2020"), std::string::npos);
        EXPECT_EQ(e.line(), 1u);
        EXPECT_EQ(e.column(), 3u);
    }
}

TEST(ParserTest, TypeAnnotationsAreErased) {
    auto module = parse_ts("export const A = (p: Props): JSX.Element => <div/>;");
    ASSERT_EQ(module.body.size(), 1u);
    EXPECT_EQ(module.body[0].kind, StatementKind::Variable);
    EXPECT_EQ(module.body[0].name, "A");
    EXPECT_EQ(tokens_text(module), "export const A = (p) => <jsx>;");
}

TEST(ParserTest, TypeOnlyStatementsErase) {
    auto module = parse_ts(
        "import type { Props } from './types';
"
        "interface Point { x: number }
"
        "type Id = string;
"
        "export type { Point };
"
        "declare const env: string;
"
        "const a = 1;
");
    ASSERT_EQ(module.body.size(), 1u);
    EXPECT_EQ(module.body[0].name, "a");
    EXPECT_TRUE(specifiers(module).empty());
    EXPECT_EQ(module.body[0].items[0].token.leading, "




");
}

TEST(ParserTest, TypeOnlySpecifiersErase) {
    auto module = parse_ts("import { type A, b } from './x';
export { type A, b };");
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(module.body[1].export_names, (std::vector<std::string>{"b"}));
    EXPECT_EQ(tokens_text(module), "import { b } from './x';
export { b };");
}

TEST(ParserTest, ExpressionLevelTypeSyntaxErases) {
    auto module = parse_ts("const n = (value as number)! + f<string>(x satisfies T);", SourceType::TS);
    EXPECT_EQ(tokens_text(module), "const n = (value) + f(x);");
}

TEST(ParserTest, ClassMembersLoseTypeModifiers) {
    auto module = parse_ts(
        "abstract class Base<T> extends Model<T> implements Thing {
"
        "  declare kind: string;
"
        "  private readonly id?: number = 1;
"
        "  abstract load(): void;
"
        "  public run(x?: T): void {}
"
        "}",
        SourceType::TS);
    ASSERT_EQ(module.body.size(), 1u);
    EXPECT_EQ(module.body[0].kind, StatementKind::Class);
    EXPECT_EQ(module.body[0].name, "Base");
    EXPECT_EQ(module.body[0].heritage, "Model");
    std::string text = tokens_text(module);
    EXPECT_EQ(text.find("abstract"), std::string::npos);
    EXPECT_EQ(text.find("readonly"), std::string::npos);
    EXPECT_EQ(text.find("private"), std::string::npos);
    EXPECT_EQ(text.find("kind"), std::string::npos);
    EXPECT_EQ(text.find("implements"), std::string::npos);
    EXPECT_NE(text.find("id = 1"), std::string::npos);
    EXPECT_NE(text.find("run(x) {}"), std::string::npos);
}

TEST(ParserTest, TypeScriptWithRuntimeSemanticsIsRejected) {
    EXPECT_THROW(parse_ts("enum Color { Red }", SourceType::TS), ParseError);
    EXPECT_THROW(parse_ts("namespace N { export const a = 1 }", SourceType::TS), ParseError);
    EXPECT_THROW(parse_ts("class P { constructor(private x: number) {} }", SourceType::TS), ParseError);
    EXPECT_THROW(parse_ts("import fs = require('fs');", SourceType::TS), ParseError);
    EXPECT_THROW(parse_ts("export = App;", SourceType::TS), ParseError);
}

TEST(ParserTest, TypeScriptGrammarOnlyForTypeScript) {
    EXPECT_THROW(parse("const a: number = 1;"), ParseError);
    EXPECT_NO_THROW(parse_ts("const a = <T,>(x: T) => x;"));
    EXPECT_NO_THROW(parse_ts("const a = <T>x;", SourceType::TS));
}

}  // namespace
}  // namespace jsxform
