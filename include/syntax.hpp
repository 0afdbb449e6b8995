#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsxform {

// 0-based line and column (columns count code points), byte offset
struct SourcePos {
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t offset = 0;
};

enum class TokenKind {
    Identifier,   // includes contextual words: async, from, as, of, let ...
    Keyword,      // reserved words
    Punctuator,
    String,
    Template,     // `...` or a template head/middle/tail piece
    Number,
    Regex,
    PrivateName,  // #field
    EndOfFile,
};

// Marks string literals that name a module
enum class SpecifierRole : uint8_t {
    None,
    Import,    // import ... from "x" / import "x"
    Export,    // export ... from "x"
    Dynamic,   // import("x")
};

struct Token {
    TokenKind kind = TokenKind::EndOfFile;
    std::string text;             // exact source text, or generated text
    std::string leading;          // whitespace and comments before the token
    SourcePos pos;                // original position, or the enclosing node's for synthesized tokens
    bool newline_before = false;
    bool synthesized = false;
    SpecifierRole role = SpecifierRole::None;

    [[nodiscard]] bool is_punct(std::string_view p) const noexcept {
        return kind == TokenKind::Punctuator && text == p;
    }
    [[nodiscard]] bool is_keyword(std::string_view k) const noexcept {
        return kind == TokenKind::Keyword && text == k;
    }
    // Identifier with this exact name (contextual keywords live here)
    [[nodiscard]] bool is_name(std::string_view n) const noexcept {
        return kind == TokenKind::Identifier && text == n;
    }
    [[nodiscard]] uint32_t end_offset() const noexcept {
        return pos.offset + static_cast<uint32_t>(text.size());
    }
};

struct JsxElement;

// A token, or a JSX element still awaiting lowering
struct Node {
    Token token;
    std::unique_ptr<JsxElement> jsx;

    [[nodiscard]] bool is_jsx() const noexcept { return jsx != nullptr; }
    [[nodiscard]] bool is_token() const noexcept { return jsx == nullptr; }
};

using NodeList = std::vector<Node>;

enum class JsxValueKind {
    None,        // <input disabled />
    String,      // a="..."
    Expression,  // a={...}
    Element,     // a=<b/>
};

struct JsxAttribute {
    SourcePos pos;
    bool spread = false;          // {...props}
    std::string name;
    JsxValueKind value_kind = JsxValueKind::None;
    std::string string_value;     // raw text between the quotes
    NodeList expression;          // value or spread argument
    std::unique_ptr<JsxElement> element;
};

enum class JsxChildKind {
    Text,
    Expression,
    Spread,
    Element,
};

struct JsxChild {
    JsxChildKind kind = JsxChildKind::Text;
    SourcePos pos;
    std::string text;
    NodeList expression;
    std::unique_ptr<JsxElement> element;
};

struct JsxElement {
    SourcePos pos;
    bool fragment = false;
    std::string tag;              // div, Foo, Foo.Bar, svg:path
    SourcePos tag_pos;
    std::vector<JsxAttribute> attributes;
    std::vector<JsxChild> children;
};

enum class StatementKind {
    Import,         // import ... from "x"
    ExportFrom,     // export * from "x", export { a } from "x"
    ExportNamed,    // export { a, b as c }
    ExportDefault,  // export default <expression>
    Function,       // [export [default]] [async] function ...
    Class,          // [export [default]] class ...
    Variable,       // [export] const|let|var ...
    Other,
};

// A module-level statement. Only the shapes module rewriting cares about are
// told apart; everything else is a run of tokens.
struct Statement {
    StatementKind kind = StatementKind::Other;
    NodeList items;
    bool exported = false;
    bool default_export = false;
    std::string name;                       // declared binding (first declarator for variables)
    std::vector<std::string> export_names;  // local names of export { ... }
    std::string heritage;                   // class ... extends <heritage>
};

struct Module {
    std::string filename;
    std::string source;
    std::vector<Statement> body;
    std::string trailing;                   // trivia before end of input
    // From /** @jsx ... */ and /** @jsxFrag ... */ comments
    std::optional<std::string> jsx_pragma;
    std::optional<std::string> jsx_fragment_pragma;
};

// Caller-visible result of a transform
struct TransformOutput {
    std::string code;
    std::optional<std::string> map;  // source map v3 JSON, when requested
};

// A generated token carrying the position of the node it stands for
[[nodiscard]] inline Token make_token(TokenKind kind, std::string text, const SourcePos& origin,
                                      std::string leading = {}) {
    Token token;
    token.kind = kind;
    token.text = std::move(text);
    token.leading = std::move(leading);
    token.pos = origin;
    token.synthesized = true;
    return token;
}

[[nodiscard]] inline Node make_node(Token token) {
    Node node;
    node.token = std::move(token);
    return node;
}

// Index of the bracket closing the one at `open`, or items.size()
[[nodiscard]] size_t find_closing(const NodeList& items, size_t open);

// Source text of items[first, last): tokens with their trivia, less the
// first token's
[[nodiscard]] std::string items_text(const NodeList& items, size_t first, size_t last);

// Double-quoted JavaScript string literal
[[nodiscard]] std::string quote_js_string(std::string_view text);

// Unquotes a string literal token, decoding every escape sequence
// (\xHH, \uXXXX, \u{...}, legacy octal, line continuations) to UTF-8
[[nodiscard]] std::string string_literal_value(std::string_view literal);

void append_utf8(std::string& out, uint32_t code_point);

[[nodiscard]] bool is_ident_start(char c) noexcept;
[[nodiscard]] bool is_ident_part(char c) noexcept;
[[nodiscard]] bool is_reserved_word(std::string_view word) noexcept;

}  // namespace jsxform
