#pragma once

#include "options.hpp"
#include "syntax.hpp"

#include <tree_sitter/api.h>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jsxform {

// Builds a Module from a tree-sitter syntax tree: module-level statements as
// token runs, JSX elements as trees, module specifiers tagged. TypeScript
// type syntax is erased on the way.
//
// Throws ParseError on any syntax error, on constructs newer than the
// target, and on TypeScript that has runtime semantics (enums, namespaces,
// parameter properties, import/export assignments).
class Parser {
public:
    Parser(std::string_view source, TargetLevel target, SourceType source_type);

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    [[nodiscard]] Module parse(std::string filename);

    // javascript (JSX included), typescript or tsx
    [[nodiscard]] static const TSLanguage* language_for(SourceType source_type) noexcept;

private:
    struct ParserDeleter {
        void operator()(TSParser* parser) const noexcept { ts_parser_delete(parser); }
    };
    struct TreeDeleter {
        void operator()(TSTree* tree) const noexcept { ts_tree_delete(tree); }
    };

    [[nodiscard]] SourcePos position_at(uint32_t offset) const noexcept;
    [[nodiscard]] std::string_view text_of(TSNode node) const noexcept;
    // Token texts of a node joined without trivia: "React.Component"
    [[nodiscard]] std::string leaf_text(TSNode node) const;
    [[noreturn]] void fail_at(uint32_t offset, const std::string& message) const;

    void check_syntax(TSNode root) const;
    void require(TargetLevel level, std::string_view feature, const SourcePos& pos) const;
    void gate(const Token& token, bool named) const;

    // False when the whole statement is type-only and erases
    [[nodiscard]] bool classify(TSNode node, Statement& statement);
    void classify_declaration(TSNode node, Statement& statement) const;
    [[nodiscard]] std::string heritage_of(TSNode class_node) const;

    void collect(TSNode node, NodeList& out);
    void collect_children(TSNode node, NodeList& out);
    void collect_template(TSNode node, NodeList& out);
    // Handles syntax that only exists in TypeScript; false when `node` is
    // plain JavaScript
    [[nodiscard]] bool collect_typescript(TSNode node, std::string_view type, NodeList& out);
    void push_token(TSNode node, NodeList& out);
    void push_range(uint32_t start, uint32_t end, TokenKind kind, NodeList& out);
    void erase(TSNode node);
    [[nodiscard]] std::string take_leading(uint32_t start);

    [[nodiscard]] Node jsx_node(TSNode node);
    [[nodiscard]] std::unique_ptr<JsxElement> build_jsx(TSNode node);
    void build_jsx_attribute(TSNode node, JsxElement& element);
    void build_jsx_children(TSNode node, uint32_t first, uint32_t last, JsxElement& element);
    // Contents of {...}; the braces are not part of the result
    [[nodiscard]] NodeList jsx_expression(TSNode node, bool& spread);

    void read_pragmas(TSNode root, Module& module) const;

    std::string_view source_;
    TargetLevel target_;
    SourceType source_type_;
    std::vector<uint32_t> line_starts_;
    // Byte offset just past the last token taken; the gap up to the next
    // token is its leading trivia
    uint32_t last_end_ = 0;
    // Newlines and comments from around erased type syntax
    std::string pending_trivia_;
    std::unordered_map<uint32_t, SpecifierRole> specifier_roles_;
};

}  // namespace jsxform
