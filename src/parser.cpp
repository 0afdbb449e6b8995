#include "parser.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>

extern "C" {
const TSLanguage *tree_sitter_javascript(void);
const TSLanguage *tree_sitter_typescript(void);
const TSLanguage *tree_sitter_tsx(void);
}

namespace jsxform {

namespace {

bool one_of(std::string_view text, std::initializer_list<std::string_view> words) {
    return std::find(words.begin(), words.end(), text) != words.end();
}

std::string_view type_of(TSNode node) {
    return ts_node_type(node);
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

bool is_anonymous(TSNode node, std::string_view text) {
    return !ts_node_is_null(node) && !ts_node_is_named(node) && type_of(node) == text;
}

bool has_anonymous_child(TSNode node, std::string_view text) {
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        if (is_anonymous(ts_node_child(node, i), text)) {
            return true;
        }
    }
    return false;
}

TSNode first_named_child_of_type(TSNode node, std::string_view type) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (type_of(child) == type) {
            return child;
        }
    }
    return TSNode{};
}

bool is_jsx_element(std::string_view type) {
    return type == "jsx_element" || type == "jsx_self_closing_element" || type == "jsx_fragment";
}

// Nodes with inner structure that still print as one token
bool is_atomic(std::string_view type) {
    return one_of(type, {"string", "regex", "number", "hash_bang_line"});
}

// Type syntax that erases without a trace
bool is_type_only(std::string_view type) {
    return one_of(type, {"type_annotation", "opting_type_annotation", "omitting_type_annotation",
                         "adding_type_annotation", "asserts_annotation", "type_predicate_annotation",
                         "type_parameters", "type_arguments", "implements_clause", "accessibility_modifier",
                         "override_modifier", "interface_declaration", "type_alias_declaration",
                         "ambient_declaration", "function_signature", "method_signature",
                         "abstract_method_signature", "index_signature"});
}

// TypeScript constructs that generate code; only type syntax is stripped
std::optional<std::string_view> runtime_construct(std::string_view type) {
    if (type == "enum_declaration") {
        return "enum";
    }
    if (type == "internal_module" || type == "module") {
        return "namespace";
    }
    if (type == "import_alias" || type == "import_require_clause") {
        return "import assignment";
    }
    return std::nullopt;
}

bool is_function_value(std::string_view type) {
    return one_of(type, {"function", "function_expression", "generator_function", "generator_function_expression"});
}

bool has_line_break(std::string_view text) {
    return text.find_first_of("\n\r") != std::string_view::npos ||
           text.find("\xE2\x80\xA8") != std::string_view::npos ||
           text.find("\xE2\x80\xA9") != std::string_view::npos;
}

TokenKind leaf_kind(std::string_view type, std::string_view text) {
    if (type == "number") {
        return TokenKind::Number;
    }
    if (type == "string") {
        return TokenKind::String;
    }
    if (type == "regex") {
        return TokenKind::Regex;
    }
    if (type == "private_property_identifier") {
        return TokenKind::PrivateName;
    }
    if (!text.empty() && is_ident_start(text.front())) {
        return is_reserved_word(text) ? TokenKind::Keyword : TokenKind::Identifier;
    }
    return TokenKind::Punctuator;
}

std::string quoted(std::string_view text) {
    constexpr size_t kMaxShown = 24;
    if (text.size() > kMaxShown) {
        return "'" + std::string(text.substr(0, kMaxShown)) + "...'";
    }
    return "'" + std::string(text) + "'";
}

// First node, in document order, that carries the error
TSNode find_error(TSNode node) {
    if (ts_node_is_missing(node) || type_of(node) == "ERROR") {
        return node;
    }
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (ts_node_has_error(child)) {
            TSNode found = find_error(child);
            if (!ts_node_is_null(found)) {
                return found;
            }
        }
    }
    return TSNode{};
}

TSNode first_leaf(TSNode node) {
    uint32_t count = ts_node_child_count(node);
    if (count == 0) {
        return node;
    }
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (!ts_node_is_extra(child)) {
            return first_leaf(child);
        }
    }
    return node;
}

void collect_comments(TSNode node, std::vector<TSNode>& out) {
    if (type_of(node) == "comment") {
        out.push_back(node);
        return;
    }
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collect_comments(ts_node_child(node, i), out);
    }
}

}  // namespace

Parser::Parser(std::string_view source, TargetLevel target, SourceType source_type)
    : source_(source)
    , target_(target)
    , source_type_(source_type)
{
}

const TSLanguage* Parser::language_for(SourceType source_type) noexcept {
    switch (source_type) {
    case SourceType::TS:
        return tree_sitter_typescript();
    case SourceType::TSX:
        return tree_sitter_tsx();
    case SourceType::JS:
    case SourceType::JSX:
        break;
    }
    return tree_sitter_javascript();
}

Module Parser::parse(std::string filename) {
    if (source_.size() >= std::numeric_limits<uint32_t>::max()) {
        throw ParseError("source is too large", 1, 1);
    }

    line_starts_.assign(1, 0);
    for (uint32_t i = 0; i < source_.size(); ++i) {
        char c = source_[i];
        if (c == '\n' || (c == '\r' && (i + 1 == source_.size() || source_[i + 1] != '\n'))) {
            line_starts_.push_back(i + 1);
        } else if (c == '\xE2' && i + 2 < source_.size() && source_[i + 1] == '\x80' &&
                   (source_[i + 2] == '\xA8' || source_[i + 2] == '\xA9')) {
            line_starts_.push_back(i + 3);
        }
    }
    last_end_ = 0;
    pending_trivia_.clear();
    specifier_roles_.clear();

    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!ts_parser_set_language(parser.get(), language_for(source_type_))) {
        throw std::runtime_error("tree-sitter grammar for " + std::string(to_string(source_type_)) +
                                 " does not match the tree-sitter runtime");
    }
    std::unique_ptr<TSTree, TreeDeleter> tree(
        ts_parser_parse_string(parser.get(), nullptr, source_.data(), static_cast<uint32_t>(source_.size())));
    if (!tree) {
        throw std::runtime_error("tree-sitter gave no tree for " + filename);
    }
    TSNode root = ts_tree_root_node(tree.get());
    check_syntax(root);

    Module module;
    module.filename = std::move(filename);
    module.source = std::string(source_);
    read_pragmas(root, module);

    uint32_t count = ts_node_child_count(root);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(root, i);
        if (ts_node_is_extra(child) || ts_node_start_byte(child) == ts_node_end_byte(child)) {
            continue;
        }
        Statement statement;
        if (!classify(child, statement)) {
            erase(child);
            continue;
        }
        collect(child, statement.items);
        if (!statement.items.empty()) {
            module.body.push_back(std::move(statement));
        }
    }
    module.trailing = take_leading(static_cast<uint32_t>(source_.size()));
    return module;
}

SourcePos Parser::position_at(uint32_t offset) const noexcept {
    auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    auto line = static_cast<uint32_t>(next - line_starts_.begin()) - 1;
    uint32_t column = 0;
    for (uint32_t i = line_starts_[line]; i < offset && i < source_.size(); ++i) {
        if ((static_cast<unsigned char>(source_[i]) & 0xC0) != 0x80) {
            ++column;
        }
    }
    return SourcePos{line, column, offset};
}

std::string_view Parser::text_of(TSNode node) const noexcept {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    return source_.substr(start, end - start);
}

std::string Parser::leaf_text(TSNode node) const {
    if (ts_node_is_null(node) || ts_node_is_extra(node)) {
        return "";
    }
    uint32_t count = ts_node_child_count(node);
    if (count == 0 || is_atomic(type_of(node))) {
        return std::string(text_of(node));
    }
    std::string text;
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (type_of(child) != "type_arguments") {
            text += leaf_text(child);
        }
    }
    return text;
}

void Parser::fail_at(uint32_t offset, const std::string& message) const {
    SourcePos pos = position_at(offset);
    throw ParseError(message, pos.line + 1, pos.column + 1);
}

void Parser::check_syntax(TSNode root) const {
    if (!ts_node_has_error(root)) {
        return;
    }
    TSNode error = find_error(root);
    if (ts_node_is_null(error)) {
        fail_at(ts_node_start_byte(root), "syntax error");
    }
    uint32_t start = ts_node_start_byte(error);
    if (ts_node_is_missing(error)) {
        std::string_view expected = ts_node_type(error);
        fail_at(start, "expected " + (ts_node_is_named(error) ? std::string(expected) : quoted(expected)));
    }
    TSNode leaf = first_leaf(error);
    if (ts_node_start_byte(leaf) == ts_node_end_byte(leaf)) {
        if (start >= source_.size()) {
            fail_at(start, "unexpected end of input");
        }
        fail_at(start, "unexpected " + quoted(source_.substr(start, 1)));
    }
    fail_at(ts_node_start_byte(leaf), "unexpected " + quoted(text_of(leaf)));
}

void Parser::require(TargetLevel level, std::string_view feature, const SourcePos& pos) const {
    if (target_ < level) {
        throw ParseError(std::string(feature) + " requires " + std::string(to_string(level)) +
                             " or later (target is " + std::string(to_string(target_)) + ")",
                         pos.line + 1, pos.column + 1);
    }
}

void Parser::gate(const Token& token, bool named) const {
    switch (token.kind) {
    case TokenKind::Punctuator:
        if (token.text == "**" || token.text == "**=") {
            require(TargetLevel::ES2016, "exponentiation operator", token.pos);
        } else if (token.text == "?.") {
            require(TargetLevel::ES2020, "optional chaining", token.pos);
        } else if (token.text == "??") {
            require(TargetLevel::ES2020, "nullish coalescing", token.pos);
        } else if (token.text == "??=" || token.text == "&&=" || token.text == "||=") {
            require(TargetLevel::ES2021, "logical assignment", token.pos);
        }
        break;
    case TokenKind::Number:
        if (token.text.find('_') != std::string::npos) {
            require(TargetLevel::ES2021, "numeric separator", token.pos);
        }
        if (!token.text.empty() && token.text.back() == 'n') {
            require(TargetLevel::ES2020, "BigInt literal", token.pos);
        }
        break;
    case TokenKind::PrivateName:
        require(TargetLevel::ES2022, "private class member", token.pos);
        break;
    case TokenKind::Identifier:
        // the keyword of an async function or arrow; a variable named async is named
        if (!named && token.text == "async") {
            require(TargetLevel::ES2017, "async function", token.pos);
        }
        break;
    default:
        break;
    }
}

bool Parser::classify(TSNode node, Statement& statement) {
    std::string_view type = type_of(node);
    bool typescript = is_typescript(source_type_);

    if (type == "import_statement") {
        if (typescript && has_anonymous_child(node, "type")) {
            return false;
        }
        statement.kind = StatementKind::Import;
        TSNode source = field(node, "source");
        if (!ts_node_is_null(source)) {
            specifier_roles_[ts_node_start_byte(source)] = SpecifierRole::Import;
        }
        return true;
    }

    if (type == "export_statement") {
        statement.exported = true;
        if (typescript) {
            if (has_anonymous_child(node, "type") || has_anonymous_child(node, "namespace")) {
                return false;
            }
            if (has_anonymous_child(node, "=")) {
                fail_at(ts_node_start_byte(node), "TypeScript export assignment has no JavaScript equivalent");
            }
        }
        statement.default_export = has_anonymous_child(node, "default");

        TSNode source = field(node, "source");
        if (!ts_node_is_null(source)) {
            statement.kind = StatementKind::ExportFrom;
            specifier_roles_[ts_node_start_byte(source)] = SpecifierRole::Export;
            return true;
        }

        TSNode declaration = field(node, "declaration");
        if (!ts_node_is_null(declaration)) {
            if (typescript && is_type_only(type_of(declaration))) {
                return false;
            }
            classify_declaration(declaration, statement);
            return true;
        }

        TSNode value = field(node, "value");
        if (!ts_node_is_null(value)) {
            std::string_view value_type = type_of(value);
            if (is_function_value(value_type)) {
                statement.kind = StatementKind::Function;
                statement.name = leaf_text(field(value, "name"));
            } else if (value_type == "class") {
                statement.kind = StatementKind::Class;
                statement.name = leaf_text(field(value, "name"));
                statement.heritage = heritage_of(value);
            } else {
                statement.kind = StatementKind::ExportDefault;
                if (value_type == "identifier") {
                    statement.name = std::string(text_of(value));
                }
            }
            return true;
        }

        statement.kind = StatementKind::ExportNamed;
        TSNode clause = first_named_child_of_type(node, "export_clause");
        uint32_t count = ts_node_is_null(clause) ? 0 : ts_node_named_child_count(clause);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode specifier = ts_node_named_child(clause, i);
            if (type_of(specifier) != "export_specifier" || (typescript && has_anonymous_child(specifier, "type"))) {
                continue;
            }
            TSNode local = field(specifier, "name");
            if (!ts_node_is_null(local) && type_of(local) == "identifier") {
                statement.export_names.emplace_back(text_of(local));
            }
        }
        return true;
    }

    if (typescript && is_type_only(type)) {
        return false;
    }
    classify_declaration(node, statement);
    return true;
}

void Parser::classify_declaration(TSNode node, Statement& statement) const {
    std::string_view type = type_of(node);
    if (type == "function_declaration" || type == "generator_function_declaration") {
        statement.kind = StatementKind::Function;
        statement.name = leaf_text(field(node, "name"));
    } else if (type == "class_declaration" || type == "abstract_class_declaration") {
        statement.kind = StatementKind::Class;
        statement.name = leaf_text(field(node, "name"));
        statement.heritage = heritage_of(node);
    } else if (type == "lexical_declaration" || type == "variable_declaration") {
        statement.kind = StatementKind::Variable;
        TSNode declarator = first_named_child_of_type(node, "variable_declarator");
        TSNode name = ts_node_is_null(declarator) ? TSNode{} : field(declarator, "name");
        if (!ts_node_is_null(name) && type_of(name) == "identifier") {
            statement.name = std::string(text_of(name));
        }
    } else {
        statement.kind = StatementKind::Other;
    }
}

std::string Parser::heritage_of(TSNode class_node) const {
    TSNode heritage = first_named_child_of_type(class_node, "class_heritage");
    if (ts_node_is_null(heritage)) {
        return "";
    }
    TSNode extends = first_named_child_of_type(heritage, "extends_clause");
    if (!ts_node_is_null(extends)) {
        TSNode value = field(extends, "value");
        return leaf_text(ts_node_is_null(value) ? ts_node_named_child(extends, 0) : value);
    }
    // javascript: extends <expression>
    uint32_t count = ts_node_named_child_count(heritage);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(heritage, i);
        if (!ts_node_is_extra(child) && type_of(child) != "implements_clause") {
            return leaf_text(child);
        }
    }
    return "";
}

void Parser::collect(TSNode node, NodeList& out) {
    if (ts_node_is_extra(node)) {
        return;
    }
    std::string_view type = type_of(node);
    if (ts_node_child_count(node) == 0 || is_atomic(type)) {
        push_token(node, out);
        return;
    }
    if (type == "template_string") {
        collect_template(node, out);
        return;
    }
    if (is_jsx_element(type)) {
        out.push_back(jsx_node(node));
        return;
    }
    if (is_typescript(source_type_) && collect_typescript(node, type, out)) {
        return;
    }
    if (type == "call_expression") {
        TSNode callee = field(node, "function");
        TSNode arguments = field(node, "arguments");
        if (!ts_node_is_null(callee) && type_of(callee) == "import" && !ts_node_is_null(arguments) &&
            ts_node_named_child_count(arguments) == 1 && type_of(ts_node_named_child(arguments, 0)) == "string") {
            specifier_roles_[ts_node_start_byte(ts_node_named_child(arguments, 0))] = SpecifierRole::Dynamic;
        }
    }
    collect_children(node, out);
}

void Parser::collect_children(TSNode node, NodeList& out) {
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collect(ts_node_child(node, i), out);
    }
}

// `a${b}c` becomes the pieces "`a${", b, "}c`"
void Parser::collect_template(TSNode node, NodeList& out) {
    uint32_t piece = ts_node_start_byte(node);
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode substitution = ts_node_child(node, i);
        if (type_of(substitution) != "template_substitution") {
            continue;
        }
        uint32_t parts = ts_node_child_count(substitution);
        TSNode open = ts_node_child(substitution, 0);
        TSNode close = ts_node_child(substitution, parts - 1);
        push_range(piece, ts_node_end_byte(open), TokenKind::Template, out);
        for (uint32_t j = 1; j + 1 < parts; ++j) {
            collect(ts_node_child(substitution, j), out);
        }
        piece = ts_node_start_byte(close);
    }
    push_range(piece, ts_node_end_byte(node), TokenKind::Template, out);
}

bool Parser::collect_typescript(TSNode node, std::string_view type, NodeList& out) {
    if (is_type_only(type)) {
        erase(node);
        return true;
    }
    if (auto construct = runtime_construct(type)) {
        fail_at(ts_node_start_byte(node),
                "TypeScript " + std::string(*construct) + " has no JavaScript equivalent; only type syntax is stripped");
    }

    // erases the children for which `drop` holds, collects the rest
    auto collect_except = [&](auto drop) {
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (drop(child, i)) {
                erase(child);
            } else {
                collect(child, out);
            }
        }
    };

    if (type == "as_expression" || type == "satisfies_expression" || type == "non_null_expression") {
        collect_except([](TSNode, uint32_t i) { return i > 0; });
        return true;
    }
    if (type == "required_parameter" || type == "optional_parameter") {
        if (!ts_node_is_null(first_named_child_of_type(node, "accessibility_modifier")) ||
            !ts_node_is_null(first_named_child_of_type(node, "override_modifier")) ||
            has_anonymous_child(node, "readonly")) {
            fail_at(ts_node_start_byte(node),
                    "TypeScript parameter property has no JavaScript equivalent; only type syntax is stripped");
        }
        collect_except([](TSNode child, uint32_t) { return is_anonymous(child, "?"); });
        return true;
    }
    if (type == "public_field_definition") {
        if (has_anonymous_child(node, "declare") || has_anonymous_child(node, "abstract")) {
            erase(node);
            return true;
        }
        collect_except([](TSNode child, uint32_t) {
            return is_anonymous(child, "readonly") || is_anonymous(child, "?") || is_anonymous(child, "!");
        });
        return true;
    }
    if (type == "method_definition" || type == "abstract_class_declaration") {
        collect_except([](TSNode child, uint32_t) {
            return is_anonymous(child, "?") || is_anonymous(child, "abstract") || is_anonymous(child, "readonly");
        });
        return true;
    }
    if (type == "variable_declarator") {
        collect_except([](TSNode child, uint32_t) { return is_anonymous(child, "!"); });
        return true;
    }
    if (type == "named_imports" || type == "export_clause") {
        // a type-only specifier goes together with its comma
        bool dropped = false;
        collect_except([&dropped](TSNode child, uint32_t) {
            if (dropped && is_anonymous(child, ",")) {
                dropped = false;
                return true;
            }
            dropped = (type_of(child) == "import_specifier" || type_of(child) == "export_specifier") &&
                      has_anonymous_child(child, "type");
            return dropped;
        });
        return true;
    }
    return false;
}

std::string Parser::take_leading(uint32_t start) {
    std::string leading = std::move(pending_trivia_);
    pending_trivia_.clear();
    if (start > last_end_) {
        leading.append(source_.substr(last_end_, start - last_end_));
    }
    return leading;
}

void Parser::push_token(TSNode node, NodeList& out) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start == end) {
        return;  // inserted semicolon
    }
    push_range(start, end, leaf_kind(type_of(node), source_.substr(start, end - start)), out);
    gate(out.back().token, ts_node_is_named(node));
}

void Parser::push_range(uint32_t start, uint32_t end, TokenKind kind, NodeList& out) {
    Node node;
    Token& token = node.token;
    token.kind = kind;
    token.text = std::string(source_.substr(start, end - start));
    token.leading = take_leading(start);
    token.newline_before = has_line_break(token.leading);
    token.pos = position_at(start);
    auto role = specifier_roles_.find(start);
    if (kind == TokenKind::String && role != specifier_roles_.end()) {
        token.role = role->second;
    }
    last_end_ = end;
    out.push_back(std::move(node));
}

// Drops a node, keeping the line breaks and comments before it
void Parser::erase(TSNode node) {
    uint32_t start = ts_node_start_byte(node);
    if (start > last_end_) {
        std::string_view gap = source_.substr(last_end_, start - last_end_);
        if (has_line_break(gap) || gap.find('/') != std::string_view::npos) {
            pending_trivia_.append(gap);
        }
    }
    last_end_ = std::max(last_end_, ts_node_end_byte(node));
}

Node Parser::jsx_node(TSNode node) {
    uint32_t start = ts_node_start_byte(node);
    Node result;
    result.token.kind = TokenKind::Identifier;
    result.token.leading = take_leading(start);
    result.token.newline_before = has_line_break(result.token.leading);
    result.token.pos = position_at(start);
    result.jsx = build_jsx(node);
    last_end_ = ts_node_end_byte(node);
    pending_trivia_.clear();
    return result;
}

std::unique_ptr<JsxElement> Parser::build_jsx(TSNode node) {
    auto element = std::make_unique<JsxElement>();
    element->pos = position_at(ts_node_start_byte(node));
    std::string_view type = type_of(node);
    uint32_t count = ts_node_child_count(node);

    if (type == "jsx_fragment") {
        // < > children < / >
        element->fragment = true;
        if (count >= 5) {
            build_jsx_children(node, ts_node_end_byte(ts_node_child(node, 1)),
                               ts_node_start_byte(ts_node_child(node, count - 3)), *element);
        }
        return element;
    }

    TSNode open = node;
    TSNode close{};
    if (type == "jsx_element") {
        open = field(node, "open_tag");
        close = field(node, "close_tag");
        if (ts_node_is_null(open)) {
            open = ts_node_named_child(node, 0);
        }
        if (ts_node_is_null(close)) {
            close = ts_node_named_child(node, ts_node_named_child_count(node) - 1);
        }
    }

    TSNode name = field(open, "name");
    element->fragment = ts_node_is_null(name);
    if (!element->fragment) {
        element->tag = leaf_text(name);
        element->tag_pos = position_at(ts_node_start_byte(name));
    }

    uint32_t attributes = ts_node_named_child_count(open);
    for (uint32_t i = 0; i < attributes; ++i) {
        TSNode attribute = ts_node_named_child(open, i);
        std::string_view attribute_type = type_of(attribute);
        if (attribute_type == "jsx_attribute" || attribute_type == "jsx_expression") {
            build_jsx_attribute(attribute, *element);
        }
    }

    if (!ts_node_is_null(close)) {
        TSNode close_name = field(close, "name");
        std::string closing = leaf_text(close_name);
        if (closing != element->tag) {
            fail_at(ts_node_start_byte(close), element->fragment
                                                   ? "expected '</>' to close the fragment"
                                                   : "expected '</" + element->tag + ">' to match <" +
                                                         element->tag + ">");
        }
        build_jsx_children(node, ts_node_end_byte(open), ts_node_start_byte(close), *element);
    }
    return element;
}

void Parser::build_jsx_attribute(TSNode node, JsxElement& element) {
    JsxAttribute attribute;
    attribute.pos = position_at(ts_node_start_byte(node));

    if (type_of(node) == "jsx_expression") {
        attribute.expression = jsx_expression(node, attribute.spread);
        if (!attribute.spread) {
            fail_at(ts_node_start_byte(node), "expected '...' in JSX spread attribute");
        }
        element.attributes.push_back(std::move(attribute));
        return;
    }

    TSNode name = ts_node_named_child(node, 0);
    attribute.name = leaf_text(name);
    TSNode value = ts_node_named_child_count(node) > 1 ? ts_node_named_child(node, 1) : TSNode{};
    if (!ts_node_is_null(value)) {
        std::string_view value_type = type_of(value);
        if (value_type == "string") {
            std::string_view raw = text_of(value);
            attribute.value_kind = JsxValueKind::String;
            attribute.string_value = std::string(raw.substr(1, raw.size() >= 2 ? raw.size() - 2 : 0));
        } else if (value_type == "jsx_expression") {
            bool spread = false;
            attribute.value_kind = JsxValueKind::Expression;
            attribute.expression = jsx_expression(value, spread);
            if (attribute.expression.empty() || spread) {
                fail_at(ts_node_start_byte(value), "JSX attribute value must be a non-empty expression");
            }
        } else if (is_jsx_element(value_type)) {
            attribute.value_kind = JsxValueKind::Element;
            attribute.element = build_jsx(value);
        }
    }
    element.attributes.push_back(std::move(attribute));
}

// Text children are the raw source between the structural children; the
// grammar keeps no whitespace of its own
void Parser::build_jsx_children(TSNode node, uint32_t first, uint32_t last, JsxElement& element) {
    uint32_t cursor = first;
    auto flush_text = [&](uint32_t end) {
        if (end > cursor) {
            JsxChild text;
            text.kind = JsxChildKind::Text;
            text.pos = position_at(cursor);
            text.text = std::string(source_.substr(cursor, end - cursor));
            element.children.push_back(std::move(text));
        }
    };

    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        uint32_t start = ts_node_start_byte(child);
        if (start < first) {
            continue;
        }
        if (start >= last) {
            break;
        }
        std::string_view type = type_of(child);
        if (!is_jsx_element(type) && type != "jsx_expression") {
            continue;
        }
        flush_text(start);
        JsxChild structural;
        structural.pos = position_at(start);
        if (type == "jsx_expression") {
            bool spread = false;
            structural.expression = jsx_expression(child, spread);
            structural.kind = spread ? JsxChildKind::Spread : JsxChildKind::Expression;
        } else {
            structural.kind = JsxChildKind::Element;
            structural.element = build_jsx(child);
        }
        element.children.push_back(std::move(structural));
        cursor = ts_node_end_byte(child);
    }
    flush_text(last);
}

NodeList Parser::jsx_expression(TSNode node, bool& spread) {
    spread = false;
    NodeList out;
    TSNode inner{};
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!ts_node_is_extra(child)) {
            inner = child;
            break;
        }
    }
    if (ts_node_is_null(inner)) {
        return out;  // {} or {/* comment */}
    }

    last_end_ = ts_node_start_byte(node) + 1;
    pending_trivia_.clear();
    if (type_of(inner) == "spread_element") {
        spread = true;
        uint32_t parts = ts_node_child_count(inner);
        for (uint32_t i = 0; i < parts; ++i) {
            TSNode part = ts_node_child(inner, i);
            if (is_anonymous(part, "...")) {
                last_end_ = ts_node_end_byte(part);
            } else {
                collect(part, out);
            }
        }
    } else {
        collect(inner, out);
    }
    if (!out.empty()) {
        std::string& leading = out.front().token.leading;
        if (leading.find_first_not_of(" \t\r\n") == std::string::npos) {
            leading.clear();
        }
    }
    last_end_ = ts_node_end_byte(node);
    pending_trivia_.clear();
    return out;
}

// @jsx and @jsxFrag comments; a value that is not a dotted name is ignored
void Parser::read_pragmas(TSNode root, Module& module) const {
    auto value_after = [](std::string_view comment, std::string_view tag) -> std::optional<std::string> {
        size_t at = 0;
        while ((at = comment.find(tag, at)) != std::string_view::npos) {
            size_t pos = at + tag.size();
            at = pos;
            if (pos >= comment.size() || (comment[pos] != ' ' && comment[pos] != '\t')) {
                continue;
            }
            while (pos < comment.size() && (comment[pos] == ' ' || comment[pos] == '\t')) {
                ++pos;
            }
            size_t end = pos;
            while (end < comment.size() && !std::isspace(static_cast<unsigned char>(comment[end])) &&
                   comment[end] != '*') {
                ++end;
            }
            if (end > pos) {
                return std::string(comment.substr(pos, end - pos));
            }
        }
        return std::nullopt;
    };

    std::vector<TSNode> comments;
    collect_comments(root, comments);
    for (TSNode comment : comments) {
        std::string_view text = text_of(comment);
        auto factory = value_after(text, "@jsx");
        if (factory && is_valid_factory_name(*factory)) {
            module.jsx_pragma = std::move(factory);
        }
        auto fragment = value_after(text, "@jsxFrag");
        if (fragment && is_valid_factory_name(*fragment)) {
            module.jsx_fragment_pragma = std::move(fragment);
        }
    }
}

}  // namespace jsxform
