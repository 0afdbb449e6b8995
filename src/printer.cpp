#include "printer.hpp"
#include "errors.hpp"

namespace jsxform {

namespace {

// Two tokens that would lex as one when written back to back
bool needs_space(char before, char after) {
    if (is_ident_part(before) && is_ident_part(after)) {
        return true;
    }
    return (before == '+' && after == '+') || (before == '-' && after == '-') ||
           (before == '/' && (after == '/' || after == '*'));
}

}  // namespace

Printer::Printer(bool source_map)
    : source_map_(source_map)
{
}

TransformOutput Printer::print(const Module& module) {
    out_.clear();
    out_.reserve(module.source.size() + module.source.size() / 4);
    line_ = 0;
    column_ = 0;
    map_ = SourceMapBuilder();

    for (const auto& statement : module.body) {
        for (const auto& node : statement.items) {
            write_node(node, module);
        }
    }
    append(module.trailing);

    TransformOutput output;
    output.code = std::move(out_);
    if (source_map_) {
        output.map = map_.to_json(module.filename, module.source);
    }
    return output;
}

void Printer::write_node(const Node& node, const Module& module) {
    if (node.is_jsx()) {
        throw EmitError("JSX element at " + std::to_string(node.token.pos.line + 1) + ":" +
                        std::to_string(node.token.pos.column + 1) + " in " + module.filename +
                        " was not lowered");
    }
    write_token(node.token);
}

void Printer::write_token(const Token& token) {
    if (token.kind == TokenKind::EndOfFile) {
        throw EmitError("end-of-input token inside a statement");
    }
    append(token.leading);
    if (token.text.empty()) {
        return;
    }
    if (token.leading.empty() && !out_.empty() && needs_space(out_.back(), token.text.front())) {
        append(" ");
    }
    if (source_map_) {
        map_.add_mapping(line_, column_, token.pos);
    }
    append(token.text);
}

void Printer::append(std::string_view text) {
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' || (c == '\r' && (i + 1 >= text.size() || text[i + 1] != '\n'))) {
            ++line_;
            column_ = 0;
        } else if (c == '\xE2' && i + 2 < text.size() && text[i + 1] == '\x80' &&
                   (text[i + 2] == '\xA8' || text[i + 2] == '\xA9')) {
            ++line_;
            column_ = 0;
            out_.append(text.substr(i, 3));
            i += 2;
            continue;
        } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80 && c != '\r') {
            ++column_;
        }
        out_ += c;
    }
}

}  // namespace jsxform
