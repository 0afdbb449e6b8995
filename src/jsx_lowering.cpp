#include "jsx_lowering.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>
#include <vector>

namespace jsxform {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kNamedEntities = {{
    {"amp", "&"},
    {"lt", "<"},
    {"gt", ">"},
    {"quot", "\""},
    {"apos", "'"},
    {"nbsp", "\xC2\xA0"},
}};

bool is_identifier_name(std::string_view name) {
    if (name.empty() || !is_ident_start(name[0]) || name[0] == '\\') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) { return is_ident_part(c) && c != '\\'; });
}

void push(NodeList& out, TokenKind kind, std::string text, const SourcePos& pos, std::string leading = {}) {
    out.push_back(make_node(make_token(kind, std::move(text), pos, std::move(leading))));
}

// Moves an expression in; `spaced` puts one space before it when it has no trivia of its own
void push_expression(NodeList& out, NodeList& expression, bool spaced) {
    for (size_t i = 0; i < expression.size(); ++i) {
        if (i == 0 && spaced && expression[i].token.leading.empty()) {
            expression[i].token.leading = " ";
        }
        out.push_back(std::move(expression[i]));
    }
    expression.clear();
}

}  // namespace

JsxLowering::JsxLowering(std::string factory, std::string fragment_factory, TargetLevel target)
    : factory_(std::move(factory))
    , fragment_factory_(std::move(fragment_factory))
    , target_(target)
{
}

bool JsxLowering::is_intrinsic_tag(std::string_view tag) noexcept {
    if (tag.empty()) {
        return false;
    }
    if (tag.find('-') != std::string_view::npos || tag.find(':') != std::string_view::npos) {
        return true;
    }
    return std::islower(static_cast<unsigned char>(tag[0])) && tag.find('.') == std::string_view::npos;
}

std::string JsxLowering::decode_entities(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }
        size_t semi = text.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10) {
            out += text[i++];
            continue;
        }
        std::string_view entity = text.substr(i + 1, semi - i - 1);
        bool decoded = false;

        if (entity.size() > 1 && entity[0] == '#') {
            bool hex = entity[1] == 'x' || entity[1] == 'X';
            std::string_view digits = entity.substr(hex ? 2 : 1);
            uint32_t cp = 0;
            bool valid = !digits.empty();
            for (char c : digits) {
                int value = hex ? (std::isxdigit(static_cast<unsigned char>(c))
                                       ? (std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : (std::tolower(c) - 'a' + 10))
                                       : -1)
                                : (std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : -1);
                if (value < 0 || cp > 0x10FFFF) {
                    valid = false;
                    break;
                }
                cp = cp * (hex ? 16 : 10) + static_cast<uint32_t>(value);
            }
            if (valid && cp <= 0x10FFFF) {
                append_utf8(out, cp);
                decoded = true;
            }
        } else {
            for (const auto& [name, value] : kNamedEntities) {
                if (entity == name) {
                    out += value;
                    decoded = true;
                    break;
                }
            }
        }

        if (decoded) {
            i = semi + 1;
        } else {
            out += text[i++];
        }
    }
    return out;
}

std::string JsxLowering::clean_text(std::string_view text) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            lines.push_back(std::move(current));
            current.clear();
        } else {
            current += c == '\t' ? ' ' : c;
        }
    }
    lines.push_back(std::move(current));

    size_t last_non_empty = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].find_first_not_of(' ') != std::string::npos) {
            last_non_empty = i;
        }
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = lines[i];
        if (i != 0) {
            line.erase(0, line.find_first_not_of(' ') == std::string::npos ? line.size() : line.find_first_not_of(' '));
        }
        if (i + 1 != lines.size()) {
            size_t end = line.find_last_not_of(' ');
            line.erase(end == std::string::npos ? 0 : end + 1);
        }
        if (!line.empty()) {
            if (i != last_non_empty) {
                line += ' ';
            }
            out += line;
        }
    }
    return out;
}

NodeList JsxLowering::lower(JsxElement& element, std::string leading) const {
    NodeList out;
    emit_element(element, out, std::move(leading));
    return out;
}

void JsxLowering::emit_element(JsxElement& element, NodeList& out, std::string leading) const {
    push(out, TokenKind::Identifier, factory_, element.pos, std::move(leading));
    push(out, TokenKind::Punctuator, "(", element.pos);

    if (element.fragment) {
        push(out, TokenKind::Identifier, fragment_factory_, element.pos);
    } else if (is_intrinsic_tag(element.tag)) {
        push(out, TokenKind::String, quote_js_string(element.tag), element.tag_pos);
    } else {
        push(out, TokenKind::Identifier, element.tag, element.tag_pos);
    }

    push(out, TokenKind::Punctuator, ",", element.pos);
    emit_props(element, out);

    for (auto& child : element.children) {
        switch (child.kind) {
        case JsxChildKind::Text: {
            std::string text = clean_text(decode_entities(child.text));
            if (text.empty()) {
                break;
            }
            push(out, TokenKind::Punctuator, ",", child.pos);
            push(out, TokenKind::String, quote_js_string(text), child.pos, " ");
            break;
        }
        case JsxChildKind::Expression:
            if (child.expression.empty()) {
                break;
            }
            push(out, TokenKind::Punctuator, ",", child.pos);
            push_expression(out, child.expression, true);
            break;
        case JsxChildKind::Spread:
            push(out, TokenKind::Punctuator, ",", child.pos);
            push(out, TokenKind::Punctuator, "...", child.pos, " ");
            push_expression(out, child.expression, false);
            break;
        case JsxChildKind::Element:
            push(out, TokenKind::Punctuator, ",", child.pos);
            emit_element(*child.element, out, " ");
            break;
        }
    }

    push(out, TokenKind::Punctuator, ")", element.pos);
}

void JsxLowering::emit_props(JsxElement& element, NodeList& out) const {
    if (element.attributes.empty()) {
        push(out, TokenKind::Keyword, "null", element.pos, " ");
        return;
    }

    const bool has_spread = std::any_of(element.attributes.begin(), element.attributes.end(),
                                        [](const JsxAttribute& a) { return a.spread; });

    if (!has_spread || target_ >= TargetLevel::ES2018) {
        push(out, TokenKind::Punctuator, "{", element.pos, " ");
        for (size_t i = 0; i < element.attributes.size(); ++i) {
            if (i > 0) {
                push(out, TokenKind::Punctuator, ",", element.attributes[i].pos);
            }
            emit_attribute(element.attributes[i], out, true);
        }
        push(out, TokenKind::Punctuator, "}", element.pos, " ");
        return;
    }

    // Object.assign({}, spread, { a: 1 }, spread2)
    push(out, TokenKind::Identifier, "Object.assign", element.pos, " ");
    push(out, TokenKind::Punctuator, "(", element.pos);
    push(out, TokenKind::Punctuator, "{", element.pos);
    push(out, TokenKind::Punctuator, "}", element.pos);

    bool group_open = false;
    bool first_in_group = true;
    for (auto& attribute : element.attributes) {
        if (attribute.spread) {
            if (group_open) {
                push(out, TokenKind::Punctuator, "}", element.pos, " ");
                group_open = false;
            }
            push(out, TokenKind::Punctuator, ",", attribute.pos);
            push_expression(out, attribute.expression, true);
            continue;
        }
        if (!group_open) {
            push(out, TokenKind::Punctuator, ",", attribute.pos);
            push(out, TokenKind::Punctuator, "{", attribute.pos, " ");
            group_open = true;
            first_in_group = true;
        }
        if (!first_in_group) {
            push(out, TokenKind::Punctuator, ",", attribute.pos);
        }
        emit_attribute(attribute, out, true);
        first_in_group = false;
    }
    if (group_open) {
        push(out, TokenKind::Punctuator, "}", element.pos, " ");
    }
    push(out, TokenKind::Punctuator, ")", element.pos);
}

void JsxLowering::emit_attribute(JsxAttribute& attribute, NodeList& out, bool spaced) const {
    const std::string space = spaced ? " " : "";
    if (attribute.spread) {
        push(out, TokenKind::Punctuator, "...", attribute.pos, space);
        push_expression(out, attribute.expression, false);
        return;
    }

    if (is_identifier_name(attribute.name)) {
        push(out, TokenKind::Identifier, attribute.name, attribute.pos, space);
    } else {
        push(out, TokenKind::String, quote_js_string(attribute.name), attribute.pos, space);
    }
    push(out, TokenKind::Punctuator, ":", attribute.pos);

    switch (attribute.value_kind) {
    case JsxValueKind::None:
        push(out, TokenKind::Keyword, "true", attribute.pos, " ");
        break;
    case JsxValueKind::String:
        push(out, TokenKind::String, quote_js_string(decode_entities(attribute.string_value)), attribute.pos, " ");
        break;
    case JsxValueKind::Expression:
        push_expression(out, attribute.expression, true);
        break;
    case JsxValueKind::Element:
        if (!attribute.element) {
            throw EmitError("JSX attribute '" + attribute.name + "' lost its element value");
        }
        emit_element(*attribute.element, out, " ");
        break;
    }
}

}  // namespace jsxform
