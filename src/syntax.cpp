#include "syntax.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>

namespace jsxform {

size_t find_closing(const NodeList& items, size_t open) {
    int depth = 0;
    for (size_t i = open; i < items.size(); ++i) {
        const Node& node = items[i];
        if (node.is_jsx() || node.token.kind != TokenKind::Punctuator) {
            continue;
        }
        const std::string& t = node.token.text;
        if (t == "(" || t == "[" || t == "{") {
            ++depth;
        } else if (t == ")" || t == "]" || t == "}") {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return items.size();
}

std::string items_text(const NodeList& items, size_t first, size_t last) {
    std::string text;
    for (size_t i = first; i < last && i < items.size(); ++i) {
        if (i != first) {
            text += items[i].token.leading;
        }
        text += items[i].token.text;
    }
    return text;
}

std::string quote_js_string(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buf;
            } else if (c == '\xE2' && i + 2 < text.size() && text[i + 1] == '\x80' &&
                       (text[i + 2] == '\xA8' || text[i + 2] == '\xA9')) {
                out += text[i + 2] == '\xA8' ? "\\u2028" : "\\u2029";
                i += 2;
            } else {
                out += c;
            }
        }
    }
    out += '"';
    return out;
}

namespace {

constexpr std::array<std::string_view, 36> kReservedWords = {
    "break", "case", "catch", "class", "const", "continue", "debugger", "default",
    "delete", "do", "else", "enum", "export", "extends", "false", "finally",
    "for", "function", "if", "import", "in", "instanceof", "new", "null",
    "return", "super", "switch", "this", "throw", "true", "try", "typeof",
    "var", "void", "while", "with",
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// Reads `count` hex digits at body[i]; -1 when they are not all there
int64_t read_hex(std::string_view body, size_t i, size_t count) {
    if (i + count > body.size()) {
        return -1;
    }
    int64_t value = 0;
    for (size_t k = 0; k < count; ++k) {
        int digit = hex_value(body[i + k]);
        if (digit < 0) {
            return -1;
        }
        value = value * 16 + digit;
    }
    return value;
}

bool is_high_surrogate(int64_t unit) {
    return unit >= 0xD800 && unit <= 0xDBFF;
}

bool is_low_surrogate(int64_t unit) {
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

}  // namespace

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string string_literal_value(std::string_view literal) {
    if (literal.size() < 2) {
        return std::string(literal);
    }
    std::string_view body = literal.substr(1, literal.size() - 2);
    std::string out;
    out.reserve(body.size());
    size_t i = 0;
    while (i < body.size()) {
        if (body[i] != '\\' || i + 1 >= body.size()) {
            out += body[i++];
            continue;
        }
        char next = body[i + 1];
        i += 2;
        switch (next) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'v': out += '\v'; break;
        case '\r':
            // line continuation
            if (i < body.size() && body[i] == '\n') {
                ++i;
            }
            break;
        case '\n':
            break;
        case 'x': {
            int64_t value = read_hex(body, i, 2);
            if (value < 0) {
                out += next;
                break;
            }
            append_utf8(out, static_cast<uint32_t>(value));
            i += 2;
            break;
        }
        case 'u': {
            int64_t unit = -1;
            if (i < body.size() && body[i] == '{') {
                size_t close = body.find('}', i);
                if (close != std::string_view::npos && close > i + 1 && close - i - 1 <= 6) {
                    unit = read_hex(body, i + 1, close - i - 1);
                    if (unit >= 0 && unit <= 0x10FFFF) {
                        i = close + 1;
                    } else {
                        unit = -1;
                    }
                }
            } else {
                unit = read_hex(body, i, 4);
                if (unit >= 0) {
                    i += 4;
                    // a surrogate pair decodes to one code point
                    if (is_high_surrogate(unit) && i + 6 <= body.size() && body[i] == '\\' && body[i + 1] == 'u') {
                        int64_t low = read_hex(body, i + 2, 4);
                        if (is_low_surrogate(low)) {
                            unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                            i += 6;
                        }
                    }
                }
            }
            if (unit < 0) {
                out += next;
                break;
            }
            append_utf8(out, static_cast<uint32_t>(unit));
            break;
        }
        default:
            if (next >= '0' && next <= '7') {
                // \0 and legacy octal escapes, up to \377
                uint32_t value = static_cast<uint32_t>(next - '0');
                size_t max_digits = next <= '3' ? 2 : 1;
                for (size_t k = 0; k < max_digits && i < body.size() && body[i] >= '0' && body[i] <= '7'; ++k) {
                    value = value * 8 + static_cast<uint32_t>(body[i++] - '0');
                }
                append_utf8(out, value);
            } else if (next == '\xE2' && i + 1 < body.size() && body[i] == '\x80' &&
                       (body[i + 1] == '\xA8' || body[i + 1] == '\xA9')) {
                // line continuation over U+2028 / U+2029
                i += 2;
            } else {
                out += next;
            }
        }
    }
    return out;
}

bool is_ident_start(char c) noexcept {
    auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || c == '$' || c == '\\' || uc >= 0x80;
}

bool is_ident_part(char c) noexcept {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool is_reserved_word(std::string_view word) noexcept {
    return std::find(kReservedWords.begin(), kReservedWords.end(), word) != kReservedWords.end();
}

}  // namespace jsxform
