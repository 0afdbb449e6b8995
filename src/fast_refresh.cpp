#include "fast_refresh.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <unordered_set>

namespace jsxform {

namespace {

constexpr std::array<std::string_view, 15> kBuiltinHooks = {
    "useState", "useReducer", "useEffect", "useLayoutEffect", "useInsertionEffect",
    "useMemo", "useCallback", "useRef", "useContext", "useImperativeHandle",
    "useDebugValue", "useId", "useDeferredValue", "useTransition", "useSyncExternalStore",
};

constexpr std::array<std::string_view, 4> kComponentBases = {
    "Component", "PureComponent", "React.Component", "React.PureComponent",
};

const Token* token_at(const NodeList& items, size_t i) {
    return i < items.size() && items[i].is_token() ? &items[i].token : nullptr;
}

bool punct_at(const NodeList& items, size_t i, std::string_view p) {
    const Token* t = token_at(items, i);
    return t != nullptr && t->is_punct(p);
}

// Index of the bracket opened by the one closing at `close`, or items.size()
size_t find_opening(const NodeList& items, size_t close) {
    int depth = 0;
    for (size_t i = close + 1; i-- > 0;) {
        const Token* t = token_at(items, i);
        if (t == nullptr || t->kind != TokenKind::Punctuator) {
            continue;
        }
        if (t->text == ")" || t->text == "]" || t->text == "}") {
            ++depth;
        } else if (t->text == "(" || t->text == "[" || t->text == "{") {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return items.size();
}

// End of the expression starting at `first`: the first ',' or ';' outside
// brackets and template substitutions, or `last`
size_t expression_end(const NodeList& items, size_t first, size_t last) {
    int depth = 0;
    for (size_t i = first; i < last; ++i) {
        const Token* t = token_at(items, i);
        if (t == nullptr) {
            continue;
        }
        if (t->kind == TokenKind::Template) {
            if (t->text.front() == '`' && t->text.size() >= 3 && t->text.compare(t->text.size() - 2, 2, "${") == 0) {
                ++depth;
            } else if (t->text.front() == '}' && t->text.back() == '`') {
                --depth;
            }
            continue;
        }
        if (t->kind != TokenKind::Punctuator) {
            continue;
        }
        if (t->text == "(" || t->text == "[" || t->text == "{") {
            ++depth;
        } else if (t->text == ")" || t->text == "]" || t->text == "}") {
            if (depth == 0) {
                return i;
            }
            --depth;
        } else if (depth == 0 && (t->text == "," || t->text == ";")) {
            return i;
        }
    }
    return last;
}

// `{` opening the body of a nested function, as opposed to a block or an
// object literal
bool opens_nested_function(const NodeList& items, size_t brace, size_t first) {
    if (brace <= first) {
        return false;
    }
    const Token* prev = token_at(items, brace - 1);
    if (prev == nullptr) {
        return false;
    }
    if (prev->is_punct("=>")) {
        return true;
    }
    if (!prev->is_punct(")")) {
        return false;
    }
    size_t open = find_opening(items, brace - 1);
    if (open == 0 || open >= items.size()) {
        return false;
    }
    const Token* before = token_at(items, open - 1);
    return before != nullptr && !(before->is_keyword("if") || before->is_keyword("for") ||
                                  before->is_keyword("while") || before->is_keyword("switch") ||
                                  before->is_keyword("catch") || before->is_keyword("with"));
}

// Source of argument `index` of the call whose '(' is at `paren`
std::optional<std::string> call_argument(const NodeList& items, size_t paren, size_t index) {
    size_t close = find_closing(items, paren);
    size_t start = paren + 1;
    for (size_t n = 0; start < close; ++n) {
        size_t end = expression_end(items, start, close);
        if (n == index) {
            return end > start ? std::optional<std::string>(items_text(items, start, end)) : std::nullopt;
        }
        start = end + 1;
    }
    return std::nullopt;
}

void push(NodeList& out, TokenKind kind, std::string text, const SourcePos& pos, std::string leading = {}) {
    out.push_back(make_node(make_token(kind, std::move(text), pos, std::move(leading))));
}

Statement generated_statement(NodeList items) {
    Statement statement;
    statement.items = std::move(items);
    return statement;
}

}  // namespace

bool FastRefresh::is_component_name(std::string_view name) noexcept {
    return !name.empty() && name[0] >= 'A' && name[0] <= 'Z';
}

bool FastRefresh::is_hook_name(std::string_view name) noexcept {
    return name.size() > 3 && name.compare(0, 3, "use") == 0 && name[3] >= 'A' && name[3] <= 'Z';
}

bool FastRefresh::is_builtin_hook(std::string_view name) noexcept {
    return std::find(kBuiltinHooks.begin(), kBuiltinHooks.end(), name) != kBuiltinHooks.end();
}

bool FastRefresh::is_component_base(std::string_view heritage) noexcept {
    return std::find(kComponentBases.begin(), kComponentBases.end(), heritage) != kComponentBases.end();
}

std::string FastRefresh::signature_key(const std::vector<HookCall>& hooks) {
    std::string key;
    for (size_t i = 0; i < hooks.size(); ++i) {
        if (i > 0) {
            key += '\n';
        }
        key += hooks[i].name + "{" + hooks[i].key + "}";
    }
    return key;
}

std::string FastRefresh::signature_hash(std::string_view key) {
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(key.data()), key.size(), digest);

    // 4 output bytes per 3 input bytes, plus the terminator
    unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
    int length = EVP_EncodeBlock(encoded, digest, SHA_DIGEST_LENGTH);
    return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(length));
}

std::vector<HookCall> FastRefresh::find_hook_calls(const NodeList& items, size_t first, size_t last) {
    std::vector<HookCall> hooks;
    last = std::min(last, items.size());

    for (size_t i = first; i < last; ++i) {
        const Token* t = token_at(items, i);
        if (t == nullptr) {
            continue;
        }
        if (t->is_punct("{") && opens_nested_function(items, i, first)) {
            i = find_closing(items, i);
            continue;
        }
        if (t->kind != TokenKind::Identifier || !is_hook_name(t->text) || !punct_at(items, i + 1, "(")) {
            continue;
        }

        HookCall hook;
        hook.name = t->text;
        hook.callee = t->text;
        size_t start = i;
        if (i > first && (punct_at(items, i - 1, ".") || punct_at(items, i - 1, "?."))) {
            // React.useState; deeper member chains are not hook calls we track
            const Token* object = i >= first + 2 ? token_at(items, i - 2) : nullptr;
            if (object == nullptr || object->kind != TokenKind::Identifier ||
                (i >= first + 3 && punct_at(items, i - 3, "."))) {
                continue;
            }
            hook.callee = object->text + "." + t->text;
            start = i - 2;
        }

        // const <binding> = useX(...)
        if (start > first && punct_at(items, start - 1, "=") && start >= first + 2) {
            size_t end = start - 2;
            const Token* binding = token_at(items, end);
            size_t begin = end;
            if (binding != nullptr && (binding->is_punct("]") || binding->is_punct("}"))) {
                begin = find_opening(items, end);
            } else if (binding == nullptr || binding->kind != TokenKind::Identifier) {
                begin = items.size();
            }
            if (begin < items.size() && begin > first) {
                const Token* declarator = token_at(items, begin - 1);
                if (declarator != nullptr && (declarator->is_keyword("const") || declarator->is_keyword("var") ||
                                              declarator->is_name("let") || declarator->is_punct(","))) {
                    hook.key = items_text(items, begin, end + 1);
                }
            }
        }

        if (hook.name == "useState") {
            if (auto initial = call_argument(items, i + 1, 0)) {
                hook.key += "(" + *initial + ")";
            }
        } else if (hook.name == "useReducer") {
            if (auto initial = call_argument(items, i + 1, 1)) {
                hook.key += "(" + *initial + ")";
            }
        }
        hooks.push_back(std::move(hook));
    }
    return hooks;
}

bool FastRefresh::locate_function_body(const Statement& statement, FunctionBody& body) {
    const NodeList& items = statement.items;
    size_t i = 0;
    while (i < items.size() && !(items[i].is_token() && items[i].token.is_keyword("function"))) {
        ++i;
    }
    while (i < items.size() && !punct_at(items, i, "(")) {
        ++i;
    }
    if (i >= items.size()) {
        return false;
    }
    size_t open = find_closing(items, i) + 1;
    if (!punct_at(items, open, "{")) {
        return false;
    }
    body.open = open;
    body.close = find_closing(items, open);
    body.expression = false;
    return body.close < items.size();
}

bool FastRefresh::locate_initializer_body(const Statement& statement, FunctionBody& body) {
    const NodeList& items = statement.items;
    size_t i = 0;
    while (i < items.size()) {
        const Token* t = token_at(items, i);
        if (t != nullptr && (t->is_keyword("const") || t->is_keyword("var") || t->is_name("let"))) {
            break;
        }
        ++i;
    }
    size_t name = i + 1;
    const Token* binding = token_at(items, name);
    if (binding == nullptr || binding->text != statement.name || !punct_at(items, name + 1, "=")) {
        return false;
    }

    size_t init = name + 2;
    const Token* head = token_at(items, init);
    if (head != nullptr && head->is_name("async") && !punct_at(items, init + 1, "=>")) {
        head = token_at(items, ++init);
    }
    if (head == nullptr) {
        return false;
    }

    size_t arrow = items.size();
    if (head->is_keyword("function")) {
        size_t paren = init;
        while (paren < items.size() && !punct_at(items, paren, "(")) {
            ++paren;
        }
        if (paren >= items.size()) {
            return false;
        }
        size_t open = find_closing(items, paren) + 1;
        if (!punct_at(items, open, "{")) {
            return false;
        }
        body = FunctionBody{open, find_closing(items, open), false};
        return body.close < items.size();
    }
    if (head->is_punct("(")) {
        arrow = find_closing(items, init) + 1;
    } else if (head->kind == TokenKind::Identifier) {
        arrow = init + 1;
    }
    if (!punct_at(items, arrow, "=>")) {
        return false;
    }

    size_t start = arrow + 1;
    if (punct_at(items, start, "{")) {
        body = FunctionBody{start, find_closing(items, start), false};
        return body.close < items.size();
    }
    size_t end = expression_end(items, start, items.size());
    if (end <= start) {
        return false;
    }
    body = FunctionBody{start, end, true};
    return true;
}

std::string FastRefresh::next_signature_name() {
    ++signature_count_;
    return signature_count_ == 1 ? "_s" : "_s" + std::to_string(signature_count_);
}

size_t FastRefresh::instrument(Module& module) {
    std::unordered_set<std::string> exported_names;
    for (const auto& statement : module.body) {
        if (statement.kind == StatementKind::ExportNamed) {
            exported_names.insert(statement.export_names.begin(), statement.export_names.end());
        } else if (statement.kind == StatementKind::ExportDefault && !statement.name.empty()) {
            exported_names.insert(statement.name);
        }
    }

    size_t registered = 0;
    std::vector<Statement> body;
    body.reserve(module.body.size());

    for (auto& statement : module.body) {
        const bool declaration = statement.kind == StatementKind::Function ||
                                 statement.kind == StatementKind::Variable ||
                                 statement.kind == StatementKind::Class;
        const bool exported = statement.exported || exported_names.count(statement.name) > 0;
        if (!declaration || !exported || !is_component_name(statement.name) || statement.items.empty()) {
            body.push_back(std::move(statement));
            continue;
        }

        const std::string name = statement.name;
        const SourcePos origin = statement.items.front().token.pos;

        std::vector<HookCall> hooks;
        std::string signature;
        if (statement.kind == StatementKind::Class) {
            if (!is_component_base(statement.heritage)) {
                body.push_back(std::move(statement));
                continue;
            }
        } else {
            FunctionBody fn;
            bool found = statement.kind == StatementKind::Function ? locate_function_body(statement, fn)
                                                                    : locate_initializer_body(statement, fn);
            if (!found) {
                body.push_back(std::move(statement));
                continue;
            }
            hooks = fn.expression ? find_hook_calls(statement.items, fn.open, fn.close)
                                  : find_hook_calls(statement.items, fn.open + 1, fn.close);

            if (!hooks.empty()) {
                signature = next_signature_name();

                NodeList declare;
                push(declare, TokenKind::Keyword, "var", origin, statement.items.front().token.leading);
                push(declare, TokenKind::Identifier, signature, origin, " ");
                push(declare, TokenKind::Punctuator, "=", origin, " ");
                push(declare, TokenKind::Identifier, "$RefreshSig$", origin, " ");
                push(declare, TokenKind::Punctuator, "(", origin);
                push(declare, TokenKind::Punctuator, ")", origin);
                push(declare, TokenKind::Punctuator, ";", origin);
                body.push_back(generated_statement(std::move(declare)));
                statement.items.front().token.leading = "\n";

                NodeList call;
                const SourcePos body_pos = statement.items[fn.open].token.pos;
                if (fn.expression) {
                    // => expr  becomes  => { _s(); return (expr); }
                    push(call, TokenKind::Punctuator, "{", body_pos, statement.items[fn.open].token.leading);
                    statement.items[fn.open].token.leading.clear();
                }
                push(call, TokenKind::Identifier, signature, body_pos, " ");
                push(call, TokenKind::Punctuator, "(", body_pos);
                push(call, TokenKind::Punctuator, ")", body_pos);
                push(call, TokenKind::Punctuator, ";", body_pos);

                if (fn.expression) {
                    push(call, TokenKind::Keyword, "return", body_pos, " ");
                    push(call, TokenKind::Punctuator, "(", body_pos, " ");
                    NodeList tail;
                    push(tail, TokenKind::Punctuator, ")", body_pos);
                    push(tail, TokenKind::Punctuator, ";", body_pos);
                    push(tail, TokenKind::Punctuator, "}", body_pos, " ");
                    statement.items.insert(statement.items.begin() + static_cast<std::ptrdiff_t>(fn.close),
                                           std::make_move_iterator(tail.begin()), std::make_move_iterator(tail.end()));
                    statement.items.insert(statement.items.begin() + static_cast<std::ptrdiff_t>(fn.open),
                                           std::make_move_iterator(call.begin()), std::make_move_iterator(call.end()));
                } else {
                    statement.items.insert(statement.items.begin() + static_cast<std::ptrdiff_t>(fn.open + 1),
                                           std::make_move_iterator(call.begin()), std::make_move_iterator(call.end()));
                }
            }
        }

        body.push_back(std::move(statement));

        if (!hooks.empty()) {
            NodeList sign;
            push(sign, TokenKind::Identifier, signature, origin, "\n");
            push(sign, TokenKind::Punctuator, "(", origin);
            push(sign, TokenKind::Identifier, name, origin);
            push(sign, TokenKind::Punctuator, ",", origin);
            push(sign, TokenKind::String, quote_js_string(signature_hash(signature_key(hooks))), origin, " ");

            std::vector<std::string> custom;
            for (const auto& hook : hooks) {
                if (!is_builtin_hook(hook.name) &&
                    std::find(custom.begin(), custom.end(), hook.callee) == custom.end()) {
                    custom.push_back(hook.callee);
                }
            }
            if (!custom.empty()) {
                push(sign, TokenKind::Punctuator, ",", origin);
                push(sign, TokenKind::Keyword, "false", origin, " ");
                push(sign, TokenKind::Punctuator, ",", origin);
                push(sign, TokenKind::Keyword, "function", origin, " ");
                push(sign, TokenKind::Punctuator, "(", origin, " ");
                push(sign, TokenKind::Punctuator, ")", origin);
                push(sign, TokenKind::Punctuator, "{", origin, " ");
                push(sign, TokenKind::Keyword, "return", origin, " ");
                push(sign, TokenKind::Punctuator, "[", origin, " ");
                for (size_t i = 0; i < custom.size(); ++i) {
                    if (i > 0) {
                        push(sign, TokenKind::Punctuator, ",", origin);
                    }
                    push(sign, TokenKind::Identifier, custom[i], origin, i > 0 ? " " : "");
                }
                push(sign, TokenKind::Punctuator, "]", origin);
                push(sign, TokenKind::Punctuator, ";", origin);
                push(sign, TokenKind::Punctuator, "}", origin, " ");
            }
            push(sign, TokenKind::Punctuator, ")", origin);
            push(sign, TokenKind::Punctuator, ";", origin);
            body.push_back(generated_statement(std::move(sign)));
        }

        NodeList reg;
        push(reg, TokenKind::Identifier, "$RefreshReg$", origin, "\n");
        push(reg, TokenKind::Punctuator, "(", origin);
        push(reg, TokenKind::Identifier, name, origin);
        push(reg, TokenKind::Punctuator, ",", origin);
        push(reg, TokenKind::String, quote_js_string(name), origin, " ");
        push(reg, TokenKind::Punctuator, ")", origin);
        push(reg, TokenKind::Punctuator, ";", origin);
        body.push_back(generated_statement(std::move(reg)));
        ++registered;
    }

    module.body = std::move(body);
    return registered;
}

}  // namespace jsxform
