#pragma once

#include "syntax.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jsxform {

struct HookCall {
    std::string name;    // useState
    std::string callee;  // React.useState
    std::string key;     // binding and, for state hooks, the initial value
};

// Development-mode component registration for React Fast Refresh.
//
//   var _s = $RefreshSig$();
//   export function App() { _s(); const [n, setN] = useState(0); ... }
//   _s(App, "<base64 sha1 of useState{[n, setN](0)}>");
//   $RefreshReg$(App, "App");
class FastRefresh {
public:
    // Instruments module-level component declarations in place; returns the
    // number of registered components
    size_t instrument(Module& module);

    // Hook calls made directly by the function body items[first, last);
    // nested function bodies are skipped
    [[nodiscard]] static std::vector<HookCall> find_hook_calls(const NodeList& items, size_t first, size_t last);

    // React Refresh signature key: one "name{key}" line per hook call
    [[nodiscard]] static std::string signature_key(const std::vector<HookCall>& hooks);

    // Base64 of the SHA-1 digest of the key
    [[nodiscard]] static std::string signature_hash(std::string_view key);

    [[nodiscard]] static bool is_component_name(std::string_view name) noexcept;
    [[nodiscard]] static bool is_hook_name(std::string_view name) noexcept;
    [[nodiscard]] static bool is_builtin_hook(std::string_view name) noexcept;
    [[nodiscard]] static bool is_component_base(std::string_view heritage) noexcept;

private:
    struct FunctionBody {
        size_t open = 0;    // index of '{', or of the first expression token
        size_t close = 0;   // index of '}', or one past the expression
        bool expression = false;
    };

    [[nodiscard]] static bool locate_function_body(const Statement& statement, FunctionBody& body);
    [[nodiscard]] static bool locate_initializer_body(const Statement& statement, FunctionBody& body);

    [[nodiscard]] std::string next_signature_name();

    size_t signature_count_ = 0;
};

}  // namespace jsxform
