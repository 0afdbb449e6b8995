#include "output_verifier.hpp"
#include "errors.hpp"

#include <sstream>
#include <stdexcept>

extern "C" {
#include "quickjs.h"
}

namespace jsxform {

namespace {

std::string describe_exception(JSContext* ctx) {
    JSValue exc = JS_GetException(ctx);
    std::ostringstream oss;

    const char* err_str = JS_ToCString(ctx, exc);
    if (err_str) {
        oss << err_str;
        JS_FreeCString(ctx, err_str);
    }

    // QuickJS puts the failing location into the stack
    JSValue stack = JS_GetPropertyStr(ctx, exc, "stack");
    if (!JS_IsUndefined(stack)) {
        const char* stack_str = JS_ToCString(ctx, stack);
        if (stack_str) {
            std::string location(stack_str);
            while (!location.empty() && (location.back() == '\n' || location.back() == ' ')) {
                location.pop_back();
            }
            if (!location.empty()) {
                oss << " " << location;
            }
            JS_FreeCString(ctx, stack_str);
        }
    }

    JS_FreeValue(ctx, stack);
    JS_FreeValue(ctx, exc);

    std::string message = oss.str();
    return message.empty() ? "unknown compilation error" : message;
}

}  // namespace

QuickJsVerifier::QuickJsVerifier(size_t max_memory_mb) {
    rt_ = JS_NewRuntime();
    if (!rt_) {
        throw std::runtime_error("Failed to create QuickJS runtime");
    }
    JS_SetMemoryLimit(rt_, max_memory_mb * 1024 * 1024);
}

QuickJsVerifier::~QuickJsVerifier() {
    if (rt_) {
        JS_FreeRuntime(rt_);
    }
}

void QuickJsVerifier::verify(std::string_view code, const std::string& filename) {
    // Worker threads have different stack addresses than the thread that
    // created the runtime
    JS_UpdateStackTop(rt_);

    JSContext* ctx = JS_NewContext(rt_);
    if (!ctx) {
        throw std::runtime_error("Failed to create QuickJS context for output verification");
    }

    // JS_Eval wants a terminated buffer
    std::string source(code);
    JSValue module = JS_Eval(ctx, source.c_str(), source.size(), filename.c_str(),
                             JS_EVAL_TYPE_MODULE | JS_EVAL_FLAG_COMPILE_ONLY);

    if (JS_IsException(module)) {
        std::string error = describe_exception(ctx);
        JS_FreeContext(ctx);
        throw EmitError("generated code for " + filename + " does not compile: " + error);
    }

    // The compiled module belongs to the context and goes away with it
    JS_FreeContext(ctx);
}

}  // namespace jsxform
