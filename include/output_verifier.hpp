#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Forward declare JSRuntime (from QuickJS)
struct JSRuntime;

namespace jsxform {

// Final check on generated code
class OutputVerifier {
public:
    virtual ~OutputVerifier() = default;

    // Throws EmitError when `code` is not a well-formed ES module
    virtual void verify(std::string_view code, const std::string& filename) = 0;
};

// Compiles (never runs) the output as an ES module in a QuickJS runtime.
// One instance per thread.
class QuickJsVerifier final : public OutputVerifier {
public:
    explicit QuickJsVerifier(size_t max_memory_mb = 64);
    ~QuickJsVerifier() override;

    QuickJsVerifier(const QuickJsVerifier&) = delete;
    QuickJsVerifier& operator=(const QuickJsVerifier&) = delete;
    QuickJsVerifier(QuickJsVerifier&&) = delete;
    QuickJsVerifier& operator=(QuickJsVerifier&&) = delete;

    void verify(std::string_view code, const std::string& filename) override;

private:
    JSRuntime* rt_ = nullptr;
};

}  // namespace jsxform
