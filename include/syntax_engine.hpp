#pragma once

#include "options.hpp"
#include "syntax.hpp"

#include <string>
#include <string_view>

namespace jsxform {

// The parse/print capability the pipeline is written against
class SyntaxEngine {
public:
    virtual ~SyntaxEngine() = default;

    // Throws ParseError
    [[nodiscard]] virtual Module parse(const std::string& filename, std::string_view source, TargetLevel target,
                                       SourceType source_type) = 0;

    // Consumes the tree. Throws EmitError on a tree it cannot serialize.
    [[nodiscard]] virtual TransformOutput print(Module module, bool source_map) = 0;
};

// JavaScript, JSX and TypeScript engine: tree-sitter grammars behind Parser,
// and Printer
class BuiltinSyntaxEngine final : public SyntaxEngine {
public:
    [[nodiscard]] Module parse(const std::string& filename, std::string_view source, TargetLevel target,
                               SourceType source_type) override;
    [[nodiscard]] TransformOutput print(Module module, bool source_map) override;
};

}  // namespace jsxform
