#pragma once

#include "source_map.hpp"
#include "syntax.hpp"

#include <string>
#include <string_view>

namespace jsxform {

// Serializes a Module: every token is written after its own leading trivia,
// so untouched code round-trips byte for byte. Throws EmitError when the
// tree still holds JSX.
class Printer {
public:
    explicit Printer(bool source_map);

    [[nodiscard]] TransformOutput print(const Module& module);

private:
    void write_node(const Node& node, const Module& module);
    void write_token(const Token& token);
    void append(std::string_view text);

    bool source_map_;
    std::string out_;
    uint32_t line_ = 0;
    uint32_t column_ = 0;
    SourceMapBuilder map_;
};

}  // namespace jsxform
