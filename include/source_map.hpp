#pragma once

#include "syntax.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace jsxform {

// Collects generated -> original position pairs and writes a v3 source map
class SourceMapBuilder {
public:
    // Mappings must be added in generated order
    void add_mapping(uint32_t generated_line, uint32_t generated_column, const SourcePos& original);

    [[nodiscard]] std::string mappings() const;
    [[nodiscard]] std::string to_json(const std::string& source_name, const std::string& source_content) const;
    [[nodiscard]] size_t size() const noexcept { return mappings_.size(); }

    // Base64 VLQ, as used in the "mappings" field
    static void encode_vlq(std::string& out, int32_t value);

private:
    struct Mapping {
        uint32_t generated_line;
        uint32_t generated_column;
        uint32_t original_line;
        uint32_t original_column;
    };

    std::vector<Mapping> mappings_;
};

}  // namespace jsxform
