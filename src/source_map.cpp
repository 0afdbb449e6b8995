#include "source_map.hpp"

#include <nlohmann/json.hpp>

namespace jsxform {

namespace {

constexpr char kBase64Chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}  // namespace

void SourceMapBuilder::encode_vlq(std::string& out, int32_t value) {
    uint32_t vlq = value < 0 ? ((static_cast<uint32_t>(-static_cast<int64_t>(value)) << 1) | 1)
                             : (static_cast<uint32_t>(value) << 1);
    do {
        uint32_t digit = vlq & 0x1f;
        vlq >>= 5;
        if (vlq > 0) {
            digit |= 0x20;
        }
        out += kBase64Chars[digit];
    } while (vlq > 0);
}

void SourceMapBuilder::add_mapping(uint32_t generated_line, uint32_t generated_column, const SourcePos& original) {
    if (!mappings_.empty()) {
        const Mapping& last = mappings_.back();
        if (last.generated_line == generated_line && last.generated_column == generated_column) {
            return;
        }
    }
    mappings_.push_back({generated_line, generated_column, original.line, original.column});
}

std::string SourceMapBuilder::mappings() const {
    std::string out;
    uint32_t line = 0;
    int32_t prev_column = 0;
    int32_t prev_original_line = 0;
    int32_t prev_original_column = 0;
    bool first_in_line = true;

    for (const auto& m : mappings_) {
        while (line < m.generated_line) {
            out += ';';
            ++line;
            prev_column = 0;
            first_in_line = true;
        }
        if (!first_in_line) {
            out += ',';
        }
        first_in_line = false;

        auto column = static_cast<int32_t>(m.generated_column);
        auto original_line = static_cast<int32_t>(m.original_line);
        auto original_column = static_cast<int32_t>(m.original_column);

        encode_vlq(out, column - prev_column);
        encode_vlq(out, 0);  // single source
        encode_vlq(out, original_line - prev_original_line);
        encode_vlq(out, original_column - prev_original_column);

        prev_column = column;
        prev_original_line = original_line;
        prev_original_column = original_column;
    }
    return out;
}

std::string SourceMapBuilder::to_json(const std::string& source_name, const std::string& source_content) const {
    nlohmann::json map = {
        {"version", 3},
        {"sources", nlohmann::json::array({source_name})},
        {"sourcesContent", nlohmann::json::array({source_content})},
        {"names", nlohmann::json::array()},
        {"mappings", mappings()},
    };
    return map.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace jsxform
