#pragma once

#include "errors.hpp"
#include "options.hpp"
#include "transform.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>

namespace jsxform {

// Decodes {"filename", "importMap", "swcOptions", "sourceText"}. Unknown
// keys, wrong value types and duplicate keys are ConfigErrors.
[[nodiscard]] TransformRequest parse_request(std::string_view body);

// The "swcOptions" object; absent fields keep their defaults
[[nodiscard]] SwcOptions parse_swc_options(const nlohmann::json& value);

// {"code", "map"?, "deps": [...], "warnings": [...]}
[[nodiscard]] std::string encode_response(const TransformResult& result);

// {"error": kind, "message": ...}
[[nodiscard]] std::string encode_error(std::string_view kind, std::string_view message);

// Adds "line" and "column"
[[nodiscard]] std::string encode_error(const ParseError& error);

}  // namespace jsxform
