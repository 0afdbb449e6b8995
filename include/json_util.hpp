#pragma once

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string_view>

namespace jsxform {

// Parse a JSON document, rejecting duplicate object keys at any depth.
// `what` names the document in error messages. Throws ConfigError.
[[nodiscard]] nlohmann::json parse_json_strict(std::string_view text, std::string_view what);

// Reject any key of `object` not in `allowed`. Throws ConfigError.
void require_known_keys(const nlohmann::json& object,
                        std::initializer_list<std::string_view> allowed,
                        std::string_view where);

}  // namespace jsxform
