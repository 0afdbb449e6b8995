#include "request.hpp"
#include "json_util.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace jsxform {

namespace {

std::string dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

const nlohmann::json* find_field(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

std::string string_field(const nlohmann::json& object, const char* key, std::string_view where) {
    const nlohmann::json* value = find_field(object, key);
    if (value == nullptr) {
        throw ConfigError(std::string(where) + "." + key + " is required");
    }
    if (!value->is_string()) {
        throw ConfigError(std::string(where) + "." + key + " must be a string");
    }
    return value->get<std::string>();
}

}  // namespace

SwcOptions parse_swc_options(const nlohmann::json& value) {
    SwcOptions options;
    if (value.is_null()) {
        return options;
    }
    if (!value.is_object()) {
        throw ConfigError("swcOptions must be an object");
    }
    require_known_keys(value, {"target", "jsxFactory", "jsxFragmentFactory", "isDev", "sourceMap", "sourceType"},
                       "swcOptions");

    if (const auto* target = find_field(value, "target")) {
        if (!target->is_string()) {
            throw ConfigError("swcOptions.target must be a string");
        }
        auto name = target->get<std::string>();
        auto level = parse_target_level(name);
        if (!level) {
            throw ConfigError("swcOptions.target: unknown target \"" + name + "\"");
        }
        options.target = *level;
    }
    if (find_field(value, "sourceType") != nullptr) {
        auto name = string_field(value, "sourceType", "swcOptions");
        auto type = parse_source_type(name);
        if (!type) {
            throw ConfigError("swcOptions.sourceType: unknown source type \"" + name + "\"");
        }
        options.source_type = *type;
    }
    if (find_field(value, "jsxFactory") != nullptr) {
        options.jsx_factory = string_field(value, "jsxFactory", "swcOptions");
    }
    if (find_field(value, "jsxFragmentFactory") != nullptr) {
        options.jsx_fragment_factory = string_field(value, "jsxFragmentFactory", "swcOptions");
    }
    for (auto [key, field] : {std::pair{"isDev", &options.is_dev}, std::pair{"sourceMap", &options.source_map}}) {
        if (const auto* flag = find_field(value, key)) {
            if (!flag->is_boolean()) {
                throw ConfigError(std::string("swcOptions.") + key + " must be a boolean");
            }
            *field = flag->get<bool>();
        }
    }

    options.validate();
    return options;
}

TransformRequest parse_request(std::string_view body) {
    nlohmann::json json = parse_json_strict(body, "request");
    if (!json.is_object()) {
        throw ConfigError("request must be a JSON object");
    }
    require_known_keys(json, {"filename", "importMap", "swcOptions", "sourceText"}, "request");

    TransformRequest request;
    request.filename = string_field(json, "filename", "request");
    if (request.filename.empty()) {
        throw ConfigError("request.filename must not be empty");
    }
    request.source_text = string_field(json, "sourceText", "request");

    if (const auto* import_map = find_field(json, "importMap")) {
        request.import_map = ImportMap::from_json(*import_map);
    }
    if (const auto* options = find_field(json, "swcOptions")) {
        request.options = parse_swc_options(*options);
    }
    return request;
}

std::string encode_response(const TransformResult& result) {
    nlohmann::json response;
    response["code"] = result.output.code;
    if (result.output.map) {
        response["map"] = *result.output.map;
    }

    nlohmann::json deps = nlohmann::json::array();
    for (const auto& dep : result.dependencies) {
        nlohmann::json entry = {
            {"specifier", dep.specifier},
            {"resolved", dep.resolved},
            {"isDynamic", dep.is_dynamic},
        };
        if (dep.pending) {
            entry["pending"] = true;
        }
        deps.push_back(std::move(entry));
    }
    response["deps"] = std::move(deps);

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& warning : result.warnings) {
        warnings.push_back({{"specifier", warning.specifier}, {"message", warning.message}});
    }
    response["warnings"] = std::move(warnings);

    return dump(response);
}

std::string encode_error(std::string_view kind, std::string_view message) {
    return dump({{"error", std::string(kind)}, {"message", std::string(message)}});
}

std::string encode_error(const ParseError& error) {
    return dump({
        {"error", "ParseError"},
        {"message", error.message()},
        {"line", error.line()},
        {"column", error.column()},
    });
}

}  // namespace jsxform
