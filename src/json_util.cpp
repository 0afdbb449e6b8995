#include "json_util.hpp"
#include "errors.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <vector>

namespace jsxform {

nlohmann::json parse_json_strict(std::string_view text, std::string_view what) {
    // One key set per open object; arrays do not open a key scope
    std::vector<std::unordered_set<std::string>> open_objects;

    auto callback = [&](int /*depth*/, nlohmann::json::parse_event_t event, nlohmann::json& parsed) {
        switch (event) {
            case nlohmann::json::parse_event_t::object_start:
                open_objects.emplace_back();
                break;
            case nlohmann::json::parse_event_t::object_end:
                if (!open_objects.empty()) {
                    open_objects.pop_back();
                }
                break;
            case nlohmann::json::parse_event_t::key: {
                const auto& key = parsed.get_ref<const std::string&>();
                if (!open_objects.back().insert(key).second) {
                    throw ConfigError(std::string(what) + ": duplicate key \"" + key + "\"");
                }
                break;
            }
            default:
                break;
        }
        return true;
    };

    try {
        return nlohmann::json::parse(text.begin(), text.end(), callback);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string(what) + ": invalid JSON: " + e.what());
    }
}

void require_known_keys(const nlohmann::json& object,
                        std::initializer_list<std::string_view> allowed,
                        std::string_view where) {
    if (!object.is_object()) {
        throw ConfigError(std::string(where) + " must be an object");
    }
    for (const auto& item : object.items()) {
        bool known = std::find(allowed.begin(), allowed.end(), item.key()) != allowed.end();
        if (!known) {
            throw ConfigError("unknown field \"" + item.key() + "\" in " + std::string(where));
        }
    }
}

}  // namespace jsxform
