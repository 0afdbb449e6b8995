#include "import_map.hpp"
#include "errors.hpp"
#include "json_util.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace jsxform {

namespace {

bool ends_with_slash(std::string_view s) {
    return !s.empty() && s.back() == '/';
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Accepts a string, or an array of strings of which the first non-empty wins
std::string target_from_json(const nlohmann::json& value, const std::string& key, std::string_view where) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_array()) {
        for (const auto& candidate : value) {
            if (!candidate.is_string()) {
                throw ConfigError(std::string(where) + ": target of \"" + key + "\" must contain only strings");
            }
            auto text = candidate.get<std::string>();
            if (!text.empty()) {
                return text;
            }
        }
        throw ConfigError(std::string(where) + ": \"" + key + "\" maps to no target");
    }
    throw ConfigError(std::string(where) + ": target of \"" + key + "\" must be a string");
}

ImportMap::SpecifierMap specifier_map_from_json(const nlohmann::json& value, std::string_view where) {
    if (!value.is_object()) {
        throw ConfigError(std::string(where) + " must be an object");
    }
    ImportMap::SpecifierMap entries;
    entries.reserve(value.size());
    for (const auto& item : value.items()) {
        entries.emplace_back(item.key(), target_from_json(item.value(), item.key(), where));
    }
    return entries;
}

}  // namespace

ImportMap::ImportMap(SpecifierMap imports, ScopeMap scopes)
    : imports_(std::move(imports))
    , scopes_(std::move(scopes))
{
    validate_entries(imports_, "importMap.imports", true);

    std::unordered_set<std::string> seen_scopes;
    for (const auto& [prefix, entries] : scopes_) {
        const std::string where = "importMap.scopes[\"" + prefix + "\"]";
        if (prefix.empty()) {
            throw ConfigError("importMap.scopes: empty scope prefix");
        }
        if (!seen_scopes.insert(prefix).second) {
            throw ConfigError("importMap.scopes: duplicate scope \"" + prefix + "\"");
        }
        if (entries.empty()) {
            throw ConfigError(where + ": scope has no entries");
        }
        validate_entries(entries, where, false);

        for (const auto& [key, target] : entries) {
            auto top = std::find_if(imports_.begin(), imports_.end(),
                                    [&key](const auto& entry) { return entry.first == key; });
            if (top != imports_.end() && top->second == target) {
                throw ConfigError(where + ": \"" + key + "\" repeats the top-level mapping");
            }
        }
    }
}

void ImportMap::validate_entries(const SpecifierMap& entries, std::string_view where, bool top_level) {
    std::unordered_set<std::string> keys;
    for (const auto& [key, target] : entries) {
        if (key.empty()) {
            throw ConfigError(std::string(where) + (top_level ? ": empty specifier key" : ": empty specifier key in scope"));
        }
        if (!keys.insert(key).second) {
            throw ConfigError(std::string(where) + ": duplicate key \"" + key + "\"");
        }
        if (target.empty()) {
            throw ConfigError(std::string(where) + ": \"" + key + "\" has an empty target");
        }
        if (ends_with_slash(key) && !ends_with_slash(target)) {
            throw ConfigError(std::string(where) + ": prefix key \"" + key +
                              "\" must map to a target ending in '/', got \"" + target + "\"");
        }
    }
}

ImportMap ImportMap::from_json(const nlohmann::json& value) {
    if (value.is_null()) {
        return ImportMap{};
    }
    require_known_keys(value, {"imports", "scopes"}, "importMap");

    SpecifierMap imports;
    if (auto it = value.find("imports"); it != value.end()) {
        imports = specifier_map_from_json(*it, "importMap.imports");
    }

    ScopeMap scopes;
    if (auto it = value.find("scopes"); it != value.end()) {
        if (!it->is_object()) {
            throw ConfigError("importMap.scopes must be an object");
        }
        for (const auto& item : it->items()) {
            scopes.emplace_back(item.key(),
                                specifier_map_from_json(item.value(), "importMap.scopes[\"" + item.key() + "\"]"));
        }
    }

    return ImportMap(std::move(imports), std::move(scopes));
}

ImportMap ImportMap::parse(std::string_view json_text) {
    return from_json(parse_json_strict(json_text, "import map"));
}

bool ImportMap::is_well_formed_specifier(std::string_view specifier) {
    if (specifier.empty()) {
        return false;
    }
    for (char c : specifier) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f || c == '\\') {
            return false;
        }
    }

    // "scheme:..." must carry a syntactically valid scheme
    size_t colon = specifier.find(':');
    size_t slash = specifier.find('/');
    if (colon != std::string_view::npos && (slash == std::string_view::npos || colon < slash)) {
        if (colon == 0 || !std::isalpha(static_cast<unsigned char>(specifier[0]))) {
            return false;
        }
        for (size_t i = 1; i < colon; ++i) {
            char c = specifier[i];
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
                return false;
            }
        }
        if (colon + 1 == specifier.size()) {
            return false;
        }
    }
    return true;
}

const ImportMap::SpecifierMap* ImportMap::select_scope(std::string_view referrer) const {
    const SpecifierMap* best = nullptr;
    size_t best_length = 0;

    for (const auto& [prefix, entries] : scopes_) {
        if (prefix.size() >= referrer.size() || !starts_with(referrer, prefix)) {
            continue;
        }
        // "/vendor" must not capture "/vendor2/x"
        if (!ends_with_slash(prefix) && referrer[prefix.size()] != '/') {
            continue;
        }
        if (best == nullptr || prefix.size() > best_length) {
            best = &entries;
            best_length = prefix.size();
        }
    }
    return best;
}

std::optional<std::string> ImportMap::match(const SpecifierMap& entries,
                                            std::string_view specifier,
                                            std::string* debug_message) {
    // An exact key always beats a prefix key
    for (const auto& [key, target] : entries) {
        if (key == specifier) {
            if (!is_well_formed_specifier(target)) {
                if (debug_message) {
                    *debug_message = "\"" + key + "\" maps to malformed specifier \"" + target + "\"";
                }
                return std::nullopt;
            }
            return target;
        }
    }

    const std::pair<std::string, std::string>* best = nullptr;
    for (const auto& entry : entries) {
        const auto& key = entry.first;
        if (!ends_with_slash(key) || !starts_with(specifier, key)) {
            continue;
        }
        if (best == nullptr || key.size() > best->first.size()) {
            best = &entry;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }

    std::string result = best->second + std::string(specifier.substr(best->first.size()));
    if (!is_well_formed_specifier(result)) {
        if (debug_message) {
            *debug_message = "\"" + std::string(specifier) + "\" matches \"" + best->first +
                             "\" but maps to malformed specifier \"" + result + "\"";
        }
        return std::nullopt;
    }
    return result;
}

std::optional<std::string> ImportMap::resolve(std::string_view specifier,
                                              std::string_view referrer,
                                              std::string* debug_message) const {
    if (const SpecifierMap* scope = select_scope(referrer)) {
        if (auto mapped = match(*scope, specifier, debug_message)) {
            return mapped;
        }
    }
    return match(imports_, specifier, debug_message);
}

}  // namespace jsxform
