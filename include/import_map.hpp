#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsxform {

// Specifier-prefix -> target table, optionally specialized per referrer
// scope. Immutable after construction; resolution does no I/O.
class ImportMap {
public:
    // Entries in insertion order; from_json yields them sorted by key
    using SpecifierMap = std::vector<std::pair<std::string, std::string>>;
    using ScopeMap = std::vector<std::pair<std::string, SpecifierMap>>;

    ImportMap() = default;

    // Validates the entries; throws ConfigError on duplicate or empty keys,
    // prefix keys with non-prefix targets, and scopes that do not change
    // any top-level mapping.
    ImportMap(SpecifierMap imports, ScopeMap scopes);

    // {"imports": {...}, "scopes": {...}}. Values may be a string or an
    // array of strings (first non-empty one wins). Throws ConfigError.
    [[nodiscard]] static ImportMap from_json(const nlohmann::json& value);

    // Parses a standalone import_map.json document
    [[nodiscard]] static ImportMap parse(std::string_view json_text);

    // Returns the mapped specifier, or nullopt for "no match". When a key
    // matched but produced a malformed specifier, `debug_message` (if given)
    // explains why.
    [[nodiscard]] std::optional<std::string> resolve(std::string_view specifier,
                                                     std::string_view referrer,
                                                     std::string* debug_message = nullptr) const;

    [[nodiscard]] bool empty() const noexcept { return imports_.empty() && scopes_.empty(); }
    [[nodiscard]] const SpecifierMap& imports() const noexcept { return imports_; }
    [[nodiscard]] const ScopeMap& scopes() const noexcept { return scopes_; }

    [[nodiscard]] static bool is_well_formed_specifier(std::string_view specifier);

private:
    // Longest scope whose prefix is a proper, segment-aligned prefix of referrer
    [[nodiscard]] const SpecifierMap* select_scope(std::string_view referrer) const;

    [[nodiscard]] static std::optional<std::string> match(const SpecifierMap& entries,
                                                          std::string_view specifier,
                                                          std::string* debug_message);

    static void validate_entries(const SpecifierMap& entries, std::string_view where, bool top_level);

    SpecifierMap imports_;
    ScopeMap scopes_;
};

}  // namespace jsxform
