#pragma once

#include "errors.hpp"
#include "import_map.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jsxform {

enum class SpecifierKind {
    Relative,  // ./x, ../x
    Absolute,  // /x
    Remote,    // https://host/x, //host/x, any "scheme:" form
    Bare,      // react, lodash/fp
};

// One per resolve() call, in traversal order
struct DependencyRecord {
    std::string specifier;     // value of the literal in the source, escapes decoded
    std::string resolved;      // what the source now references (or the deferred target)
    bool is_dynamic = false;   // import() expression
    bool pending = false;      // deferred to the host's plugin resolution
};

// Per-call specifier resolution. Owns the import map and the dependency
// list; lives for exactly one transform.
class Resolver {
public:
    Resolver(std::string referrer, ImportMap import_map, bool is_production, bool has_plugin_resolves);

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;
    Resolver(Resolver&&) = default;
    Resolver& operator=(Resolver&&) = default;

    // Returns the specifier the emitted code should reference. Appends a
    // dependency record. Throws std::logic_error once finalized.
    [[nodiscard]] std::string resolve(std::string_view specifier, bool is_dynamic);

    // Ends the traversal and hands over the dependency list
    [[nodiscard]] std::vector<DependencyRecord> finalize();

    [[nodiscard]] bool finalized() const noexcept { return finalized_; }
    [[nodiscard]] const std::vector<DependencyRecord>& dependencies() const noexcept { return dependencies_; }
    [[nodiscard]] const std::vector<ResolutionWarning>& warnings() const noexcept { return warnings_; }
    [[nodiscard]] const std::string& referrer() const noexcept { return referrer_; }
    [[nodiscard]] bool is_production() const noexcept { return is_production_; }

    [[nodiscard]] static SpecifierKind classify(std::string_view specifier);

    // Collapses "." and ".." segments; keeps a leading and trailing '/', and
    // any ?query or #fragment untouched
    [[nodiscard]] static std::string normalize_path(std::string_view path);

    // Resolve a relative or absolute specifier against a referrer path or URL
    [[nodiscard]] static std::string join(std::string_view referrer, std::string_view specifier);

    // .ts/.tsx/.jsx/.mts -> .js, extensionless -> +.js
    [[nodiscard]] static std::string fix_extension(std::string_view path);

private:
    [[nodiscard]] std::string resolve_local(std::string_view specifier, bool is_dynamic);
    [[nodiscard]] std::string resolve_external(std::string_view specifier, SpecifierKind kind, bool is_dynamic);
    [[nodiscard]] std::string finish_local(std::string resolved) const;
    void record(std::string_view specifier, const std::string& resolved, bool is_dynamic, bool pending);
    void warn(std::string_view specifier, std::string message);

    std::string referrer_;
    ImportMap import_map_;
    bool is_production_;
    bool has_plugin_resolves_;
    bool finalized_ = false;
    std::vector<DependencyRecord> dependencies_;
    std::vector<ResolutionWarning> warnings_;
};

}  // namespace jsxform
