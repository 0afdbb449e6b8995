#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace jsxform {

// Ordered: a later level accepts every construct of an earlier one.
enum class TargetLevel {
    ES3,
    ES5,
    ES2015,
    ES2016,
    ES2017,
    ES2018,
    ES2019,
    ES2020,
    ES2021,
    ES2022,
    ESNext,
};

// Accepts "es2020", "ES2020", "esnext", ...
[[nodiscard]] std::optional<TargetLevel> parse_target_level(std::string_view name);
[[nodiscard]] std::string_view to_string(TargetLevel level) noexcept;

// The built-in engine emits the source's own syntax level, so anything below
// ES2015 cannot be honoured.
[[nodiscard]] constexpr bool is_supported_target(TargetLevel level) noexcept {
    return level >= TargetLevel::ES2015;
}

// Source dialect; picks the grammar and whether type syntax is stripped
enum class SourceType {
    JS,
    JSX,
    TS,
    TSX,
};

[[nodiscard]] std::optional<SourceType> parse_source_type(std::string_view name);
[[nodiscard]] std::string_view to_string(SourceType type) noexcept;

// .ts/.mts/.cts -> TS, .tsx -> TSX, .jsx -> JSX, anything else JS. A query
// or fragment after the path is ignored.
[[nodiscard]] SourceType source_type_for(std::string_view filename);

[[nodiscard]] constexpr bool is_typescript(SourceType type) noexcept {
    return type == SourceType::TS || type == SourceType::TSX;
}

// "React.createElement", "h", "preact.h" ...
[[nodiscard]] bool is_valid_factory_name(std::string_view name);

// Compiler options of a request ("swcOptions").
struct SwcOptions {
    TargetLevel target = TargetLevel::ES2020;
    std::string jsx_factory = "React.createElement";
    std::string jsx_fragment_factory = "React.Fragment";
    bool is_dev = true;
    bool source_map = false;
    std::optional<SourceType> source_type;  // inferred from the filename when unset

    // Throws ConfigError on an unsupported target or an unusable factory name
    void validate() const;
};

struct EmitOptions {
    std::string jsx_factory = "React.createElement";
    std::string jsx_fragment_factory = "React.Fragment";
    bool is_dev = true;
    bool source_map = false;

    [[nodiscard]] static EmitOptions from(const SwcOptions& options) {
        return EmitOptions{options.jsx_factory, options.jsx_fragment_factory,
                           options.is_dev, options.source_map};
    }
};

}  // namespace jsxform
