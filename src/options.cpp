#include "options.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace jsxform {

namespace {

constexpr std::array<std::pair<std::string_view, TargetLevel>, 11> kTargetNames = {{
    {"es3", TargetLevel::ES3},
    {"es5", TargetLevel::ES5},
    {"es2015", TargetLevel::ES2015},
    {"es2016", TargetLevel::ES2016},
    {"es2017", TargetLevel::ES2017},
    {"es2018", TargetLevel::ES2018},
    {"es2019", TargetLevel::ES2019},
    {"es2020", TargetLevel::ES2020},
    {"es2021", TargetLevel::ES2021},
    {"es2022", TargetLevel::ES2022},
    {"esnext", TargetLevel::ESNext},
}};

constexpr std::array<std::pair<std::string_view, SourceType>, 4> kSourceTypeNames = {{
    {"js", SourceType::JS},
    {"jsx", SourceType::JSX},
    {"ts", SourceType::TS},
    {"tsx", SourceType::TSX},
}};

std::string lowercase(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_name_part(char c) {
    return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

}  // namespace

std::optional<TargetLevel> parse_target_level(std::string_view name) {
    std::string lower = lowercase(name);

    for (const auto& [key, level] : kTargetNames) {
        if (key == lower) {
            return level;
        }
    }
    return std::nullopt;
}

std::string_view to_string(TargetLevel level) noexcept {
    for (const auto& [key, value] : kTargetNames) {
        if (value == level) {
            return key;
        }
    }
    return "unknown";
}

std::optional<SourceType> parse_source_type(std::string_view name) {
    std::string lower = lowercase(name);
    for (const auto& [key, type] : kSourceTypeNames) {
        if (key == lower) {
            return type;
        }
    }
    return std::nullopt;
}

std::string_view to_string(SourceType type) noexcept {
    for (const auto& [key, value] : kSourceTypeNames) {
        if (value == type) {
            return key;
        }
    }
    return "unknown";
}

SourceType source_type_for(std::string_view filename) {
    std::string_view path = filename.substr(0, filename.find_first_of("?#"));
    size_t slash = path.find_last_of('/');
    std::string_view base = slash == std::string_view::npos ? path : path.substr(slash + 1);
    size_t dot = base.find_last_of('.');
    if (dot == std::string_view::npos) {
        return SourceType::JS;
    }

    std::string extension = lowercase(base.substr(dot + 1));
    if (extension == "ts" || extension == "mts" || extension == "cts") {
        return SourceType::TS;
    }
    if (extension == "tsx") {
        return SourceType::TSX;
    }
    if (extension == "jsx") {
        return SourceType::JSX;
    }
    return SourceType::JS;
}

bool is_valid_factory_name(std::string_view name) {
    if (name.empty()) {
        return false;
    }

    // Dotted identifier path: every segment non-empty and identifier-shaped
    size_t start = 0;
    while (start <= name.size()) {
        size_t dot = name.find('.', start);
        std::string_view segment = name.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (segment.empty() || !is_name_start(segment.front())) {
            return false;
        }
        if (!std::all_of(segment.begin(), segment.end(), is_name_part)) {
            return false;
        }
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return true;
}

void SwcOptions::validate() const {
    if (!is_supported_target(target)) {
        throw ConfigError("unsupported target '" + std::string(to_string(target)) +
                          "': the lowest supported level is es2015");
    }
    if (!is_valid_factory_name(jsx_factory)) {
        throw ConfigError("invalid jsxFactory '" + jsx_factory + "'");
    }
    if (!is_valid_factory_name(jsx_fragment_factory)) {
        throw ConfigError("invalid jsxFragmentFactory '" + jsx_fragment_factory + "'");
    }
}

}  // namespace jsxform
