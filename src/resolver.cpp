#include "resolver.hpp"

#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace jsxform {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Length of a leading "scheme:" or 0
size_t scheme_length(std::string_view s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) {
        return 0;
    }
    for (size_t i = 1; i < s.size(); ++i) {
        char c = s[i];
        if (c == ':') {
            return i + 1;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return 0;
        }
    }
    return 0;
}

// "https://esm.sh/react@17/index.js" -> "https://esm.sh"
std::string_view url_origin(std::string_view url) {
    size_t start = url.find("://");
    if (start == std::string_view::npos) {
        // "data:..." and friends have no authority
        return url.substr(0, scheme_length(url));
    }
    size_t end = url.find('/', start + 3);
    return end == std::string_view::npos ? url : url.substr(0, end);
}

// Directory of the URL's path, ending in '/', without query
std::string get_base_url(std::string_view url) {
    size_t query_pos = url.find_first_of("?#");
    std::string_view path = query_pos != std::string_view::npos ? url.substr(0, query_pos) : url;

    std::string_view origin = url_origin(path);
    size_t last_slash = path.rfind('/');
    if (last_slash != std::string_view::npos && last_slash >= origin.size()) {
        return std::string(path.substr(0, last_slash + 1));
    }
    return std::string(origin) + "/";
}

constexpr std::array<std::string_view, 4> kSourceExtensions = {".ts", ".tsx", ".jsx", ".mts"};

}  // namespace

Resolver::Resolver(std::string referrer, ImportMap import_map, bool is_production, bool has_plugin_resolves)
    : import_map_(std::move(import_map))
    , is_production_(is_production)
    , has_plugin_resolves_(has_plugin_resolves)
{
    if (classify(referrer) == SpecifierKind::Remote) {
        referrer_ = std::move(referrer);
    } else {
        // Project-relative file names are rooted at the project root
        referrer_ = normalize_path(starts_with(referrer, "/") ? referrer : "/" + referrer);
    }
}

SpecifierKind Resolver::classify(std::string_view specifier) {
    if (starts_with(specifier, "./") || starts_with(specifier, "../") ||
        specifier == "." || specifier == "..") {
        return SpecifierKind::Relative;
    }
    if (starts_with(specifier, "//")) {
        return SpecifierKind::Remote;
    }
    if (starts_with(specifier, "/")) {
        return SpecifierKind::Absolute;
    }
    if (scheme_length(specifier) > 0) {
        return SpecifierKind::Remote;
    }
    return SpecifierKind::Bare;
}

std::string Resolver::normalize_path(std::string_view path) {
    size_t cut = path.find_first_of("?#");
    std::string_view suffix = cut == std::string_view::npos ? std::string_view{} : path.substr(cut);
    std::string_view body = path.substr(0, cut);

    const bool absolute = starts_with(body, "/");
    bool trailing = body.size() > 1 && body.back() == '/';

    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos <= body.size()) {
        size_t next = body.find('/', pos);
        std::string_view segment = body.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        bool last = next == std::string_view::npos;

        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.push_back(segment);
            }
            trailing = trailing || last;
        } else if (segment == ".") {
            trailing = trailing || last;
        } else if (!segment.empty()) {
            segments.push_back(segment);
        }

        if (last) {
            break;
        }
        pos = next + 1;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += segments[i];
    }
    if (trailing && !segments.empty()) {
        result += '/';
    }
    if (result.empty()) {
        result = ".";
    }
    return result + std::string(suffix);
}

std::string Resolver::join(std::string_view referrer, std::string_view specifier) {
    if (classify(referrer) == SpecifierKind::Remote) {
        std::string_view origin = url_origin(referrer);
        if (starts_with(specifier, "/")) {
            return std::string(origin) + normalize_path(specifier);
        }
        std::string base = get_base_url(referrer);
        std::string path = base.substr(origin.size());
        if (path.empty()) {
            path = "/";
        }
        return std::string(origin) + normalize_path(path + std::string(specifier));
    }

    if (starts_with(specifier, "/")) {
        return normalize_path(specifier);
    }
    size_t cut = referrer.find_first_of("?#");
    std::string_view referrer_path = referrer.substr(0, cut);
    std::string dir(referrer_path.substr(0, referrer_path.rfind('/') + 1));
    if (dir.empty()) {
        dir = "/";
    }
    return normalize_path(dir + std::string(specifier));
}

std::string Resolver::fix_extension(std::string_view path) {
    size_t cut = path.find_first_of("?#");
    std::string_view suffix = cut == std::string_view::npos ? std::string_view{} : path.substr(cut);
    std::string_view body = path.substr(0, cut);

    std::string_view name = body.substr(body.rfind('/') + 1);
    if (name.empty() || name == "." || name == "..") {
        return std::string(path);
    }

    size_t dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return std::string(body) + ".js" + std::string(suffix);
    }

    std::string_view ext = name.substr(dot);
    for (auto source_ext : kSourceExtensions) {
        if (ext == source_ext) {
            return std::string(body.substr(0, body.size() - ext.size())) + ".js" + std::string(suffix);
        }
    }
    return std::string(path);
}

std::string Resolver::resolve(std::string_view specifier, bool is_dynamic) {
    if (finalized_) {
        throw std::logic_error("resolve(\"" + std::string(specifier) + "\") after the resolver was finalized");
    }

    SpecifierKind kind = classify(specifier);
    if (kind == SpecifierKind::Relative || kind == SpecifierKind::Absolute) {
        return resolve_local(specifier, is_dynamic);
    }
    return resolve_external(specifier, kind, is_dynamic);
}

std::string Resolver::resolve_local(std::string_view specifier, bool is_dynamic) {
    std::string normalized = join(referrer_, specifier);

    // A project may remap local paths too, e.g. onto hashed build output
    std::string debug_message;
    auto mapped = import_map_.resolve(normalized, referrer_, &debug_message);
    if (!mapped && !debug_message.empty()) {
        warn(specifier, "import map: " + debug_message);
    }

    std::string resolved = finish_local(mapped ? std::move(*mapped) : std::move(normalized));
    record(specifier, resolved, is_dynamic, false);
    return resolved;
}

std::string Resolver::resolve_external(std::string_view specifier, SpecifierKind kind, bool is_dynamic) {
    std::string debug_message;
    auto mapped = import_map_.resolve(specifier, referrer_, &debug_message);

    if (has_plugin_resolves_) {
        // Left for the host to complete after the call
        record(specifier, mapped ? finish_local(std::move(*mapped)) : std::string(specifier), is_dynamic, true);
        return std::string(specifier);
    }

    if (mapped) {
        std::string resolved = finish_local(std::move(*mapped));
        record(specifier, resolved, is_dynamic, false);
        return resolved;
    }

    if (!debug_message.empty()) {
        warn(specifier, "import map: " + debug_message);
    } else if (kind == SpecifierKind::Bare) {
        warn(specifier, "bare specifier is not mapped by the import map; left as written");
    }
    record(specifier, std::string(specifier), is_dynamic, false);
    return std::string(specifier);
}

std::string Resolver::finish_local(std::string resolved) const {
    if (!is_production_) {
        return resolved;
    }
    SpecifierKind kind = classify(resolved);
    if (kind == SpecifierKind::Relative || kind == SpecifierKind::Absolute) {
        return fix_extension(resolved);
    }
    return resolved;
}

void Resolver::record(std::string_view specifier, const std::string& resolved, bool is_dynamic, bool pending) {
    dependencies_.push_back(DependencyRecord{std::string(specifier), resolved, is_dynamic, pending});
}

void Resolver::warn(std::string_view specifier, std::string message) {
    warnings_.push_back(ResolutionWarning{std::string(specifier), std::move(message)});
}

std::vector<DependencyRecord> Resolver::finalize() {
    if (finalized_) {
        throw std::logic_error("resolver finalized twice");
    }
    finalized_ = true;
    std::vector<DependencyRecord> dependencies = std::move(dependencies_);
    dependencies_.clear();
    return dependencies;
}

}  // namespace jsxform
