#pragma once

#include "errors.hpp"
#include "import_map.hpp"
#include "options.hpp"
#include "resolver.hpp"
#include "syntax.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsxform {

class OutputVerifier;
class SyntaxEngine;

// One transform call, as decoded from a request
struct TransformRequest {
    std::string filename;
    ImportMap import_map;
    SwcOptions options;
    std::string source_text;
    bool has_plugin_resolves = false;
};

struct TransformResult {
    TransformOutput output;
    std::vector<DependencyRecord> dependencies;
    std::vector<ResolutionWarning> warnings;
};

// parse -> visit -> emit over a SyntaxEngine. Holds no per-call state, so
// one Transformer serves any number of sequential calls.
class Transformer {
public:
    explicit Transformer(SyntaxEngine& engine, OutputVerifier* verifier = nullptr);

    // Rewrites specifiers through `resolver`, lowers JSX and, in development
    // mode, adds refresh instrumentation. The dialect defaults to the one
    // the referrer's extension names. Throws ParseError and EmitError.
    [[nodiscard]] TransformOutput transpile(std::string_view source, TargetLevel target, Resolver& resolver,
                                            const EmitOptions& options,
                                            std::optional<SourceType> source_type = std::nullopt);

    // Validates the options (ConfigError), then transpiles with a fresh
    // Resolver and returns its dependency list and warnings
    [[nodiscard]] TransformResult transform(const TransformRequest& request);

private:
    SyntaxEngine& engine_;
    OutputVerifier* verifier_;
};

}  // namespace jsxform
