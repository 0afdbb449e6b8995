#include "transform.hpp"
#include "fast_refresh.hpp"
#include "jsx_lowering.hpp"
#include "output_verifier.hpp"
#include "syntax_engine.hpp"

#include <utility>

namespace jsxform {

namespace {

// The single traversal: module specifiers go through the Resolver and JSX
// is lowered, both in source order
class ModuleVisitor {
public:
    ModuleVisitor(Resolver& resolver, const JsxLowering& jsx)
        : resolver_(resolver)
        , jsx_(jsx)
    {
    }

    void visit(Module& module) {
        for (auto& statement : module.body) {
            visit_list(statement.items);
        }
    }

    [[nodiscard]] size_t specifiers_visited() const noexcept { return specifiers_visited_; }

private:
    void visit_list(NodeList& list) {
        for (size_t i = 0; i < list.size();) {
            Node& node = list[i];
            if (node.is_token()) {
                if (node.token.role != SpecifierRole::None) {
                    rewrite_specifier(node.token);
                }
                ++i;
                continue;
            }

            visit_element(*node.jsx);
            NodeList lowered = jsx_.lower(*node.jsx, std::move(node.token.leading));
            const size_t count = lowered.size();
            list.erase(list.begin() + static_cast<std::ptrdiff_t>(i));
            list.insert(list.begin() + static_cast<std::ptrdiff_t>(i), std::make_move_iterator(lowered.begin()),
                        std::make_move_iterator(lowered.end()));
            i += count;
        }
    }

    void visit_element(JsxElement& element) {
        for (auto& attribute : element.attributes) {
            if (attribute.element) {
                visit_element(*attribute.element);
            } else {
                visit_list(attribute.expression);
            }
        }
        for (auto& child : element.children) {
            if (child.element) {
                visit_element(*child.element);
            } else {
                visit_list(child.expression);
            }
        }
    }

    void rewrite_specifier(Token& token) {
        ++specifiers_visited_;
        std::string specifier = string_literal_value(token.text);
        std::string resolved = resolver_.resolve(specifier, token.role == SpecifierRole::Dynamic);
        if (resolved != specifier) {
            token.text = quote_js_string(resolved);
        }
    }

    Resolver& resolver_;
    const JsxLowering& jsx_;
    size_t specifiers_visited_ = 0;
};

}  // namespace

Transformer::Transformer(SyntaxEngine& engine, OutputVerifier* verifier)
    : engine_(engine)
    , verifier_(verifier)
{
}

TransformOutput Transformer::transpile(std::string_view source, TargetLevel target, Resolver& resolver,
                                       const EmitOptions& options, std::optional<SourceType> source_type) {
    Module module = engine_.parse(resolver.referrer(), source, target,
                                  source_type.value_or(source_type_for(resolver.referrer())));

    JsxLowering jsx(module.jsx_pragma.value_or(options.jsx_factory),
                    module.jsx_fragment_pragma.value_or(options.jsx_fragment_factory), target);

    const size_t recorded_before = resolver.dependencies().size();
    ModuleVisitor visitor(resolver, jsx);
    visitor.visit(module);
    if (resolver.dependencies().size() - recorded_before != visitor.specifiers_visited()) {
        throw EmitError("dependency list out of step with the rewritten specifiers in " + resolver.referrer());
    }

    if (options.is_dev) {
        FastRefresh refresh;
        refresh.instrument(module);
    }

    const std::string filename = module.filename;
    TransformOutput output = engine_.print(std::move(module), options.source_map);
    if (verifier_ != nullptr) {
        verifier_->verify(output.code, filename);
    }
    return output;
}

TransformResult Transformer::transform(const TransformRequest& request) {
    request.options.validate();
    if (request.filename.empty()) {
        throw ConfigError("filename must not be empty");
    }

    Resolver resolver(request.filename, request.import_map, !request.options.is_dev, request.has_plugin_resolves);

    TransformResult result;
    result.output = transpile(request.source_text, request.options.target, resolver, EmitOptions::from(request.options),
                              request.options.source_type);
    result.warnings = resolver.warnings();
    result.dependencies = resolver.finalize();
    return result;
}

}  // namespace jsxform
