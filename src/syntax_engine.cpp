#include "syntax_engine.hpp"
#include "parser.hpp"
#include "printer.hpp"

namespace jsxform {

Module BuiltinSyntaxEngine::parse(const std::string& filename, std::string_view source, TargetLevel target,
                                  SourceType source_type) {
    Parser parser(source, target, source_type);
    return parser.parse(filename);
}

TransformOutput BuiltinSyntaxEngine::print(Module module, bool source_map) {
    Printer printer(source_map);
    return printer.print(module);
}

}  // namespace jsxform
