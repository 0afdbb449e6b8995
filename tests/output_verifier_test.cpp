#include "errors.hpp"
#include "output_verifier.hpp"
#include "syntax_engine.hpp"
#include "transform.hpp"

#include <gtest/gtest.h>

namespace jsxform {
namespace {

TEST(QuickJsVerifierTest, AcceptsModules) {
    QuickJsVerifier verifier;
    EXPECT_NO_THROW(verifier.verify("import x from '/deps/x.js';\nexport default x;", "/a.js"));
    EXPECT_NO_THROW(verifier.verify("export const f = async () => { await 1; };", "/b.js"));
}

TEST(QuickJsVerifierTest, RejectsBrokenCode) {
    QuickJsVerifier verifier;
    try {
        verifier.verify("export const = ;", "/broken.js");
        FAIL() << "expected EmitError";
    } catch (const EmitError& e) {
        EXPECT_NE(std::string(e.what()).find("/broken.js"), std::string::npos);
    }
}

TEST(QuickJsVerifierTest, ReusableAfterFailure) {
    QuickJsVerifier verifier;
    EXPECT_THROW(verifier.verify("}", "/a.js"), EmitError);
    EXPECT_NO_THROW(verifier.verify("export {};", "/a.js"));
}

TEST(QuickJsVerifierTest, DevelopmentOutputCompiles) {
    BuiltinSyntaxEngine engine;
    QuickJsVerifier verifier;
    Transformer transformer(engine, &verifier);

    TransformRequest request;
    request.filename = "/src/App.jsx";
    request.import_map = ImportMap({{"react", "https://esm.sh/react@18"}}, {});
    request.source_text =
        "import React, { useState } from 'react';\n"
        "import Button from './Button.jsx';\n"
        "export const Greeting = ({ name }) => <p className=\"hi\">Hello, {name}!</p>;\n"
        "export default function App() {\n"
        "  const [count, setCount] = useState(0);\n"
        "  return (\n"
        "    <>\n"
        "      <Greeting name=\"you\" />\n"
        "      <Button onClick={() => setCount(count + 1)} {...{ disabled: false }}>{count}</Button>\n"
        "    </>\n"
        "  );\n"
        "}\n";

    TransformResult result;
    ASSERT_NO_THROW(result = transformer.transform(request));
    EXPECT_NE(result.output.code.find("$RefreshReg$(App, \"App\");"), std::string::npos);
    EXPECT_NE(result.output.code.find("$RefreshReg$(Greeting, \"Greeting\");"), std::string::npos);
}

}  // namespace
}  // namespace jsxform
