#pragma once

#include "options.hpp"
#include "syntax.hpp"

#include <string>
#include <string_view>

namespace jsxform {

// Lowers JSX trees to factory calls:
//   <div a="x" {...p}>hi {name}</div>
//   React.createElement("div", { a: "x", ...p }, "hi ", name)
class JsxLowering {
public:
    JsxLowering(std::string factory, std::string fragment_factory, TargetLevel target);

    // Expressions nested in the element must already be free of JSX. The
    // first generated token takes over `leading`.
    [[nodiscard]] NodeList lower(JsxElement& element, std::string leading) const;

    [[nodiscard]] const std::string& factory() const noexcept { return factory_; }
    [[nodiscard]] const std::string& fragment_factory() const noexcept { return fragment_factory_; }

    // &amp; &lt; &gt; &quot; &apos; &nbsp; &#NN; &#xHH;
    [[nodiscard]] static std::string decode_entities(std::string_view text);

    // JSX text whitespace: lines trimmed, blank lines dropped, lines joined
    // with a single space
    [[nodiscard]] static std::string clean_text(std::string_view text);

    // Lowercase, dashed and namespaced tags name host elements
    [[nodiscard]] static bool is_intrinsic_tag(std::string_view tag) noexcept;

private:
    void emit_element(JsxElement& element, NodeList& out, std::string leading) const;
    void emit_props(JsxElement& element, NodeList& out) const;
    void emit_attribute(JsxAttribute& attribute, NodeList& out, bool spaced) const;

    std::string factory_;
    std::string fragment_factory_;
    TargetLevel target_;
};

}  // namespace jsxform
