// gantry/common/template_renderer.h
#ifndef GANTRY_COMMON_TEMPLATE_RENDERER_H
#define GANTRY_COMMON_TEMPLATE_RENDERER_H

#include "gantry/common/types.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace gantry {

// Renders `<< pipeline.parameters.name >>` style expressions. Only the
// expression syntax is meant for pipeline authors; statement, comment and
// line-statement delimiters are moved out of the way of shell syntax
// (`{#`, `##`, `{%` all occur in real commands).
class ParameterRenderer {
public:
    ParameterRenderer();

    // Uses a shared default-configured environment
    static std::string render(std::string_view template_str, const Context& context);

    std::string render_with_env(std::string_view template_str, const Context& context);

    // Renders every string inside `value` (object keys are left alone)
    static nlohmann::json render_strings(const nlohmann::json& value, const Context& context);

private:
    inja::Environment env_;
    void configure();
};

} // namespace gantry

#endif // GANTRY_COMMON_TEMPLATE_RENDERER_H
