// common/template_renderer.cpp
#include "gantry/common/template_renderer.h"
#include "gantry/common/errors.h"
#include <filesystem>
#include <string>

namespace gantry {

ParameterRenderer::ParameterRenderer() : env_() {
    configure();
}

void ParameterRenderer::configure() {
    env_.set_expression("<<", ">>");
    env_.set_statement("<%gantry", "gantry%>");
    env_.set_comment("<#gantry", "gantry#>");
    env_.set_line_statement("%%gantry%%");
    env_.set_throw_at_missing_includes(true);

    // Pipeline definitions never include other templates
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Template includes are disabled", inja::SourceLocation{});
    });
}

std::string ParameterRenderer::render(std::string_view template_str, const Context& context) {
    thread_local ParameterRenderer renderer;
    return renderer.render_with_env(template_str, context);
}

std::string ParameterRenderer::render_with_env(std::string_view template_str, const Context& context) {
    // Fast path: most fields carry no expression
    if (template_str.find("<<") == std::string_view::npos) {
        return std::string(template_str);
    }
    // `\<<` stays a literal `<<` (shell heredocs); pieces are rendered one by one
    const size_t escape = template_str.find("\\<<");
    if (escape != std::string_view::npos) {
        return render_with_env(template_str.substr(0, escape), context) + "<<" +
               render_with_env(template_str.substr(escape + 3), context);
    }
    try {
        return env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw ConfigError("Template render error in '" + std::string(template_str) + "': " + e.message);
    }
}

nlohmann::json ParameterRenderer::render_strings(const nlohmann::json& value, const Context& context) {
    if (value.is_string()) {
        return render(value.get<std::string>(), context);
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) {
            out.push_back(render_strings(item, context));
        }
        return out;
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = render_strings(it.value(), context);
        }
        return out;
    }
    return value;
}

} // namespace gantry
