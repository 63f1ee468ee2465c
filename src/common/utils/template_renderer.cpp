// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <filesystem>
#include <string>

namespace agentkernel {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    // Prompts are free text; a leading "##" is markdown, not a line statement
    env_.set_line_statement("#%");
    env_.set_throw_at_missing_includes(true);

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const nlohmann::json& data) {
    // inja::Environment is not safe to share between invoking threads
    thread_local InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const nlohmann::json& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw TemplateError("Template render error: " + e.message);
    } catch (const nlohmann::json::exception& e) {
        // builtin functions applied to a value of the wrong type
        throw TemplateError("Template render error: " + std::string(e.what()));
    }
}

} // namespace agentkernel
