#ifndef AGENTKERNEL_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTKERNEL_COMMON_UTILS_TEMPLATE_RENDERER_H

#include <inja/inja.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace agentkernel {

// Prompt templates. {% include %} is disabled.
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 使用线程局部的默认环境渲染; throws TemplateError
    static std::string render(std::string_view template_str, const nlohmann::json& data);

private:
    // 使用当前实例的环境渲染; throws TemplateError
    std::string render_with_env(std::string_view template_str, const nlohmann::json& data);

    inja::Environment env_;
    void configure_security();
};

} // namespace agentkernel

#endif // AGENTKERNEL_COMMON_UTILS_TEMPLATE_RENDERER_H
