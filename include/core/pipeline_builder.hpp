#pragma once

#include "content/content_resolver.hpp"
#include "content/context_builder.hpp"
#include "render/render_pipeline.hpp"
#include "render/template_engine.hpp"

#include <map>
#include <memory>
#include <string>

namespace quill {

// Forward declarations
class PluginMiddleware;
class IThemeHost;
class ThemeDispatcher;
class Pipeline;

/**
 * @brief All components that Pipeline needs, grouped in a single struct.
 *
 * Adding a new component only requires adding a field here (no
 * signature changes anywhere).
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<IThemeHost> themes;
    std::shared_ptr<ThemeDispatcher> dispatcher;
    BuildFn build;

    // Optional (empty / nullptr = default behaviour)
    ResolveFn resolve;                              // fallback resolver when empty
    std::shared_ptr<PluginMiddleware> plugins;      // no plugins when null
    std::map<std::string, TemplateSet> templates;   // theme id → its templates
    RenderPipeline::Config render;
};

/**
 * @brief Builder pattern for Pipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_themes(theme_actor)
 *       .with_dispatcher(dispatcher)
 *       .with_context_builder(make_context_builder(router))
 *       .with_resolver(make_file_resolver("content"))   // optional
 *       .with_plugins(middleware)                       // optional
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_themes(std::shared_ptr<IThemeHost> p)           { c_.themes = std::move(p); return *this; }
    PipelineBuilder& with_dispatcher(std::shared_ptr<ThemeDispatcher> p)  { c_.dispatcher = std::move(p); return *this; }
    PipelineBuilder& with_context_builder(BuildFn fn)                     { c_.build = std::move(fn); return *this; }
    PipelineBuilder& with_resolver(ResolveFn fn)                          { c_.resolve = std::move(fn); return *this; }
    PipelineBuilder& with_plugins(std::shared_ptr<PluginMiddleware> p)    { c_.plugins = std::move(p); return *this; }
    PipelineBuilder& with_render_config(const RenderPipeline::Config& c) { c_.render = c; return *this; }

    PipelineBuilder& with_templates(const std::string& theme_id, TemplateSet set) {
        c_.templates[theme_id] = std::move(set);
        return *this;
    }

    /**
     * @brief Build the Pipeline from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<Pipeline> build();

private:
    PipelineComponents c_;
};

} // namespace quill
