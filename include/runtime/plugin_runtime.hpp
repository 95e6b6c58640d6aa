#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "script/script_engine.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

/**
 * @brief A loadable plugin: source attaches an object to globalThis[id]
 */
struct PluginSpec {
    std::string id;
    std::string name;
    std::string source;
};

/**
 * @brief Ordered plugin registry sharing one script engine
 *
 * Not thread-safe: lives on the PluginActor thread.
 */
class PluginRuntime {
public:
    /// Loads the context shim into the engine
    [[nodiscard]] static Result<std::unique_ptr<PluginRuntime>> create(
        std::unique_ptr<IScriptEngine> engine);

    /// Evaluate the plugin source and register its id (order = load order)
    [[nodiscard]] Result<void> load(const PluginSpec& spec);

    /**
     * @brief Call `<id>.init(ctx)` for every plugin in registration order
     *
     * Missing hooks are skipped; failing ones are logged and reported
     * together once all plugins have been tried.
     */
    [[nodiscard]] Result<void> init_all(const RequestContext& ctx);

    /// `<id>.before(ctx)`; missing hook returns ctx unchanged
    [[nodiscard]] Result<RequestContext> before(std::string_view id, RequestContext ctx);

    /// `<id>.after(ctx)`; missing hook returns ctx unchanged
    [[nodiscard]] Result<RequestContext> after(std::string_view id, RequestContext ctx);

    [[nodiscard]] const std::vector<std::string>& plugin_ids() const { return ids_; }

    /// True if `<id>.<hook>` is currently a function
    [[nodiscard]] bool defines_hook(std::string_view id, std::string_view hook);

private:
    explicit PluginRuntime(std::unique_ptr<IScriptEngine> engine);

    Result<RequestContext> invoke(std::string_view id, std::string_view hook, RequestContext ctx);
    [[nodiscard]] bool is_registered(std::string_view id) const;

    std::unique_ptr<IScriptEngine> engine_;
    std::vector<std::string> ids_;
};

} // namespace quill
