#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "runtime/engine_thread.hpp"
#include "runtime/plugin_runtime.hpp"
#include "script/script_engine.hpp"

#include <future>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

/**
 * @brief Asynchronous plugin hook invocation (what the middleware needs)
 *
 * Futures may complete after the caller stopped waiting; a late result
 * is simply dropped with the future.
 */
class IPluginHost {
public:
    virtual ~IPluginHost() = default;

    [[nodiscard]] virtual std::future<Result<RequestContext>> before(
        const std::string& plugin_id, RequestContext ctx) = 0;

    [[nodiscard]] virtual std::future<Result<RequestContext>> after(
        const std::string& plugin_id, RequestContext ctx) = 0;

    /// Registration order
    [[nodiscard]] virtual const std::vector<std::string>& plugin_ids() const = 0;

    /// False only when the plugin is known not to define `hook`
    [[nodiscard]] virtual bool has_hook(const std::string& plugin_id, std::string_view hook) const {
        (void)plugin_id;
        (void)hook;
        return true;
    }
};

/**
 * @brief One engine thread owning one engine and every loaded plugin
 *
 * Commands (InitAll / Before / After) are queued without bound and run
 * strictly one at a time, so no two hooks ever execute concurrently.
 */
class PluginActor final : public IPluginHost {
public:
    /**
     * @brief Spawn the actor thread, create the engine on it and load specs in order
     * @return PLUGIN_BOOTSTRAP error if the engine or any plugin fails to load
     */
    [[nodiscard]] static Result<std::unique_ptr<PluginActor>> start(
        ScriptEngineFactory factory, const std::vector<PluginSpec>& specs);

    ~PluginActor() override;

    [[nodiscard]] std::future<Result<void>> init_all(RequestContext ctx);

    [[nodiscard]] std::future<Result<RequestContext>> before(
        const std::string& plugin_id, RequestContext ctx) override;

    [[nodiscard]] std::future<Result<RequestContext>> after(
        const std::string& plugin_id, RequestContext ctx) override;

    [[nodiscard]] const std::vector<std::string>& plugin_ids() const override { return ids_; }

    /// Hooks are looked up once at load; later reassignment is not seen
    [[nodiscard]] bool has_hook(const std::string& plugin_id, std::string_view hook) const override;

    /// Drain queued commands, destroy the engine on its thread, join
    void stop();

private:
    PluginActor();

    std::unique_ptr<PluginRuntime> runtime_;   // touched only on thread_
    std::vector<std::string> ids_;             // immutable after start()
    std::map<std::string, std::set<std::string, std::less<>>> hooks_;   // id → defined hooks
    EngineThread thread_;
};

} // namespace quill
