#include "runtime/plugin_runtime.hpp"
#include "runtime/ctx_bridge.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace quill {

PluginRuntime::PluginRuntime(std::unique_ptr<IScriptEngine> engine)
    : engine_(std::move(engine)) {}

Result<std::unique_ptr<PluginRuntime>> PluginRuntime::create(std::unique_ptr<IScriptEngine> engine) {
    using R = Result<std::unique_ptr<PluginRuntime>>;
    if (!engine) {
        return R::error(ErrorCategory::PLUGIN_BOOTSTRAP, "no script engine");
    }
    const auto shim = engine->load_module("__quill_ctx_shim__", bridge::kContextShimSource);
    if (shim.is_error()) {
        return R::error(ErrorCategory::PLUGIN_BOOTSTRAP,
            std::format("context shim failed to load: {}", shim.error_message()));
    }
    return R::ok(std::unique_ptr<PluginRuntime>(new PluginRuntime(std::move(engine))));
}

Result<void> PluginRuntime::load(const PluginSpec& spec) {
    if (spec.id.empty()) {
        return Result<void>::error(ErrorCategory::PLUGIN_BOOTSTRAP, "plugin id must not be empty");
    }
    if (is_registered(spec.id)) {
        return Result<void>::error(ErrorCategory::PLUGIN_BOOTSTRAP,
            std::format("plugin '{}' registered twice", spec.id));
    }
    const auto loaded = engine_->load_module(spec.id, spec.source);
    if (loaded.is_error()) {
        return Result<void>::error(ErrorCategory::PLUGIN_BOOTSTRAP,
            std::format("plugin '{}' failed to load: {}", spec.id, loaded.error_message()));
    }
    ids_.push_back(spec.id);
    utils::log::info(std::format("Loaded plugin '{}' ({})", spec.id, spec.name.empty() ? spec.id : spec.name));
    return Result<void>::ok();
}

Result<void> PluginRuntime::init_all(const RequestContext& ctx) {
    std::string failures;
    for (const auto& id : ids_) {
        const auto result = invoke(id, "init", ctx);
        if (result.is_error()) {
            utils::log::warn(std::format("plugin '{}' init failed: {}", id, result.error_message()));
            failures += failures.empty() ? id : ", " + id;
        }
    }
    if (!failures.empty()) {
        return Result<void>::error(ErrorCategory::CALL_ERROR,
            std::format("init failed for: {}", failures));
    }
    return Result<void>::ok();
}

Result<RequestContext> PluginRuntime::before(std::string_view id, RequestContext ctx) {
    return invoke(id, "before", std::move(ctx));
}

Result<RequestContext> PluginRuntime::after(std::string_view id, RequestContext ctx) {
    return invoke(id, "after", std::move(ctx));
}

Result<RequestContext> PluginRuntime::invoke(std::string_view id, std::string_view hook,
                                             RequestContext ctx) {
    if (!is_registered(id)) {
        return Result<RequestContext>::error(ErrorCategory::CALL_ERROR,
            std::format("unknown plugin '{}'", id));
    }

    const auto returned = engine_->call(bridge::kInvokePath,
        {Json(std::string(id)), Json(std::string(hook)), bridge::snapshot_for_plugin(ctx, id)});

    if (bridge::is_missing_hook(returned, id, hook)) {
        return Result<RequestContext>::ok(std::move(ctx));
    }
    if (returned.is_error()) {
        return Result<RequestContext>::error_from(returned);
    }

    bridge::merge_snapshot(returned.value(), ctx, id);
    return Result<RequestContext>::ok(std::move(ctx));
}

bool PluginRuntime::defines_hook(std::string_view id, std::string_view hook) {
    const auto defined = engine_->evaluate(std::format(
        "(() => {{ const p = globalThis[{}]; "
        "return p !== null && (typeof p === 'object' || typeof p === 'function') "
        "&& typeof p[{}] === 'function'; }})()",
        Json(std::string(id)).dump(), Json(std::string(hook)).dump()));
    return defined.is_ok() && defined.value().is_boolean() && defined.value().get<bool>();
}

bool PluginRuntime::is_registered(std::string_view id) const {
    return std::find(ids_.begin(), ids_.end(), id) != ids_.end();
}

} // namespace quill
