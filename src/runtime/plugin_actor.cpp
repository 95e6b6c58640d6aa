#include "runtime/plugin_actor.hpp"
#include "core/utils.hpp"

#include <format>
#include <type_traits>

namespace quill {

namespace {

/// Turn exceptions thrown by a hook call into error results
template<typename Fn>
auto shielded(Fn fn, ErrorCategory category) {
    return [fn = std::move(fn), category]() mutable -> std::invoke_result_t<Fn&> {
        using R = std::invoke_result_t<Fn&>;
        try {
            return fn();
        } catch (const std::exception& e) {
            return R::error(category, e.what());
        }
    };
}

} // anonymous namespace

PluginActor::PluginActor() : thread_("plugin-actor") {}

PluginActor::~PluginActor() {
    stop();
}

Result<std::unique_ptr<PluginActor>> PluginActor::start(ScriptEngineFactory factory,
                                                        const std::vector<PluginSpec>& specs) {
    using R = Result<std::unique_ptr<PluginActor>>;
    std::unique_ptr<PluginActor> actor(new PluginActor());

    auto boot = actor->thread_.submit([raw = actor.get(), factory, specs]() -> Result<void> {
        auto created = PluginRuntime::create(factory());
        if (created.is_error()) return Result<void>::error_from(created);
        raw->runtime_ = std::move(created.value());
        for (const auto& spec : specs) {
            const auto loaded = raw->runtime_->load(spec);
            if (loaded.is_error()) return loaded;
            auto& hooks = raw->hooks_[spec.id];
            for (const char* hook : {"init", "before", "after"}) {
                if (raw->runtime_->defines_hook(spec.id, hook)) hooks.insert(hook);
            }
        }
        return Result<void>::ok();
    });

    Result<void> booted = Result<void>::ok();
    try {
        booted = boot.get();
    } catch (const std::exception& e) {
        booted = Result<void>::error(ErrorCategory::PLUGIN_BOOTSTRAP,
            std::format("plugin engine failed to start: {}", e.what()));
    }
    if (booted.is_error()) {
        return R::error(ErrorCategory::PLUGIN_BOOTSTRAP, booted.error_message());
    }

    for (const auto& spec : specs) actor->ids_.push_back(spec.id);
    utils::log::info(std::format("Plugin actor started with {} plugin(s)", actor->ids_.size()));
    return R::ok(std::move(actor));
}

std::future<Result<void>> PluginActor::init_all(RequestContext ctx) {
    return thread_.submit(shielded([this, ctx = std::move(ctx)]() {
        return runtime_->init_all(ctx);
    }, ErrorCategory::CALL_ERROR));
}

std::future<Result<RequestContext>> PluginActor::before(const std::string& plugin_id,
                                                        RequestContext ctx) {
    return thread_.submit(shielded([this, plugin_id, ctx = std::move(ctx)]() mutable {
        return runtime_->before(plugin_id, std::move(ctx));
    }, ErrorCategory::CALL_ERROR));
}

std::future<Result<RequestContext>> PluginActor::after(const std::string& plugin_id,
                                                       RequestContext ctx) {
    return thread_.submit(shielded([this, plugin_id, ctx = std::move(ctx)]() mutable {
        return runtime_->after(plugin_id, std::move(ctx));
    }, ErrorCategory::CALL_ERROR));
}

bool PluginActor::has_hook(const std::string& plugin_id, std::string_view hook) const {
    const auto it = hooks_.find(plugin_id);
    return it != hooks_.end() && it->second.contains(hook);
}

void PluginActor::stop() {
    // The engine is destroyed on the thread that created it
    (void)thread_.post([this] { runtime_.reset(); });
    thread_.stop();
}

} // namespace quill
