#include "middleware/plugin_middleware.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>

namespace quill {

PluginMiddleware::PluginMiddleware(IPluginHost& host, PluginBreakerRegistry& breakers,
                                   const Config& config, NowFn now)
    : host_(host), breakers_(breakers), config_(config), now_(std::move(now)) {}

RequestContext PluginMiddleware::run_before(RequestContext ctx) {
    for (const auto& id : host_.plugin_ids()) {
        ctx = run_one(Hook::BEFORE, id, std::move(ctx));
    }
    return ctx;
}

RequestContext PluginMiddleware::run_after(RequestContext ctx) {
    const auto& ids = host_.plugin_ids();
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        ctx = run_one(Hook::AFTER, *it, std::move(ctx));
    }
    return ctx;
}

RequestContext PluginMiddleware::run_one(Hook hook, const std::string& plugin_id, RequestContext ctx) {
    const char* hook_name = (hook == Hook::BEFORE) ? "before" : "after";
    if (!host_.has_hook(plugin_id, hook_name)) return ctx;

    if (breakers_.is_open(plugin_id, now_())) {
        utils::log::debug(std::format("[{}] skipping {}.{} (breaker open)", ctx.request_id, plugin_id, hook_name));
        return ctx;
    }

    ++hooks_invoked_;
    auto future = (hook == Hook::BEFORE) ? host_.before(plugin_id, ctx) : host_.after(plugin_id, ctx);

    std::string failure;
    if (future.wait_for(config_.call_timeout) != std::future_status::ready) {
        failure = std::format("{} error: no reply within {}ms",
                              error_category_name(ErrorCategory::TIMEOUT_ERROR), config_.call_timeout.count());
    } else {
        try {
            auto result = future.get();
            if (result.is_ok()) {
                breakers_.record_success(plugin_id);
                return std::move(result.value());
            }
            failure = std::format("{} error: {}", error_category_name(result.error_category()),
                                  result.error_message());
        } catch (const std::exception& e) {
            failure = e.what();
        }
    }

    utils::log::warn(std::format("[{}] plugin {}.{} failed: {}", ctx.request_id, plugin_id, hook_name, failure));
    (void)breakers_.record_failure(plugin_id, now_());
    return ctx;
}

} // namespace quill
