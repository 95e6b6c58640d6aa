#pragma once

#include "core/request_context.hpp"
#include "middleware/plugin_breaker.hpp"
#include "runtime/plugin_actor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace quill {

/**
 * @brief Drives before/after hooks of every plugin under deadlines and breakers
 *
 * Never fails a request: a hook that errors, throws or misses its
 * deadline leaves the context untouched and is charged one failure.
 * A late reply is dropped when it finally arrives. Hooks the plugin
 * does not define are skipped without touching its breaker.
 */
class PluginMiddleware {
public:
    using Clock = PluginBreakerRegistry::Clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Config {
        std::chrono::milliseconds call_timeout{100};
    };

    PluginMiddleware(IPluginHost& host, PluginBreakerRegistry& breakers, const Config& config,
                     NowFn now = &Clock::now);

    /// Before hooks in registration order
    [[nodiscard]] RequestContext run_before(RequestContext ctx);

    /// After hooks in reverse registration order
    [[nodiscard]] RequestContext run_after(RequestContext ctx);

    /// Hooks actually sent to the actor (skipped ones excluded)
    [[nodiscard]] uint64_t hooks_invoked() const { return hooks_invoked_.load(); }

private:
    enum class Hook { BEFORE, AFTER };

    RequestContext run_one(Hook hook, const std::string& plugin_id, RequestContext ctx);

    IPluginHost& host_;
    PluginBreakerRegistry& breakers_;
    Config config_;
    NowFn now_;
    std::atomic<uint64_t> hooks_invoked_{0};
};

} // namespace quill
