#include "middleware/plugin_breaker.hpp"
#include "core/utils.hpp"

#include <format>

namespace quill {

PluginBreakerRegistry::PluginBreakerRegistry(const Config& config)
    : config_(config) {}

bool PluginBreakerRegistry::is_open(const std::string& plugin_id, Clock::time_point now) const {
    std::lock_guard lock(mutex_);
    const auto it = states_.find(plugin_id);
    if (it == states_.end() || !it->second.open_until) return false;
    return now < *it->second.open_until;
}

void PluginBreakerRegistry::record_success(const std::string& plugin_id) {
    std::lock_guard lock(mutex_);
    const auto it = states_.find(plugin_id);
    if (it != states_.end()) it->second = State{};
}

bool PluginBreakerRegistry::record_failure(const std::string& plugin_id, Clock::time_point now) {
    uint32_t failures = 0;
    {
        std::lock_guard lock(mutex_);
        auto& state = states_[plugin_id];
        // A breaker that has been open stays tripped until a success clears it
        const bool tripped = state.open_until.has_value();
        if (!tripped && state.last_failure_at && now - *state.last_failure_at > config_.window) {
            state.failures = 0;
        }
        ++state.failures;
        state.last_failure_at = now;
        if (!tripped && state.failures < config_.max_failures) return false;
        state.open_until = now + config_.open_for;
        failures = state.failures;
    }
    utils::log::warn(std::format("Plugin '{}' breaker open for {}s after {} failure(s)",
                                 plugin_id, config_.open_for.count(), failures));
    return true;
}

PluginBreakerRegistry::State PluginBreakerRegistry::state(const std::string& plugin_id) const {
    std::lock_guard lock(mutex_);
    const auto it = states_.find(plugin_id);
    return it == states_.end() ? State{} : it->second;
}

} // namespace quill
