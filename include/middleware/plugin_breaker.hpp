#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quill {

/**
 * @brief Per-plugin failure accounting with a rolling window
 *
 * Two states per plugin:
 * - CLOSED: hook calls go through
 * - OPEN:   hook calls are skipped until open_until
 *
 * A failure more than `window` after the previous one restarts the
 * count. Reaching `max_failures` opens the breaker for `open_for`; a
 * success clears everything. After open_until the next call is
 * attempted; failing it re-opens immediately, however long the breaker
 * was open.
 *
 * All methods take `now` so tests can drive time explicitly.
 */
class PluginBreakerRegistry {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        std::chrono::seconds window{30};
        uint32_t max_failures = 5;
        std::chrono::seconds open_for{30};
    };

    struct State {
        uint32_t failures = 0;
        std::optional<Clock::time_point> last_failure_at;
        std::optional<Clock::time_point> open_until;
    };

    explicit PluginBreakerRegistry(const Config& config);

    /// True while the plugin must be skipped
    [[nodiscard]] bool is_open(const std::string& plugin_id, Clock::time_point now) const;

    void record_success(const std::string& plugin_id);

    /// @return true if this failure opened the breaker
    bool record_failure(const std::string& plugin_id, Clock::time_point now);

    [[nodiscard]] State state(const std::string& plugin_id) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    std::unordered_map<std::string, State> states_;
    mutable std::mutex mutex_;
};

} // namespace quill
