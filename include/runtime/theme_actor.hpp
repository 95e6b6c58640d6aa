#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "runtime/engine_thread.hpp"
#include "runtime/theme_runtime.hpp"
#include "script/script_engine.hpp"

#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quill {

/**
 * @brief Asynchronous theme rendering (what the dispatcher needs)
 */
class IThemeHost {
public:
    virtual ~IThemeHost() = default;

    /// Unknown theme ids complete immediately with CALL_ERROR
    [[nodiscard]] virtual std::future<Result<RequestContext>> render(
        const std::string& theme_id, RequestContext ctx) = 0;
};

/**
 * @brief Per-theme engines, each pinned to its own EngineThread
 *
 * Calls into one theme are serialized; distinct themes render in
 * parallel. A fault in one theme's engine cannot reach another.
 */
class ThemeActor final : public IThemeHost {
public:
    /**
     * @brief Create one thread + engine per spec and load the theme on it
     * @return THEME_BOOTSTRAP error if any theme fails to load
     */
    [[nodiscard]] static Result<std::unique_ptr<ThemeActor>> start(
        ScriptEngineFactory factory, const std::vector<ThemeSpec>& specs);

    ~ThemeActor() override;

    /// Runs init on every theme; failures are logged, never returned
    void init_all(const RequestContext& ctx);

    [[nodiscard]] std::future<Result<RequestContext>> render(
        const std::string& theme_id, RequestContext ctx) override;

    [[nodiscard]] std::vector<std::string> theme_ids() const;

    void stop();

private:
    struct Slot {
        explicit Slot(const std::string& id) : thread("theme-" + id) {}

        std::unique_ptr<ThemeRuntime> runtime;  // touched only on thread
        EngineThread thread;
    };

    ThemeActor() = default;

    std::map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace quill
