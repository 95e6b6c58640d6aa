#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "script/script_engine.hpp"

#include <memory>
#include <string>

namespace quill {

/**
 * @brief A loadable theme: source calls registerTheme({...}) or assigns globalThis[id]
 */
struct ThemeSpec {
    std::string id;
    std::string name;
    std::string source;
};

/**
 * @brief One theme bound to its own private script engine
 *
 * Not thread-safe: lives on the theme's EngineThread.
 */
class ThemeRuntime {
public:
    /**
     * @brief Load the context shim, the registerTheme prelude and the theme source
     * @return THEME_BOOTSTRAP error if any step fails
     */
    [[nodiscard]] static Result<std::unique_ptr<ThemeRuntime>> create(
        std::unique_ptr<IScriptEngine> engine, const ThemeSpec& spec);

    /// `<id>.init(ctx)`; a theme without init succeeds
    [[nodiscard]] Result<void> init(const RequestContext& ctx);

    /**
     * @brief `<id>.handle(ctx)` merged back into ctx
     *
     * A missing handle is a CALL_ERROR. A theme that leaves the body
     * Unset yields INTERNAL_ERROR.
     */
    [[nodiscard]] Result<RequestContext> render(RequestContext ctx);

    [[nodiscard]] const std::string& id() const { return id_; }

private:
    ThemeRuntime(std::unique_ptr<IScriptEngine> engine, std::string id);

    std::unique_ptr<IScriptEngine> engine_;
    std::string id_;
};

} // namespace quill
