#include "runtime/theme_runtime.hpp"
#include "runtime/ctx_bridge.hpp"
#include "core/utils.hpp"

#include <format>
#include <variant>

namespace quill {

namespace {

// `THEME_ID` is substituted with the JSON-quoted theme id
constexpr std::string_view kRegisterThemePrelude = R"JS(
(function (global, themeId) {
    global.registerTheme = function (hooks) {
        if (hooks === null || typeof hooks !== 'object') {
            throw new TypeError('registerTheme expects an object');
        }
        if (typeof hooks.handle !== 'function') {
            throw new TypeError('theme ' + themeId + ' must define handle(ctx)');
        }
        global[themeId] = hooks;
    };
})(globalThis, THEME_ID);
)JS";

std::string render_prelude(const std::string& theme_id) {
    std::string source(kRegisterThemePrelude);
    const auto pos = source.find("THEME_ID");
    source.replace(pos, 8, Json(theme_id).dump());
    return source;
}

} // anonymous namespace

ThemeRuntime::ThemeRuntime(std::unique_ptr<IScriptEngine> engine, std::string id)
    : engine_(std::move(engine)), id_(std::move(id)) {}

Result<std::unique_ptr<ThemeRuntime>> ThemeRuntime::create(std::unique_ptr<IScriptEngine> engine,
                                                           const ThemeSpec& spec) {
    using R = Result<std::unique_ptr<ThemeRuntime>>;
    if (!engine) {
        return R::error(ErrorCategory::THEME_BOOTSTRAP, "no script engine");
    }
    if (spec.id.empty()) {
        return R::error(ErrorCategory::THEME_BOOTSTRAP, "theme id must not be empty");
    }

    const auto shim = engine->load_module("__quill_ctx_shim__", bridge::kContextShimSource);
    if (shim.is_error()) {
        return R::error(ErrorCategory::THEME_BOOTSTRAP,
            std::format("context shim failed to load: {}", shim.error_message()));
    }
    const auto prelude = engine->load_module("__quill_theme_prelude__", render_prelude(spec.id));
    if (prelude.is_error()) {
        return R::error(ErrorCategory::THEME_BOOTSTRAP,
            std::format("theme prelude failed to load: {}", prelude.error_message()));
    }
    const auto loaded = engine->load_module(spec.id, spec.source);
    if (loaded.is_error()) {
        return R::error(ErrorCategory::THEME_BOOTSTRAP,
            std::format("theme '{}' failed to load: {}", spec.id, loaded.error_message()));
    }

    utils::log::info(std::format("Loaded theme '{}' ({})", spec.id, spec.name.empty() ? spec.id : spec.name));
    return R::ok(std::unique_ptr<ThemeRuntime>(new ThemeRuntime(std::move(engine), spec.id)));
}

Result<void> ThemeRuntime::init(const RequestContext& ctx) {
    const auto returned = engine_->call(bridge::kInvokePath,
        {Json(id_), Json("init"), bridge::snapshot_for_theme(ctx)});
    if (returned.is_error() && !bridge::is_missing_hook(returned, id_, "init")) {
        return Result<void>::error_from(returned);
    }
    return Result<void>::ok();
}

Result<RequestContext> ThemeRuntime::render(RequestContext ctx) {
    const auto returned = engine_->call(bridge::kInvokePath,
        {Json(id_), Json("handle"), bridge::snapshot_for_theme(ctx)});
    if (returned.is_error()) {
        return Result<RequestContext>::error_from(returned);
    }

    bridge::merge_snapshot(returned.value(), ctx, id_);
    if (std::holds_alternative<UnsetBody>(ctx.response.body)) {
        return Result<RequestContext>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("theme '{}' produced no response body", id_));
    }
    return Result<RequestContext>::ok(std::move(ctx));
}

} // namespace quill
