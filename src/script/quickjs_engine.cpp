#include "script/quickjs_engine.hpp"
#include "script/js_value.hpp"

#include <format>
#include <stdexcept>
#include <string>

namespace quill {

namespace {

std::vector<std::string> split_path(std::string_view dotted_path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= dotted_path.size()) {
        const size_t dot = dotted_path.find('.', start);
        const size_t end = (dot == std::string_view::npos) ? dotted_path.size() : dot;
        parts.emplace_back(dotted_path.substr(start, end - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return parts;
}

} // anonymous namespace

QuickJsEngine::QuickJsEngine() : QuickJsEngine(Options{}) {}

QuickJsEngine::QuickJsEngine(const Options& options) {
    rt_ = JS_NewRuntime();
    if (rt_ == nullptr) {
        throw std::runtime_error("QuickJS: failed to create runtime");
    }
    if (options.memory_limit_bytes > 0) {
        JS_SetMemoryLimit(rt_, options.memory_limit_bytes);
    }
    if (options.max_stack_bytes > 0) {
        JS_SetMaxStackSize(rt_, options.max_stack_bytes);
    }
    ctx_ = JS_NewContext(rt_);
    if (ctx_ == nullptr) {
        JS_FreeRuntime(rt_);
        rt_ = nullptr;
        throw std::runtime_error("QuickJS: failed to create context");
    }
}

QuickJsEngine::~QuickJsEngine() {
    if (ctx_) JS_FreeContext(ctx_);
    if (rt_) JS_FreeRuntime(rt_);
}

void QuickJsEngine::drain_pending_jobs() {
    JSContext* job_ctx = nullptr;
    while (JS_ExecutePendingJob(rt_, &job_ctx) > 0) {
    }
}

Result<Json> QuickJsEngine::evaluate(std::string_view source) {
    const std::string src(source);
    JSValue result = JS_Eval(ctx_, src.c_str(), src.size(), "<eval>", JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(result)) {
        return Result<Json>::error(ErrorCategory::EVAL_ERROR, js::take_exception_message(ctx_));
    }
    drain_pending_jobs();
    auto converted = js::from_js(ctx_, result);
    JS_FreeValue(ctx_, result);
    return converted;
}

Result<void> QuickJsEngine::load_module(std::string_view name, std::string_view source) {
    const std::string src(source);
    const std::string filename(name);
    JSValue result = JS_Eval(ctx_, src.c_str(), src.size(), filename.c_str(), JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(result)) {
        return Result<void>::error(ErrorCategory::EVAL_ERROR,
            std::format("{}: {}", filename, js::take_exception_message(ctx_)));
    }
    JS_FreeValue(ctx_, result);
    drain_pending_jobs();
    return Result<void>::ok();
}

Result<Json> QuickJsEngine::call(std::string_view dotted_path, const std::vector<Json>& args) {
    const auto parts = split_path(dotted_path);

    JSValue holder = JS_GetGlobalObject(ctx_);
    std::string walked;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        walked += (walked.empty() ? "" : ".") + parts[i];
        JSAtom atom = JS_NewAtomLen(ctx_, parts[i].data(), parts[i].size());
        JSValue next = JS_GetProperty(ctx_, holder, atom);
        JS_FreeAtom(ctx_, atom);
        JS_FreeValue(ctx_, holder);
        if (JS_IsException(next)) {
            return Result<Json>::error(ErrorCategory::CALL_ERROR,
                std::format("{}: {}", walked, js::take_exception_message(ctx_)));
        }
        if (!JS_IsObject(next)) {
            JS_FreeValue(ctx_, next);
            return Result<Json>::error(ErrorCategory::CALL_ERROR,
                std::format("{} is not an object", walked));
        }
        holder = next;
    }

    const std::string& leaf = parts.back();
    JSAtom atom = JS_NewAtomLen(ctx_, leaf.data(), leaf.size());
    JSValue fn = JS_GetProperty(ctx_, holder, atom);
    JS_FreeAtom(ctx_, atom);
    if (JS_IsException(fn)) {
        JS_FreeValue(ctx_, holder);
        return Result<Json>::error(ErrorCategory::CALL_ERROR,
            std::format("{}: {}", dotted_path, js::take_exception_message(ctx_)));
    }
    if (!JS_IsFunction(ctx_, fn)) {
        JS_FreeValue(ctx_, fn);
        JS_FreeValue(ctx_, holder);
        return Result<Json>::error(ErrorCategory::CALL_ERROR,
            std::format("{} is not a function", dotted_path));
    }

    std::vector<JSValue> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(js::to_js(ctx_, arg));
    }

    JSValue ret = JS_Call(ctx_, fn, holder, static_cast<int>(argv.size()), argv.data());

    for (auto& v : argv) JS_FreeValue(ctx_, v);
    JS_FreeValue(ctx_, fn);
    JS_FreeValue(ctx_, holder);

    if (JS_IsException(ret)) {
        return Result<Json>::error(ErrorCategory::CALL_ERROR,
            std::format("{}: {}", dotted_path, js::take_exception_message(ctx_)));
    }
    drain_pending_jobs();

    auto converted = js::from_js(ctx_, ret);
    JS_FreeValue(ctx_, ret);
    return converted;
}

ScriptEngineFactory make_quickjs_factory(QuickJsEngine::Options options) {
    return [options]() -> std::unique_ptr<IScriptEngine> {
        return std::make_unique<QuickJsEngine>(options);
    };
}

} // namespace quill
