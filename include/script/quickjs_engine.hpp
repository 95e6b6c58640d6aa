#pragma once

#include "script/script_engine.hpp"

#include <cstddef>
#include <memory>

struct JSRuntime;
struct JSContext;

namespace quill {

/**
 * @brief IScriptEngine backed by one QuickJS runtime + context
 *
 * The context has the standard ECMAScript intrinsics only: no module
 * loader, filesystem, timers or network, so scripts can reach the
 * host solely through the values they are called with.
 */
class QuickJsEngine final : public IScriptEngine {
public:
    struct Options {
        size_t memory_limit_bytes = 0;   // 0 = unlimited
        size_t max_stack_bytes = 0;      // 0 = QuickJS default
    };

    QuickJsEngine();
    explicit QuickJsEngine(const Options& options);
    ~QuickJsEngine() override;

    QuickJsEngine(const QuickJsEngine&) = delete;
    QuickJsEngine& operator=(const QuickJsEngine&) = delete;

    [[nodiscard]] Result<Json> evaluate(std::string_view source) override;

    [[nodiscard]] Result<void> load_module(std::string_view name,
                                           std::string_view source) override;

    [[nodiscard]] Result<Json> call(std::string_view dotted_path,
                                    const std::vector<Json>& args) override;

private:
    void drain_pending_jobs();

    JSRuntime* rt_ = nullptr;
    JSContext* ctx_ = nullptr;
};

[[nodiscard]] ScriptEngineFactory make_quickjs_factory(QuickJsEngine::Options options = {});

} // namespace quill
