#pragma once

#include "core/error.hpp"
#include "core/json.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

/**
 * @brief Single-threaded script engine contract
 *
 * An instance is NOT thread-safe and must stay on the thread that
 * created it for its whole lifetime. Values cross the boundary as
 * JSON-equivalent documents (see script/js_value.hpp).
 */
class IScriptEngine {
public:
    virtual ~IScriptEngine() = default;

    /**
     * @brief Evaluate source in the global scope
     * @return Completion value, or EVAL_ERROR / CONVERSION_ERROR
     */
    [[nodiscard]] virtual Result<Json> evaluate(std::string_view source) = 0;

    /**
     * @brief Evaluate source for its side effects (attaching globals)
     * @param name Diagnostic file name used in error messages
     */
    [[nodiscard]] virtual Result<void> load_module(std::string_view name,
                                                   std::string_view source) = 0;

    /**
     * @brief Call a function by dotted path from the global object
     *
     * Every intermediate step must be an object. A non-callable
     * terminal yields CALL_ERROR containing "is not a function";
     * script exceptions are CALL_ERROR with the thrown message.
     */
    [[nodiscard]] virtual Result<Json> call(std::string_view dotted_path,
                                            const std::vector<Json>& args) = 0;
};

/// Creates an engine; actors invoke it on the thread that will own the engine
using ScriptEngineFactory = std::function<std::unique_ptr<IScriptEngine>()>;

/// True when a CALL_ERROR means "hook not defined" rather than a failure
[[nodiscard]] inline bool is_missing_function(const Result<Json>& result) {
    return result.is_error() &&
           result.error_category() == ErrorCategory::CALL_ERROR &&
           result.error_message().find("is not a function") != std::string::npos;
}

} // namespace quill
