#pragma once

#include "core/error.hpp"
#include "core/json.hpp"

extern "C" {
#include <quickjs.h>
}

namespace quill::js {

/// Nesting limit for conversions; deeper values are treated as cyclic
inline constexpr int kMaxConversionDepth = 256;

/**
 * @brief Host JSON → engine value (caller owns the returned value)
 *
 * Integers become JS numbers; those beyond ±2^53 lose precision the
 * same way any JS number does.
 */
[[nodiscard]] JSValue to_js(JSContext* ctx, const Json& value);

/**
 * @brief Engine value → host JSON
 *
 * Integral doubles within ±2^53 come back as JSON integers; NaN and
 * ±Infinity become null. Object members that are functions or
 * undefined are skipped (array slots become null). Symbols, BigInts,
 * top-level functions and over-deep nesting are CONVERSION_ERROR.
 */
[[nodiscard]] Result<Json> from_js(JSContext* ctx, JSValueConst value);

/// Message of a pending exception, clearing it ("Error: msg" form)
[[nodiscard]] std::string take_exception_message(JSContext* ctx);

} // namespace quill::js
