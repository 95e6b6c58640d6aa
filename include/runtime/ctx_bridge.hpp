#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "core/request_context.hpp"

#include <optional>
#include <string_view>

namespace quill::bridge {

/**
 * @brief Script prelude evaluated in every engine before user code.
 *
 * Defines `__quill.invoke(slot, hook, ctx)`, which wraps
 * `ctx.request.headers` with case-insensitive get()/has() accessors and
 * calls `globalThis[slot][hook](ctx)`. A missing hook throws a
 * TypeError whose message contains "is not a function".
 */
extern const std::string_view kContextShimSource;

/// Dotted path of the invoke helper defined by kContextShimSource
inline constexpr std::string_view kInvokePath = "__quill.invoke";

/**
 * @brief True when an invoke failed only because `slot.hook` is not defined
 *
 * A TypeError raised inside a defined hook does not count, even if its
 * message also says "is not a function".
 */
[[nodiscard]] bool is_missing_hook(const Result<Json>& result, std::string_view slot, std::string_view hook);

/**
 * @brief Snapshot handed to a plugin hook
 *
 * `config` is the plugin's own entry of plugin_configs (or {}).
 * `recommendations` is always empty: a hook only sees what it appends.
 */
[[nodiscard]] Json snapshot_for_plugin(const RequestContext& ctx, std::string_view plugin_id);

/// Snapshot handed to a theme hook; `config` is the theme configuration
[[nodiscard]] Json snapshot_for_theme(const RequestContext& ctx);

/**
 * @brief Merge a hook's return value into ctx
 *
 * Non-object values leave ctx unchanged. Recognised members:
 * `recommendations` (patches appended, stamped with source_id),
 * `response` (replaces the response spec) and `content.meta`.
 * Everything else, including `request` and `config`, is dropped.
 */
void merge_snapshot(const Json& returned, RequestContext& ctx, std::string_view source_id);

// ---- Individual shapes (exposed for tests and diagnostics) -----------------

[[nodiscard]] Json response_to_json(const ResponseSpec& spec);

/// Lenient parse: bad status → 200, bad header entries dropped
[[nodiscard]] std::optional<ResponseSpec> parse_response(const Json& value,
                                                         const ResponseSpec& previous);

[[nodiscard]] std::optional<HeaderPatch> parse_header_patch(const Json& value,
                                                            std::string_view source_id);
[[nodiscard]] std::optional<ModelPatch> parse_model_patch(const Json& value,
                                                          std::string_view source_id);
[[nodiscard]] std::optional<BodyPatch> parse_body_patch(const Json& value,
                                                        std::string_view source_id);
[[nodiscard]] std::optional<DomOp> parse_dom_op(const Json& value);

} // namespace quill::bridge
