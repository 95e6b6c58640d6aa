#pragma once

#include "core/header_map.hpp"
#include "core/recommendation.hpp"
#include "core/request_context.hpp"

#include <cstddef>
#include <vector>

namespace quill {

/**
 * @brief Counters describing one patch application
 */
struct PatchOutcome {
    size_t headers_applied = 0;
    size_t headers_dropped = 0;    // invalid name or value
    size_t model_applied = 0;
    size_t model_failed = 0;
    size_t model_ignored = 0;      // body was not a template
};

/**
 * @brief Apply header patches to a header map in order
 *
 * Set replaces every value, Append adds a parallel value, Remove
 * deletes all values. A patch with an invalid name or value is dropped
 * and never fails the response.
 */
PatchOutcome apply_header_patches(HeaderMap& headers, const std::vector<HeaderPatch>& patches);

/**
 * @brief Apply RFC 6902 model patches to an HtmlTemplate body's model
 *
 * Any other body kind leaves the body untouched. A failing document is
 * logged and skipped; the following documents still apply.
 */
PatchOutcome apply_model_patches(ResponseBody& body, const std::vector<ModelPatch>& patches);

/// Header then model patches from ctx.recommendations onto ctx.response
PatchOutcome apply_recommendations(RequestContext& ctx);

} // namespace quill
