#pragma once

#include "core/error.hpp"
#include "core/header_map.hpp"
#include "core/request_context.hpp"
#include "render/render_pipeline.hpp"

#include <string>

namespace quill {

/**
 * @brief Transport-neutral HTTP response handed to the server layer
 */
struct HttpResponse {
    int status = 200;
    HeaderMap headers;
    std::string body;
};

/**
 * @brief Combine the response spec with rendered bytes
 *
 * Content-Type comes from the rendered body only when the spec has
 * none. A status outside 100..599 cannot be sent and is INTERNAL_ERROR.
 */
[[nodiscard]] Result<HttpResponse> build_response(const ResponseSpec& spec, RenderedBody body);

/// Generic plaintext 500 (no details leak to the client)
[[nodiscard]] HttpResponse internal_error_response();

} // namespace quill
