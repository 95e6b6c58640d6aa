#include "server/response_builder.hpp"
#include "server/http_constants.hpp"

#include <format>

namespace quill {

Result<HttpResponse> build_response(const ResponseSpec& spec, RenderedBody body) {
    if (spec.status < 100 || spec.status > 599) {
        return Result<HttpResponse>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("status {} cannot be sent", spec.status));
    }

    HttpResponse response;
    response.status = spec.status;
    response.headers = spec.headers;
    if (!body.content_type.empty() && !response.headers.contains(http::kContentTypeHeader)) {
        response.headers.set(http::kContentTypeHeader, std::move(body.content_type));
    }
    response.body = std::move(body.bytes);
    return Result<HttpResponse>::ok(std::move(response));
}

HttpResponse internal_error_response() {
    HttpResponse response;
    response.status = 500;
    response.headers.set(http::kContentTypeHeader, http::kTextContentType);
    response.body = "Internal Server Error";
    return response;
}

} // namespace quill
