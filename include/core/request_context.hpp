#pragma once

#include "core/header_map.hpp"
#include "core/json.hpp"
#include "core/recommendation.hpp"

#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace quill {

/**
 * @brief Content classification chosen by the resolver
 */
enum class ContentKind { ASSET, HTML, JSON };

[[nodiscard]] constexpr std::string_view content_kind_name(ContentKind kind) {
    switch (kind) {
        case ContentKind::ASSET: return "asset";
        case ContentKind::HTML:  return "html";
        case ContentKind::JSON:  return "json";
    }
    return "asset";
}

// ============================================================================
// Response body specification
// ============================================================================

/// Nothing has produced a body yet (rendering this is an internal error)
struct UnsetBody {
    bool operator==(const UnsetBody&) const = default;
};

/// Explicitly empty body
struct NoneBody {
    bool operator==(const NoneBody&) const = default;
};

struct HtmlTemplateBody {
    std::string template_name;  // registered template name or inline source
    Json model = Json::object();

    bool operator==(const HtmlTemplateBody&) const = default;
};

struct HtmlStringBody {
    std::string html;

    bool operator==(const HtmlStringBody&) const = default;
};

struct JsonBody {
    Json value;

    bool operator==(const JsonBody&) const = default;
};

using ResponseBody = std::variant<UnsetBody, NoneBody, HtmlTemplateBody, HtmlStringBody, JsonBody>;

[[nodiscard]] std::string_view response_body_kind(const ResponseBody& body);

/**
 * @brief Target response shape assembled by plugins and the theme
 */
struct ResponseSpec {
    int status = 200;
    HeaderMap headers;
    ResponseBody body = UnsetBody{};

    bool operator==(const ResponseSpec&) const = default;
};

// ============================================================================
// Request context
// ============================================================================

/**
 * @brief The single mutable object flowing through the request pipeline
 *
 * Owned by the request task. Script actors only ever see snapshots of
 * it; their results are merged into a copy that replaces the original
 * on success.
 */
struct RequestContext {
    std::string request_id;     // UUID v4
    std::string path;
    std::string method;
    std::string version;

    // Canonical header name → value (repeated headers joined with ", ")
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query;

    ContentKind content_kind = ContentKind::ASSET;
    Json content_meta = Json::object();

    Json theme_config = Json::object();
    std::map<std::string, Json> plugin_configs;

    Recommendations recommendations;
    ResponseSpec response;
};

} // namespace quill
