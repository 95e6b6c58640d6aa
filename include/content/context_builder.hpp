#pragma once

#include "content/content_resolver.hpp"
#include "core/json.hpp"
#include "core/request_context.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quill {

/**
 * @brief The HTTP facts a request context is built from
 */
struct RequestParts {
    std::string path;        // percent-decoded
    std::string method;
    std::string version;     // "HTTP/1.1"
    std::vector<std::pair<std::string, std::string>> headers;   // as received
    std::map<std::string, std::string> query;
};

/// Per-router configuration copied into every context
struct RouterConfig {
    Json theme_config = Json::object();
    std::map<std::string, Json> plugin_configs;
};

using BuildFn = std::function<RequestContext(const RequestParts&, const ResolvedContent&)>;

/**
 * @brief Fresh context for one request
 *
 * Header names are canonicalized (repeats joined with ", "), the query
 * map is copied verbatim and a new UUID v4 is assigned. Recommendations
 * start empty and the response body Unset.
 */
[[nodiscard]] RequestContext build_context(const RequestParts& parts,
                                           const ResolvedContent& resolved,
                                           const RouterConfig& router);

/// BuildFn bound to a router configuration
[[nodiscard]] BuildFn make_context_builder(RouterConfig router);

/**
 * @brief Split "a=1&b=x%20y" into a map (percent-decoded, '+' is space, last value wins)
 */
[[nodiscard]] std::map<std::string, std::string> parse_query_string(std::string_view raw);

} // namespace quill
