#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "core/request_context.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace quill {

/**
 * @brief What a request path points at
 */
struct ResolvedContent {
    ContentKind kind = ContentKind::ASSET;
    Json front_matter = Json::object();
    std::string body_path;   // empty when nothing was found
};

/// Injected once at startup by whoever knows the content store
using ResolveFn = std::function<Result<ResolvedContent>(std::string_view path, std::string_view method)>;

/// Every path is an asset without front matter
[[nodiscard]] ResolvedContent fallback_resolve(std::string_view path, std::string_view method);

/**
 * @brief Classify by extension (case-insensitive)
 *
 * html/htm → HTML, json → JSON, anything else → ASSET.
 */
[[nodiscard]] ContentKind classify_extension(std::string_view path);

/**
 * @brief Resolves request paths to files under a content root
 *
 * "/" and paths ending in "/" map to "<path>index"; a last segment
 * without an extension gets ".html". Paths escaping the root resolve
 * like missing files.
 */
class FileContentResolver {
public:
    explicit FileContentResolver(std::string root);

    [[nodiscard]] Result<ResolvedContent> resolve(std::string_view path, std::string_view method) const;

    /// Request path → path relative to the root ("/blog/" → "blog/index.html")
    [[nodiscard]] static std::string map_request_path(std::string_view path);

    [[nodiscard]] const std::string& root() const { return root_; }

private:
    std::string root_;
};

[[nodiscard]] ResolveFn make_file_resolver(std::string root);

} // namespace quill
