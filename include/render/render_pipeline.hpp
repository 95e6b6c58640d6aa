#pragma once

#include "core/error.hpp"
#include "core/recommendation.hpp"
#include "core/request_context.hpp"
#include "render/template_engine.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace quill {

inline constexpr const char* kHtmlContentType = "text/html; charset=utf-8";
inline constexpr const char* kJsonContentType = "application/json";

/**
 * @brief Final body bytes plus the content type their kind implies
 *
 * content_type is empty for a None body.
 */
struct RenderedBody {
    std::string bytes;
    std::string content_type;
};

/**
 * @brief Turns a finalized ResponseBody and its body patches into bytes
 *
 * HTML (template or literal string):
 *   render → regex patches (streamed) → one DOM rewrite pass; JSON
 *   Patch documents are ignored.
 * JSON:
 *   serialize → regex patches → parse (JSON_AFTER_REGEX) → JSON Patch
 *   documents in order (JSON_PATCH_ERROR) → serialize.
 * None renders empty; Unset is INTERNAL_ERROR.
 *
 * Failures return no partial body.
 */
class RenderPipeline {
public:
    struct Config {
        size_t regex_tail_window = 4096;
        size_t chunk_size = 16 * 1024;   // HTML is fed to the regex writer in chunks of this size
    };

    RenderPipeline() = default;
    explicit RenderPipeline(const Config& config) : config_(config) {}

    [[nodiscard]] Result<RenderedBody> render(const ResponseBody& body,
                                              const std::vector<BodyPatch>& patches,
                                              const TemplateSet& templates) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] Result<RenderedBody> render_html(std::string html,
                                                   const PartitionedBodyPatches& patches) const;
    [[nodiscard]] Result<RenderedBody> render_json(const Json& value,
                                                   const PartitionedBodyPatches& patches) const;

    Config config_;
};

} // namespace quill
