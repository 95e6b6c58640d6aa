#pragma once

#include "content/context_builder.hpp"
#include "core/error.hpp"
#include "core/pipeline_builder.hpp"
#include "core/request_context.hpp"
#include "render/render_pipeline.hpp"
#include "server/response_builder.hpp"

#include <atomic>
#include <cstdint>

namespace quill {

/**
 * @brief Request coordinator - drives one request end to end
 *
 * Stages:
 * 1. Resolve content (failures become empty content)
 * 2. Build the request context
 * 3. Plugin before-hooks (registration order)
 * 4. Theme dispatch (longest mount prefix)
 * 5. Header and model patches
 * 6. Body render pipeline
 * 7. Response assembly
 * 8. Plugin after-hooks (reverse order); their header patches are
 *    applied to the built response, other recommendations are ignored
 *
 * Theme, render and assembly failures turn into a plain 500.
 */
class Pipeline {
public:
    explicit Pipeline(PipelineComponents components);

    /// Never fails: errors are logged and answered with a 500
    [[nodiscard]] HttpResponse execute(const RequestParts& request);

    /// Same flow with the error surfaced instead of mapped
    [[nodiscard]] Result<HttpResponse> handle(const RequestParts& request);

    struct Stats {
        uint64_t total_requests;
        uint64_t failed_requests;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .failed_requests = failed_requests_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] ResolvedContent resolve_content(const RequestParts& request) const;
    [[nodiscard]] const TemplateSet& templates_for(const std::string& path) const;

    PipelineComponents c_;
    RenderPipeline render_;
    TemplateSet no_templates_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> failed_requests_{0};
};

} // namespace quill
