#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "middleware/plugin_middleware.hpp"
#include "render/patch_applicator.hpp"
#include "runtime/theme_actor.hpp"
#include "server/theme_dispatcher.hpp"

#include <cstddef>
#include <format>
#include <vector>

namespace quill {

Pipeline::Pipeline(PipelineComponents components)
    : c_(std::move(components)), render_(c_.render) {}

HttpResponse Pipeline::execute(const RequestParts& request) {
    utils::Timer timer;
    auto result = handle(request);
    if (result.is_ok()) {
        utils::log::debug(std::format("{} {} -> {} in {}us", request.method, request.path,
                                      result.value().status, timer.elapsed_us().count()));
        return std::move(result.value());
    }

    failed_requests_.fetch_add(1, std::memory_order_relaxed);
    utils::log::error(std::format("{} {} failed [{}]: {}",
        request.method, request.path,
        error_category_name(result.error_category()), result.error_message()));
    return internal_error_response();
}

Result<HttpResponse> Pipeline::handle(const RequestParts& request) {
    using R = Result<HttpResponse>;
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    // 1-2. Resolve + build
    const auto resolved = resolve_content(request);
    RequestContext ctx = c_.build(request, resolved);
    const std::string request_id = ctx.request_id;

    // 3. Before hooks
    if (c_.plugins) ctx = c_.plugins->run_before(std::move(ctx));

    // 4. Theme
    auto themed = c_.dispatcher->dispatch(*c_.themes, std::move(ctx));
    if (themed.is_error()) {
        return R::error(themed.error_category(),
            std::format("request {}: {}", request_id, themed.error_message()));
    }
    ctx = std::move(themed.value());

    // 5. Header + model patches
    (void)apply_recommendations(ctx);

    // 6-7. Body + response
    auto rendered = render_.render(ctx.response.body, ctx.recommendations.body_patches,
                                   templates_for(ctx.path));
    if (rendered.is_error()) {
        return R::error(rendered.error_category(),
            std::format("request {}: {}", request_id, rendered.error_message()));
    }
    auto built = build_response(ctx.response, std::move(rendered.value()));
    if (built.is_error()) {
        return R::error(built.error_category(),
            std::format("request {}: {}", request_id, built.error_message()));
    }
    HttpResponse response = std::move(built.value());

    // 8. After hooks
    if (c_.plugins) {
        const size_t seen = ctx.recommendations.header_patches.size();
        ctx = c_.plugins->run_after(std::move(ctx));
        const auto& all = ctx.recommendations.header_patches;
        if (all.size() > seen) {
            const std::vector<HeaderPatch> late(all.begin() + static_cast<std::ptrdiff_t>(seen), all.end());
            (void)apply_header_patches(response.headers, late);
        }
    }

    return R::ok(std::move(response));
}

ResolvedContent Pipeline::resolve_content(const RequestParts& request) const {
    if (!c_.resolve) return fallback_resolve(request.path, request.method);

    auto resolved = c_.resolve(request.path, request.method);
    if (resolved.is_error()) {
        utils::log::debug(std::format("Resolver failed for '{}' [{}]: {}", request.path,
            error_category_name(resolved.error_category()), resolved.error_message()));
        return ResolvedContent{};
    }
    return std::move(resolved.value());
}

const TemplateSet& Pipeline::templates_for(const std::string& path) const {
    const auto theme = c_.dispatcher->select(path);
    if (!theme) return no_templates_;
    const auto it = c_.templates.find(*theme);
    return it == c_.templates.end() ? no_templates_ : it->second;
}

} // namespace quill
