#include "render/render_pipeline.hpp"
#include "core/json.hpp"
#include "render/body_regex.hpp"
#include "render/html_rewriter.hpp"

#include <algorithm>
#include <format>
#include <variant>

namespace quill {

Result<RenderedBody> RenderPipeline::render(const ResponseBody& body,
                                            const std::vector<BodyPatch>& patches,
                                            const TemplateSet& templates) const {
    using R = Result<RenderedBody>;
    const auto parts = partition_body_patches(patches);

    if (std::holds_alternative<UnsetBody>(body)) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "response body was never set");
    }
    if (std::holds_alternative<NoneBody>(body)) {
        return R::ok(RenderedBody{});
    }
    if (const auto* tpl = std::get_if<HtmlTemplateBody>(&body)) {
        auto rendered = templates.render(tpl->template_name, tpl->model);
        if (rendered.is_error()) return R::error_from(rendered);
        return render_html(std::move(rendered.value()), parts);
    }
    if (const auto* html = std::get_if<HtmlStringBody>(&body)) {
        return render_html(html->html, parts);
    }
    return render_json(std::get<JsonBody>(body).value, parts);
}

Result<RenderedBody> RenderPipeline::render_html(std::string html,
                                                 const PartitionedBodyPatches& patches) const {
    using R = Result<RenderedBody>;

    if (!patches.regex.empty()) {
        auto compiled = RegexPatchSet::compile(patches.regex);
        if (compiled.is_error()) return R::error_from(compiled);

        std::string out;
        out.reserve(html.size());
        StreamingRegexWriter writer(std::move(compiled.value()), config_.regex_tail_window,
                                    [&out](std::string_view piece) { out.append(piece); });

        const std::string_view view(html);
        const size_t step = std::max<size_t>(config_.chunk_size, 1);
        for (size_t offset = 0; offset < view.size(); offset += step) {
            const auto written = writer.write(view.substr(offset, step));
            if (written.is_error()) return R::error_from(written);
        }
        const auto finished = writer.finish();
        if (finished.is_error()) return R::error_from(finished);
        html = std::move(out);
    }

    if (!patches.dom.empty()) {
        auto rewritten = rewrite_html(html, patches.dom);
        if (rewritten.is_error()) return R::error_from(rewritten);
        html = std::move(rewritten.value());
    }

    return R::ok(RenderedBody{std::move(html), kHtmlContentType});
}

Result<RenderedBody> RenderPipeline::render_json(const Json& value,
                                                 const PartitionedBodyPatches& patches) const {
    using R = Result<RenderedBody>;

    if (patches.regex.empty() && patches.json.empty()) {
        return R::ok(RenderedBody{json_util::dump(value), kJsonContentType});
    }

    auto text = apply_regex_patches(json_util::dump(value), patches.regex);
    if (text.is_error()) return R::error_from(text);

    Json current = Json::parse(text.value(), nullptr, false);
    if (current.is_discarded()) {
        return R::error(ErrorCategory::JSON_AFTER_REGEX, "body is no longer valid JSON after regex patches");
    }

    for (const auto& doc : patches.json) {
        if (!doc.document.is_array()) {
            return R::error(ErrorCategory::JSON_PATCH_ERROR, "JSON Patch document must be an array");
        }
        try {
            current = current.patch(doc.document);
        } catch (const Json::exception& e) {
            return R::error(ErrorCategory::JSON_PATCH_ERROR, e.what());
        }
    }

    return R::ok(RenderedBody{json_util::dump(current), kJsonContentType});
}

} // namespace quill
