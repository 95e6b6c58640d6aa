#include "render/patch_applicator.hpp"
#include "core/utils.hpp"

#include <format>

namespace quill {

namespace {

bool apply_one(HeaderMap& headers, const HeaderPatch& patch, std::string& why) {
    if (!is_valid_header_name(patch.name)) {
        why = "invalid header name";
        return false;
    }
    if (patch.kind == HeaderPatchKind::REMOVE) {
        headers.remove(patch.name);
        return true;
    }
    if (!patch.value) {
        why = "missing value";
        return false;
    }
    if (!is_valid_header_value(*patch.value)) {
        why = "invalid header value";
        return false;
    }
    if (patch.kind == HeaderPatchKind::SET) {
        headers.set(patch.name, *patch.value);
    } else {
        headers.append(patch.name, *patch.value);
    }
    return true;
}

} // anonymous namespace

PatchOutcome apply_header_patches(HeaderMap& headers, const std::vector<HeaderPatch>& patches) {
    PatchOutcome outcome;
    for (const auto& patch : patches) {
        std::string why;
        if (apply_one(headers, patch, why)) {
            ++outcome.headers_applied;
        } else {
            ++outcome.headers_dropped;
            utils::log::debug(std::format("Dropped header patch '{}' from '{}': {}",
                patch.name, patch.source, why));
        }
    }
    return outcome;
}

PatchOutcome apply_model_patches(ResponseBody& body, const std::vector<ModelPatch>& patches) {
    PatchOutcome outcome;
    auto* tpl = std::get_if<HtmlTemplateBody>(&body);
    if (!tpl) {
        outcome.model_ignored = patches.size();
        return outcome;
    }

    for (const auto& patch : patches) {
        try {
            tpl->model = tpl->model.patch(patch.patch);
            ++outcome.model_applied;
        } catch (const Json::exception& e) {
            ++outcome.model_failed;
            utils::log::warn(std::format("Model patch from '{}' failed: {}", patch.source, e.what()));
        }
    }
    return outcome;
}

PatchOutcome apply_recommendations(RequestContext& ctx) {
    auto outcome = apply_header_patches(ctx.response.headers, ctx.recommendations.header_patches);
    const auto model = apply_model_patches(ctx.response.body, ctx.recommendations.model_patches);
    outcome.model_applied = model.model_applied;
    outcome.model_failed = model.model_failed;
    outcome.model_ignored = model.model_ignored;
    return outcome;
}

} // namespace quill
