#include "runtime/ctx_bridge.hpp"
#include "script/script_engine.hpp"

#include <format>

namespace quill::bridge {

const std::string_view kContextShimSource = R"JS(
(function (global) {
    function wrapHeaders(raw) {
        const canonical = {};
        const lower = {};
        for (const [k, v] of Object.entries(raw || {})) {
            canonical[k] = v;
            lower[String(k).toLowerCase()] = v;
        }
        return {
            get(name) { return lower[String(name).toLowerCase()]; },
            has(name) {
                return Object.prototype.hasOwnProperty.call(lower, String(name).toLowerCase());
            },
            entries() { return Object.entries(canonical); },
            keys() { return Object.keys(canonical); },
            values() { return Object.values(canonical); },
            toJSON() { return Object.assign({}, canonical); },
        };
    }

    function wrapCtx(ctx) {
        if (ctx && ctx.request && ctx.request.headers && !ctx.request.headers.__wrapped) {
            const wrapped = wrapHeaders(ctx.request.headers);
            Object.defineProperty(wrapped, '__wrapped', { value: true, enumerable: false });
            ctx.request.headers = wrapped;
        }
        return ctx;
    }

    global.__quill = {
        invoke(slot, hook, ctx) {
            const target = global[slot];
            if (target === null || (typeof target !== 'object' && typeof target !== 'function')) {
                throw new TypeError(slot + ' is not an object');
            }
            const fn = target[hook];
            if (typeof fn !== 'function') {
                throw new TypeError(slot + '.' + hook + ' is not a function');
            }
            return fn.call(target, wrapCtx(ctx));
        },
    };
})(globalThis);
)JS";

namespace {

Json request_to_json(const RequestContext& ctx) {
    Json headers = Json::object();
    for (const auto& [name, value] : ctx.headers) headers[name] = value;

    Json query = Json::object();
    for (const auto& [name, value] : ctx.query) query[name] = value;

    return {
        {"requestId", ctx.request_id},
        {"path", ctx.path},
        {"method", ctx.method},
        {"version", ctx.version},
        {"headers", std::move(headers)},
        {"queryParams", std::move(query)},
    };
}

Json body_to_json(const ResponseBody& body) {
    struct BodyVisitor {
        Json operator()(const UnsetBody&) const { return {{"kind", "unset"}}; }
        Json operator()(const NoneBody&) const { return {{"kind", "none"}}; }
        Json operator()(const HtmlTemplateBody& b) const {
            return {{"kind", "htmlTemplate"}, {"template", b.template_name}, {"model", b.model}};
        }
        Json operator()(const HtmlStringBody& b) const {
            return {{"kind", "htmlString"}, {"html", b.html}};
        }
        Json operator()(const JsonBody& b) const {
            return {{"kind", "json"}, {"value", b.value}};
        }
    };
    return std::visit(BodyVisitor{}, body);
}

Json empty_recommendations() {
    return {
        {"headerPatches", Json::array()},
        {"modelPatches", Json::array()},
        {"bodyPatches", Json::array()},
    };
}

Json build_snapshot(const RequestContext& ctx, Json config) {
    return {
        {"request", request_to_json(ctx)},
        {"response", response_to_json(ctx.response)},
        {"content", {
            {"kind", std::string(content_kind_name(ctx.content_kind))},
            {"meta", ctx.content_meta},
        }},
        {"config", std::move(config)},
        {"recommendations", empty_recommendations()},
    };
}

std::optional<std::string> string_member(const Json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

ResponseBody parse_body(const Json& body) {
    const auto kind = string_member(body, "kind");
    if (!kind) return NoneBody{};

    if (*kind == "unset") return UnsetBody{};
    if (*kind == "json") {
        const auto it = body.find("value");
        return JsonBody{it == body.end() ? Json(nullptr) : *it};
    }
    if (*kind == "htmlTemplate") {
        HtmlTemplateBody out;
        out.template_name = string_member(body, "template").value_or("");
        const auto it = body.find("model");
        out.model = (it == body.end()) ? Json::object() : *it;
        return out;
    }
    if (*kind == "htmlString") {
        return HtmlStringBody{string_member(body, "html").value_or("")};
    }
    return NoneBody{};
}

} // anonymous namespace

bool is_missing_hook(const Result<Json>& result, std::string_view slot, std::string_view hook) {
    if (!is_missing_function(result)) return false;
    const auto expected = std::format("{}.{} is not a function", slot, hook);
    return result.error_message().find(expected) != std::string::npos;
}

Json snapshot_for_plugin(const RequestContext& ctx, std::string_view plugin_id) {
    const auto it = ctx.plugin_configs.find(std::string(plugin_id));
    Json config = (it != ctx.plugin_configs.end() && it->second.is_object())
        ? it->second : Json::object();
    return build_snapshot(ctx, std::move(config));
}

Json snapshot_for_theme(const RequestContext& ctx) {
    return build_snapshot(ctx, ctx.theme_config.is_object() ? ctx.theme_config : Json::object());
}

Json response_to_json(const ResponseSpec& spec) {
    Json headers = Json::object();
    for (const auto& [name, value] : spec.headers.entries()) {
        auto& slot = headers[name];
        if (slot.is_null()) {
            slot = value;
        } else if (slot.is_string()) {
            slot = Json::array({slot, value});
        } else {
            slot.push_back(value);
        }
    }
    return {
        {"status", spec.status},
        {"headers", std::move(headers)},
        {"body", body_to_json(spec.body)},
    };
}

std::optional<ResponseSpec> parse_response(const Json& value, const ResponseSpec& previous) {
    if (!value.is_object()) return std::nullopt;

    ResponseSpec spec;
    const auto status = value.find("status");
    if (status != value.end() && status->is_number_integer()) {
        const auto code = status->get<int64_t>();
        spec.status = (code >= 100 && code <= 999) ? static_cast<int>(code) : 200;
    }

    const auto headers = value.find("headers");
    if (headers != value.end() && headers->is_object()) {
        for (auto it = headers->begin(); it != headers->end(); ++it) {
            if (!is_valid_header_name(it.key())) continue;
            auto add = [&](const Json& v) {
                if (v.is_string() && is_valid_header_value(v.get_ref<const std::string&>())) {
                    spec.headers.append(it.key(), v.get<std::string>());
                }
            };
            if (it->is_array()) {
                for (const auto& v : *it) add(v);
            } else {
                add(*it);
            }
        }
    }

    const auto body = value.find("body");
    if (body == value.end()) {
        spec.body = previous.body;
    } else if (body->is_object()) {
        spec.body = parse_body(*body);
    } else {
        spec.body = NoneBody{};
    }
    return spec;
}

std::optional<HeaderPatch> parse_header_patch(const Json& value, std::string_view source_id) {
    if (!value.is_object()) return std::nullopt;
    const auto kind = string_member(value, "kind");
    const auto name = string_member(value, "name");
    if (!kind || !name) return std::nullopt;

    HeaderPatch patch;
    patch.name = *name;
    patch.source = std::string(source_id);
    if (*kind == "set" || *kind == "append") {
        patch.kind = (*kind == "set") ? HeaderPatchKind::SET : HeaderPatchKind::APPEND;
        patch.value = string_member(value, "value");
        if (!patch.value) return std::nullopt;
    } else if (*kind == "remove") {
        patch.kind = HeaderPatchKind::REMOVE;
    } else {
        return std::nullopt;
    }
    return patch;
}

std::optional<ModelPatch> parse_model_patch(const Json& value, std::string_view source_id) {
    if (!value.is_object()) return std::nullopt;
    const auto it = value.find("patch");
    if (it == value.end()) return std::nullopt;
    return ModelPatch{*it, std::string(source_id)};
}

std::optional<DomOp> parse_dom_op(const Json& value) {
    if (!value.is_object()) return std::nullopt;
    const auto kind_name = string_member(value, "kind");
    if (!kind_name) return std::nullopt;
    const auto kind = parse_dom_op_kind(*kind_name);
    if (!kind) return std::nullopt;

    switch (*kind) {
        case DomOpKind::SET_ATTRIBUTE: {
            auto name = string_member(value, "name");
            auto attr_value = string_member(value, "value");
            if (!name || !attr_value) return std::nullopt;
            return DomOp::set_attribute(std::move(*name), std::move(*attr_value));
        }
        case DomOpKind::REMOVE_ATTRIBUTE: {
            auto name = string_member(value, "name");
            if (!name) return std::nullopt;
            return DomOp::remove_attribute(std::move(*name));
        }
        case DomOpKind::ADD_CLASS:
        case DomOpKind::REMOVE_CLASS: {
            auto cls = string_member(value, "class");
            if (!cls) return std::nullopt;
            return (*kind == DomOpKind::ADD_CLASS) ? DomOp::add_class(std::move(*cls))
                                                   : DomOp::remove_class(std::move(*cls));
        }
        case DomOpKind::REMOVE:
            return DomOp::remove();
        case DomOpKind::UNWRAP:
            return DomOp::unwrap();
        default: {
            auto payload = string_member(value, dom_op_is_text(*kind) ? "text" : "html");
            if (!payload) return std::nullopt;
            return DomOp::with_content(*kind, std::move(*payload));
        }
    }
}

std::optional<BodyPatch> parse_body_patch(const Json& value, std::string_view source_id) {
    if (!value.is_object()) return std::nullopt;
    const auto kind = string_member(value, "kind");
    if (!kind) return std::nullopt;

    if (*kind == "regex") {
        auto pattern = string_member(value, "pattern");
        auto replacement = string_member(value, "replacement");
        if (!pattern || !replacement) return std::nullopt;
        return BodyPatch{RegexPatch{std::move(*pattern), std::move(*replacement)},
                         std::string(source_id)};
    }
    if (*kind == "htmlDom") {
        auto selector = string_member(value, "selector");
        const auto ops = value.find("ops");
        if (!selector || ops == value.end() || !ops->is_array()) return std::nullopt;
        HtmlDomPatch dom{std::move(*selector), {}};
        for (const auto& op : *ops) {
            if (auto parsed = parse_dom_op(op)) dom.ops.push_back(std::move(*parsed));
        }
        return BodyPatch{std::move(dom), std::string(source_id)};
    }
    if (*kind == "jsonPatch") {
        const auto patch = value.find("patch");
        if (patch == value.end()) return std::nullopt;
        return BodyPatch{JsonPatchDocument{*patch}, std::string(source_id)};
    }
    return std::nullopt;
}

void merge_snapshot(const Json& returned, RequestContext& ctx, std::string_view source_id) {
    if (!returned.is_object()) return;

    if (const auto recs = returned.find("recommendations");
        recs != returned.end() && recs->is_object()) {
        Recommendations added;
        if (const auto arr = recs->find("headerPatches"); arr != recs->end() && arr->is_array()) {
            for (const auto& v : *arr) {
                if (auto p = parse_header_patch(v, source_id)) added.header_patches.push_back(std::move(*p));
            }
        }
        if (const auto arr = recs->find("modelPatches"); arr != recs->end() && arr->is_array()) {
            for (const auto& v : *arr) {
                if (auto p = parse_model_patch(v, source_id)) added.model_patches.push_back(std::move(*p));
            }
        }
        if (const auto arr = recs->find("bodyPatches"); arr != recs->end() && arr->is_array()) {
            for (const auto& v : *arr) {
                if (auto p = parse_body_patch(v, source_id)) added.body_patches.push_back(std::move(*p));
            }
        }
        ctx.recommendations.append(std::move(added));
    }

    if (const auto resp = returned.find("response"); resp != returned.end()) {
        if (auto spec = parse_response(*resp, ctx.response)) {
            ctx.response = std::move(*spec);
        }
    }

    if (const auto content = returned.find("content");
        content != returned.end() && content->is_object()) {
        if (const auto meta = content->find("meta"); meta != content->end() && meta->is_object()) {
            ctx.content_meta = *meta;
        }
    }
}

} // namespace quill::bridge
