#include "content/context_builder.hpp"
#include "core/header_map.hpp"
#include "core/utils.hpp"

namespace quill {

RequestContext build_context(const RequestParts& parts,
                             const ResolvedContent& resolved,
                             const RouterConfig& router) {
    RequestContext ctx;
    ctx.request_id = utils::generate_uuid_v4();
    ctx.path = parts.path;
    ctx.method = parts.method;
    ctx.version = parts.version;

    for (const auto& [name, value] : parts.headers) {
        const auto canonical = canonicalize_header_name(name);
        auto [it, inserted] = ctx.headers.try_emplace(canonical, value);
        if (!inserted) {
            it->second += ", ";
            it->second += value;
        }
    }
    ctx.query = parts.query;

    ctx.content_kind = resolved.kind;
    ctx.content_meta = resolved.front_matter.is_null() ? Json::object() : resolved.front_matter;

    ctx.theme_config = router.theme_config;
    ctx.plugin_configs = router.plugin_configs;
    return ctx;
}

BuildFn make_context_builder(RouterConfig router) {
    return [router = std::move(router)](const RequestParts& parts, const ResolvedContent& resolved) {
        return build_context(parts, resolved, router);
    };
}

std::map<std::string, std::string> parse_query_string(std::string_view raw) {
    std::map<std::string, std::string> out;
    if (!raw.empty() && raw.front() == '?') raw.remove_prefix(1);

    while (!raw.empty()) {
        const auto amp = raw.find('&');
        const auto pair = raw.substr(0, amp);
        raw = (amp == std::string_view::npos) ? std::string_view{} : raw.substr(amp + 1);
        if (pair.empty()) continue;

        const auto eq = pair.find('=');
        auto key = utils::percent_decode(pair.substr(0, eq), true);
        if (key.empty()) continue;
        auto value = (eq == std::string_view::npos)
            ? std::string{}
            : utils::percent_decode(pair.substr(eq + 1), true);
        out.insert_or_assign(std::move(key), std::move(value));
    }
    return out;
}

} // namespace quill
