#include "core/request_context.hpp"

namespace quill {

std::string_view response_body_kind(const ResponseBody& body) {
    struct KindVisitor {
        std::string_view operator()(const UnsetBody&) const { return "unset"; }
        std::string_view operator()(const NoneBody&) const { return "none"; }
        std::string_view operator()(const HtmlTemplateBody&) const { return "htmlTemplate"; }
        std::string_view operator()(const HtmlStringBody&) const { return "htmlString"; }
        std::string_view operator()(const JsonBody&) const { return "json"; }
    };
    return std::visit(KindVisitor{}, body);
}

} // namespace quill
