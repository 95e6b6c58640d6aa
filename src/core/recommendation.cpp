#include "core/recommendation.hpp"

#include <array>
#include <iterator>
#include <utility>

namespace quill {

namespace {

struct DomOpName {
    DomOpKind kind;
    std::string_view name;
};

constexpr std::array<DomOpName, 16> kDomOpNames = {{
    {DomOpKind::SET_ATTRIBUTE,      "setAttribute"},
    {DomOpKind::REMOVE_ATTRIBUTE,   "removeAttribute"},
    {DomOpKind::ADD_CLASS,          "addClass"},
    {DomOpKind::REMOVE_CLASS,       "removeClass"},
    {DomOpKind::SET_INNER_HTML,     "setInnerHtml"},
    {DomOpKind::SET_INNER_TEXT,     "setInnerText"},
    {DomOpKind::APPEND_HTML,        "appendHtml"},
    {DomOpKind::PREPEND_HTML,       "prependHtml"},
    {DomOpKind::REPLACE_WITH_HTML,  "replaceWithHtml"},
    {DomOpKind::REPLACE_WITH_TEXT,  "replaceWithText"},
    {DomOpKind::INSERT_BEFORE_HTML, "insertBeforeHtml"},
    {DomOpKind::INSERT_AFTER_HTML,  "insertAfterHtml"},
    {DomOpKind::INSERT_BEFORE_TEXT, "insertBeforeText"},
    {DomOpKind::INSERT_AFTER_TEXT,  "insertAfterText"},
    {DomOpKind::REMOVE,             "remove"},
    {DomOpKind::UNWRAP,             "unwrap"},
}};

template<typename T>
void move_append(std::vector<T>& dst, std::vector<T>& src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()),
               std::make_move_iterator(src.end()));
}

} // anonymous namespace

std::string_view dom_op_kind_name(DomOpKind kind) {
    for (const auto& entry : kDomOpNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "unknown";
}

std::optional<DomOpKind> parse_dom_op_kind(std::string_view name) {
    for (const auto& entry : kDomOpNames) {
        if (entry.name == name) return entry.kind;
    }
    return std::nullopt;
}

bool dom_op_is_text(DomOpKind kind) {
    switch (kind) {
        case DomOpKind::SET_INNER_TEXT:
        case DomOpKind::REPLACE_WITH_TEXT:
        case DomOpKind::INSERT_BEFORE_TEXT:
        case DomOpKind::INSERT_AFTER_TEXT:
            return true;
        default:
            return false;
    }
}

void Recommendations::append(Recommendations other) {
    move_append(header_patches, other.header_patches);
    move_append(model_patches, other.model_patches);
    move_append(body_patches, other.body_patches);
}

PartitionedBodyPatches partition_body_patches(const std::vector<BodyPatch>& patches) {
    PartitionedBodyPatches out;
    for (const auto& patch : patches) {
        if (const auto* rx = std::get_if<RegexPatch>(&patch.kind)) {
            out.regex.push_back(*rx);
        } else if (const auto* dom = std::get_if<HtmlDomPatch>(&patch.kind)) {
            out.dom.push_back(*dom);
        } else if (const auto* jp = std::get_if<JsonPatchDocument>(&patch.kind)) {
            out.json.push_back(*jp);
        }
    }
    return out;
}

} // namespace quill
