#pragma once

#include "core/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quill {

// ============================================================================
// Header / model patches
// ============================================================================

enum class HeaderPatchKind { SET, APPEND, REMOVE };

struct HeaderPatch {
    HeaderPatchKind kind = HeaderPatchKind::SET;
    std::string name;
    std::optional<std::string> value;   // absent for REMOVE
    std::string source;                 // plugin / theme id that proposed it

    bool operator==(const HeaderPatch&) const = default;
};

/// RFC 6902 document targeting the template model
struct ModelPatch {
    Json patch;
    std::string source;

    bool operator==(const ModelPatch&) const = default;
};

// ============================================================================
// Structural HTML operations
// ============================================================================

enum class DomOpKind {
    SET_ATTRIBUTE,
    REMOVE_ATTRIBUTE,
    ADD_CLASS,
    REMOVE_CLASS,
    SET_INNER_HTML,
    SET_INNER_TEXT,
    APPEND_HTML,
    PREPEND_HTML,
    REPLACE_WITH_HTML,
    REPLACE_WITH_TEXT,
    INSERT_BEFORE_HTML,
    INSERT_AFTER_HTML,
    INSERT_BEFORE_TEXT,
    INSERT_AFTER_TEXT,
    REMOVE,
    UNWRAP
};

/**
 * @brief One structural operation applied to a matched element
 *
 * `name` holds the attribute name (SET/REMOVE_ATTRIBUTE) or the class
 * token (ADD/REMOVE_CLASS); `content` holds the attribute value or the
 * HTML / text payload.
 */
struct DomOp {
    DomOpKind kind = DomOpKind::REMOVE;
    std::string name;
    std::string content;

    static DomOp set_attribute(std::string attr, std::string value) {
        return {DomOpKind::SET_ATTRIBUTE, std::move(attr), std::move(value)};
    }
    static DomOp remove_attribute(std::string attr) {
        return {DomOpKind::REMOVE_ATTRIBUTE, std::move(attr), {}};
    }
    static DomOp add_class(std::string cls) { return {DomOpKind::ADD_CLASS, std::move(cls), {}}; }
    static DomOp remove_class(std::string cls) { return {DomOpKind::REMOVE_CLASS, std::move(cls), {}}; }
    static DomOp with_content(DomOpKind kind, std::string payload) {
        return {kind, {}, std::move(payload)};
    }
    static DomOp remove() { return {DomOpKind::REMOVE, {}, {}}; }
    static DomOp unwrap() { return {DomOpKind::UNWRAP, {}, {}}; }

    bool operator==(const DomOp&) const = default;
};

/// camelCase script-facing name ("setInnerHtml")
[[nodiscard]] std::string_view dom_op_kind_name(DomOpKind kind);
[[nodiscard]] std::optional<DomOpKind> parse_dom_op_kind(std::string_view name);

/// True for kinds whose payload is escaped text rather than raw HTML
[[nodiscard]] bool dom_op_is_text(DomOpKind kind);

// ============================================================================
// Body patches
// ============================================================================

struct RegexPatch {
    std::string pattern;
    std::string replacement;

    bool operator==(const RegexPatch&) const = default;
};

struct HtmlDomPatch {
    std::string selector;
    std::vector<DomOp> ops;

    bool operator==(const HtmlDomPatch&) const = default;
};

struct JsonPatchDocument {
    Json document;

    bool operator==(const JsonPatchDocument&) const = default;
};

using BodyPatchKind = std::variant<RegexPatch, HtmlDomPatch, JsonPatchDocument>;

struct BodyPatch {
    BodyPatchKind kind;
    std::string source;

    bool operator==(const BodyPatch&) const = default;
};

/**
 * @brief Append-only accumulator of proposed mutations
 *
 * Patches are kept in the order their sources ran; nothing in the core
 * reorders them.
 */
struct Recommendations {
    std::vector<HeaderPatch> header_patches;
    std::vector<ModelPatch> model_patches;
    std::vector<BodyPatch> body_patches;

    [[nodiscard]] bool empty() const {
        return header_patches.empty() && model_patches.empty() && body_patches.empty();
    }

    /// Append every patch of `other` after the existing ones
    void append(Recommendations other);

    bool operator==(const Recommendations&) const = default;
};

/**
 * @brief Body patches split by kind, original order kept within each kind
 */
struct PartitionedBodyPatches {
    std::vector<RegexPatch> regex;
    std::vector<HtmlDomPatch> dom;
    std::vector<JsonPatchDocument> json;
};

[[nodiscard]] PartitionedBodyPatches partition_body_patches(const std::vector<BodyPatch>& patches);

} // namespace quill
