#pragma once

#include "core/error.hpp"
#include "core/recommendation.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace quill {

/**
 * @brief Apply structural patches to an HTML document in one pass
 *
 * The document is tokenized once; every start tag is tested against
 * each patch's selector (in patch order) and the matching patches' ops
 * are applied to that element in order. Unmodified markup is copied
 * through byte for byte; a modified start tag is re-serialized with
 * double-quoted attributes.
 *
 * @return HTML_REWRITE_ERROR if any selector is invalid
 */
[[nodiscard]] Result<std::string> rewrite_html(std::string_view html,
                                               const std::vector<HtmlDomPatch>& patches);

/// Escape text content (&, <, >, ")
[[nodiscard]] std::string escape_html_text(std::string_view text);

/// Decode the entities attribute values commonly carry (named basics and numeric)
[[nodiscard]] std::string decode_html_entities(std::string_view text);

} // namespace quill
