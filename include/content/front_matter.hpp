#pragma once

#include "core/error.hpp"
#include "core/json.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace quill {

enum class FrontMatterFormat { YAML, TOML, JSON };

/**
 * @brief A document split into its metadata header and body
 */
struct FrontMatter {
    std::optional<FrontMatterFormat> format;   // nullopt → no front matter
    Json meta = Json::object();
    std::string body;
};

/**
 * @brief Split and parse front matter
 *
 * Precedence: YAML fenced by `---` lines, else TOML fenced by `+++`
 * lines, else a balanced JSON object at the start of the text. An
 * unterminated fence means no front matter. A leading UTF-8 BOM is
 * skipped.
 *
 * @return CONTEXT_ERROR if a detected block does not parse
 */
[[nodiscard]] Result<FrontMatter> parse_front_matter(std::string_view text);

/// Convert a YAML document to JSON (scalars: bool, int, float, then string)
[[nodiscard]] Result<Json> yaml_to_json(std::string_view yaml);

} // namespace quill
