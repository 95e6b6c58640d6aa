#pragma once

#include "core/json.hpp"

#include <toml++/toml.hpp>

namespace quill {

/**
 * @brief Convert a toml++ node to the JSON document model
 *
 * Dates and times become their TOML string form.
 */
[[nodiscard]] Json toml_to_json(const toml::node& node);

} // namespace quill
