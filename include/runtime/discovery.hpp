#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "runtime/plugin_runtime.hpp"
#include "runtime/theme_runtime.hpp"

#include <map>
#include <string>
#include <vector>

namespace quill {

/**
 * @brief A theme found on disk: its script plus the files it ships
 */
struct ThemePackage {
    ThemeSpec spec;
    std::map<std::string, std::string> templates;   // stem → template source
    std::string assets_dir;                         // empty when the theme has none
};

// ============================================================================
// Discovery
// ============================================================================

/**
 * @brief Scan `<dir>/<name>/plugin.toml` manifests
 *
 * Manifest keys: `id` (defaults to the directory name), `name`,
 * `main` (defaults to "plugin.js"). A missing root yields an empty
 * list; subdirectories without a manifest are skipped.
 *
 * @return Specs sorted by id, or PLUGIN_BOOTSTRAP on unreadable files
 */
[[nodiscard]] Result<std::vector<PluginSpec>> discover_plugins(const std::string& dir);

/**
 * @brief Scan `<dir>/<name>/theme.toml` manifests
 *
 * Manifest keys: `id`, `name`, `main` (default "theme.js"),
 * `templates_dir` (default "templates"), `assets_dir` (optional).
 */
[[nodiscard]] Result<std::vector<ThemePackage>> discover_themes(const std::string& dir);

// ============================================================================
// Bootstrap selection
// ============================================================================

/**
 * @brief Registration order for plugins
 *
 * A non-empty `order` selects and orders plugins explicitly (unknown or
 * repeated ids fail); otherwise every discovered plugin is used, by id.
 */
[[nodiscard]] Result<std::vector<PluginSpec>> order_plugins(
    std::vector<PluginSpec> discovered, const std::vector<std::string>& order);

/**
 * @brief Themes referenced by at least one mount, in first-mount order
 *
 * THEME_BOOTSTRAP if a mount names a theme that was not discovered.
 */
[[nodiscard]] Result<std::vector<ThemePackage>> select_mounted_themes(
    std::vector<ThemePackage> discovered, const std::vector<ThemeMount>& mounts);

} // namespace quill
