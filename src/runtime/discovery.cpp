#include "runtime/discovery.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <set>

using namespace std::string_literals;

namespace quill {

namespace fs = std::filesystem;

namespace {

/// Subdirectories of root holding `manifest`, sorted by path
std::vector<fs::path> manifest_dirs(const std::string& root, std::string_view manifest) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) return dirs;

    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (entry.is_directory(ec) && fs::is_regular_file(entry.path() / manifest, ec)) {
            dirs.push_back(entry.path());
        }
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

template<typename T>
void sort_by_id(std::vector<T>& items, auto id_of) {
    std::sort(items.begin(), items.end(),
              [&](const T& a, const T& b) { return id_of(a) < id_of(b); });
}

std::map<std::string, std::string> load_templates(const fs::path& dir) {
    std::map<std::string, std::string> templates;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return templates;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        const auto ext = utils::to_lower(entry.path().extension().string());
        if (ext != ".hbs" && ext != ".html") continue;
        if (auto source = utils::read_file(entry.path().string())) {
            templates[entry.path().stem().string()] = std::move(*source);
        } else {
            utils::log::warn(std::format("Skipping unreadable template {}", entry.path().string()));
        }
    }
    return templates;
}

} // anonymous namespace

// ============================================================================
// Discovery
// ============================================================================

Result<std::vector<PluginSpec>> discover_plugins(const std::string& dir) {
    using R = Result<std::vector<PluginSpec>>;
    std::vector<PluginSpec> specs;

    for (const auto& plugin_dir : manifest_dirs(dir, "plugin.toml")) {
        const auto manifest_path = (plugin_dir / "plugin.toml").string();
        try {
            const auto manifest = toml::parse_file(manifest_path);
            PluginSpec spec;
            spec.id = manifest["id"].value_or(plugin_dir.filename().string());
            spec.name = manifest["name"].value_or(spec.id);
            const auto main = manifest["main"].value_or("plugin.js"s);

            auto source = utils::read_file((plugin_dir / main).string());
            if (!source) {
                return R::error(ErrorCategory::PLUGIN_BOOTSTRAP,
                    std::format("plugin '{}': cannot read {}", spec.id, (plugin_dir / main).string()));
            }
            spec.source = std::move(*source);
            specs.push_back(std::move(spec));
        } catch (const toml::parse_error& e) {
            return R::error(ErrorCategory::PLUGIN_BOOTSTRAP,
                std::format("invalid manifest {}: {}", manifest_path, e.description()));
        }
    }

    sort_by_id(specs, [](const PluginSpec& s) -> const std::string& { return s.id; });
    utils::log::info(std::format("Discovered {} plugin(s) in '{}'", specs.size(), dir));
    return R::ok(std::move(specs));
}

Result<std::vector<ThemePackage>> discover_themes(const std::string& dir) {
    using R = Result<std::vector<ThemePackage>>;
    std::vector<ThemePackage> packages;

    for (const auto& theme_dir : manifest_dirs(dir, "theme.toml")) {
        const auto manifest_path = (theme_dir / "theme.toml").string();
        try {
            const auto manifest = toml::parse_file(manifest_path);
            ThemePackage pkg;
            pkg.spec.id = manifest["id"].value_or(theme_dir.filename().string());
            pkg.spec.name = manifest["name"].value_or(pkg.spec.id);
            const auto main = manifest["main"].value_or("theme.js"s);

            auto source = utils::read_file((theme_dir / main).string());
            if (!source) {
                return R::error(ErrorCategory::THEME_BOOTSTRAP,
                    std::format("theme '{}': cannot read {}", pkg.spec.id, (theme_dir / main).string()));
            }
            pkg.spec.source = std::move(*source);

            pkg.templates = load_templates(theme_dir / manifest["templates_dir"].value_or("templates"s));
            if (const auto assets = manifest["assets_dir"].value<std::string>()) {
                pkg.assets_dir = (theme_dir / *assets).string();
            }
            packages.push_back(std::move(pkg));
        } catch (const toml::parse_error& e) {
            return R::error(ErrorCategory::THEME_BOOTSTRAP,
                std::format("invalid manifest {}: {}", manifest_path, e.description()));
        }
    }

    sort_by_id(packages, [](const ThemePackage& p) -> const std::string& { return p.spec.id; });
    utils::log::info(std::format("Discovered {} theme(s) in '{}'", packages.size(), dir));
    return R::ok(std::move(packages));
}

// ============================================================================
// Bootstrap selection
// ============================================================================

Result<std::vector<PluginSpec>> order_plugins(std::vector<PluginSpec> discovered,
                                              const std::vector<std::string>& order) {
    using R = Result<std::vector<PluginSpec>>;

    std::set<std::string> seen;
    for (const auto& spec : discovered) {
        if (!seen.insert(spec.id).second) {
            return R::error(ErrorCategory::PLUGIN_BOOTSTRAP,
                std::format("plugin id '{}' declared by more than one manifest", spec.id));
        }
    }
    if (order.empty()) return R::ok(std::move(discovered));

    std::vector<PluginSpec> ordered;
    std::set<std::string> used;
    for (const auto& id : order) {
        if (!used.insert(id).second) {
            return R::error(ErrorCategory::PLUGIN_BOOTSTRAP,
                std::format("plugin '{}' listed twice in plugins.order", id));
        }
        const auto it = std::find_if(discovered.begin(), discovered.end(),
                                     [&](const PluginSpec& s) { return s.id == id; });
        if (it == discovered.end()) {
            return R::error(ErrorCategory::PLUGIN_BOOTSTRAP,
                std::format("plugin '{}' in plugins.order was not discovered", id));
        }
        ordered.push_back(*it);
    }
    return R::ok(std::move(ordered));
}

Result<std::vector<ThemePackage>> select_mounted_themes(std::vector<ThemePackage> discovered,
                                                        const std::vector<ThemeMount>& mounts) {
    using R = Result<std::vector<ThemePackage>>;

    std::vector<ThemePackage> selected;
    for (const auto& mount : mounts) {
        const bool already = std::any_of(selected.begin(), selected.end(),
            [&](const ThemePackage& p) { return p.spec.id == mount.theme; });
        if (already) continue;

        const auto it = std::find_if(discovered.begin(), discovered.end(),
            [&](const ThemePackage& p) { return p.spec.id == mount.theme; });
        if (it == discovered.end()) {
            return R::error(ErrorCategory::THEME_BOOTSTRAP,
                std::format("mount '{}' names unknown theme '{}'", mount.path, mount.theme));
        }
        selected.push_back(std::move(*it));
    }
    return R::ok(std::move(selected));
}

} // namespace quill
