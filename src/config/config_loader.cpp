#include "config/config_loader.hpp"
#include "config/toml_json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace quill {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = s["port"].value_or(int64_t{8080});
    cfg.thread_pool_size = static_cast<size_t>(std::max<int64_t>(0, s["threads"].value_or(int64_t{4})));
    cfg.compression_enabled = s["compression_enabled"].value_or(false);
    cfg.compression_min_size_bytes = static_cast<size_t>(s["compression_min_size_bytes"].value_or(1024));
    cfg.compression_level = s["compression_level"].value_or(int64_t{6});
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ContentConfig ConfigLoader::extract_content(const toml::table& root) {
    ContentConfig cfg;
    if (const auto* content = root["content"].as_table()) {
        cfg.root = (*content)["root"].value_or(cfg.root);
    }
    return cfg;
}

ScriptConfig ConfigLoader::extract_script(const toml::table& root) {
    ScriptConfig cfg;
    const auto* script = root["script"].as_table();
    if (!script) return cfg;
    const auto& s = *script;

    cfg.memory_limit_mb = static_cast<size_t>(std::max<int64_t>(0, s["memory_limit_mb"].value_or(int64_t{64})));
    cfg.stack_size_kb = static_cast<size_t>(std::max<int64_t>(0, s["stack_size_kb"].value_or(int64_t{1024})));
    return cfg;
}

PluginsConfig ConfigLoader::extract_plugins(const toml::table& root) {
    PluginsConfig cfg;
    const auto* plugins = root["plugins"].as_table();
    if (!plugins) return cfg;
    const auto& p = *plugins;

    cfg.dir = p["dir"].value_or(cfg.dir);
    cfg.order = toml_string_array(p, "order");
    cfg.timeout_ms = p["timeout_ms"].value_or(int64_t{100});

    if (const auto* per_plugin = p["config"].as_table()) {
        for (const auto& [id, val] : *per_plugin) {
            cfg.config[std::string(id.str())] = toml_to_json(val);
        }
    }
    return cfg;
}

BreakerConfig ConfigLoader::extract_breaker(const toml::table& root) {
    BreakerConfig cfg;
    const auto* breaker = root["breaker"].as_table();
    if (!breaker) return cfg;
    const auto& b = *breaker;

    cfg.window_sec = b["window_sec"].value_or(int64_t{30});
    cfg.max_failures = b["max_failures"].value_or(int64_t{5});
    cfg.open_sec = b["open_sec"].value_or(int64_t{30});
    return cfg;
}

RenderConfig ConfigLoader::extract_render(const toml::table& root) {
    RenderConfig cfg;
    if (const auto* render = root["render"].as_table()) {
        cfg.regex_tail_window = (*render)["regex_tail_window"].value_or(int64_t{4096});
    }
    return cfg;
}

ThemesConfig ConfigLoader::extract_themes(const toml::table& root) {
    ThemesConfig cfg;
    const auto* themes = root["themes"].as_table();
    if (!themes) return cfg;
    const auto& t = *themes;

    cfg.dir = t["dir"].value_or(cfg.dir);
    if (const auto* mounts = t["mounts"].as_array()) {
        for (const auto& elem : *mounts) {
            const auto* m = elem.as_table();
            if (!m) continue;
            ThemeMount mount;
            mount.path = (*m)["path"].value_or(""s);
            mount.theme = (*m)["theme"].value_or(""s);
            cfg.mounts.push_back(std::move(mount));
        }
    }
    if (const auto* theme_config = t["config"].as_table()) {
        cfg.config = toml_to_json(*theme_config);
    }
    return cfg;
}

QuillConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    QuillConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.content = extract_content(tbl);
    config.script = extract_script(tbl);
    config.plugins = extract_plugins(tbl);
    config.breaker = extract_breaker(tbl);
    config.render = extract_render(tbl);
    config.themes = extract_themes(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(QuillConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const QuillConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size < 1) {
        errors.push_back("server.threads must be >= 1");
    }
    if (config.server.compression_level < 1 || config.server.compression_level > 9) {
        errors.push_back(std::format("server.compression_level must be 1-9, got {}",
                                     config.server.compression_level));
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
                                     config.logging.level));
    }
    if (config.plugins.timeout_ms < 1) {
        errors.push_back(std::format("plugins.timeout_ms must be >= 1, got {}", config.plugins.timeout_ms));
    }
    if (config.breaker.max_failures < 1) {
        errors.push_back(std::format("breaker.max_failures must be >= 1, got {}", config.breaker.max_failures));
    }
    if (config.breaker.window_sec < 0 || config.breaker.open_sec < 0) {
        errors.push_back("breaker.window_sec and breaker.open_sec must not be negative");
    }
    if (config.render.regex_tail_window < 1) {
        errors.push_back(std::format("render.regex_tail_window must be >= 1, got {}",
                                     config.render.regex_tail_window));
    }

    for (size_t i = 0; i < config.themes.mounts.size(); ++i) {
        const auto& mount = config.themes.mounts[i];
        if (mount.path.empty() || mount.path.front() != '/') {
            errors.push_back(std::format("themes.mounts[{}].path must start with '/', got '{}'", i, mount.path));
        }
        if (mount.theme.empty()) {
            errors.push_back(std::format("themes.mounts[{}].theme must not be empty", i));
        }
    }

    for (const auto& [id, cfg] : config.plugins.config) {
        if (!cfg.is_object()) {
            errors.push_back(std::format("plugins.config.{} must be a table", id));
        }
    }

    return errors;
}

} // namespace quill
