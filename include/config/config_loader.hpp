#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace quill {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        QuillConfig config;

        static LoadResult ok(QuillConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to quill.toml
     * @return LoadResult with parsed config or error
     *
     * Honours `include = "other.toml"` (or an array of paths) relative
     * to the including file, and expands ${VAR} in string values.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const QuillConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ContentConfig extract_content(const toml::table& root);
    static ScriptConfig extract_script(const toml::table& root);
    static PluginsConfig extract_plugins(const toml::table& root);
    static BreakerConfig extract_breaker(const toml::table& root);
    static RenderConfig extract_render(const toml::table& root);
    static ThemesConfig extract_themes(const toml::table& root);

    static QuillConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(QuillConfig config);
};

} // namespace quill
