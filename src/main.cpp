#include "config/config_loader.hpp"
#include "content/content_resolver.hpp"
#include "content/context_builder.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "middleware/plugin_breaker.hpp"
#include "middleware/plugin_middleware.hpp"
#include "runtime/discovery.hpp"
#include "runtime/plugin_actor.hpp"
#include "runtime/theme_actor.hpp"
#include "script/quickjs_engine.hpp"
#include "server/http_server.hpp"
#include "server/theme_dispatcher.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>

using namespace quill;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

namespace {

/// Context used for the one-off init hooks at startup
RequestContext startup_context(const QuillConfig& cfg) {
    RequestParts parts;
    parts.path = "/";
    parts.method = "GET";
    parts.version = "HTTP/1.1";
    RouterConfig router{cfg.themes.config, cfg.plugins.config};
    return build_context(parts, ResolvedContent{}, router);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Quill starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/quill.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/7] Loading configuration from {}", config_file));
        QuillConfig cfg;
        if (std::filesystem::exists(config_file)) {
            auto loaded = ConfigLoader::load_from_file(config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            cfg = std::move(loaded.config);
        } else {
            utils::log::warn(std::format("{} not found - using defaults", config_file));
        }

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        // Discovery
        utils::log::info(std::format("[2/7] Discovering plugins in {} and themes in {}",
                                     cfg.plugins.dir, cfg.themes.dir));
        auto plugins_found = discover_plugins(cfg.plugins.dir);
        if (plugins_found.is_error()) {
            utils::log::error(plugins_found.error_message());
            return 1;
        }
        auto plugin_specs = order_plugins(std::move(plugins_found.value()), cfg.plugins.order);
        if (plugin_specs.is_error()) {
            utils::log::error(plugin_specs.error_message());
            return 1;
        }

        auto themes_found = discover_themes(cfg.themes.dir);
        if (themes_found.is_error()) {
            utils::log::error(themes_found.error_message());
            return 1;
        }
        auto theme_packages = select_mounted_themes(std::move(themes_found.value()), cfg.themes.mounts);
        if (theme_packages.is_error()) {
            utils::log::error(theme_packages.error_message());
            return 1;
        }
        if (cfg.themes.mounts.empty()) {
            utils::log::warn("No theme mounts configured - every content request will fail");
        }

        QuickJsEngine::Options engine_options;
        engine_options.memory_limit_bytes = cfg.script.memory_limit_mb * 1024 * 1024;
        engine_options.max_stack_bytes = cfg.script.stack_size_kb * 1024;
        const auto factory = make_quickjs_factory(engine_options);

        // Plugin actor
        utils::log::info(std::format("[3/7] Plugin actor: {} plugin(s)", plugin_specs.value().size()));
        auto plugin_actor = PluginActor::start(factory, plugin_specs.value());
        if (plugin_actor.is_error()) {
            utils::log::error(plugin_actor.error_message());
            return 1;
        }
        std::unique_ptr<PluginActor> plugins = std::move(plugin_actor.value());

        // Theme actors
        std::vector<ThemeSpec> theme_specs;
        for (const auto& pkg : theme_packages.value()) theme_specs.push_back(pkg.spec);
        utils::log::info(std::format("[4/7] Theme actors: {} theme(s)", theme_specs.size()));
        auto theme_actor = ThemeActor::start(factory, theme_specs);
        if (theme_actor.is_error()) {
            utils::log::error(theme_actor.error_message());
            plugins->stop();
            return 1;
        }
        std::shared_ptr<ThemeActor> themes = std::move(theme_actor.value());

        // Init hooks
        utils::log::info("[5/7] Running init hooks");
        const auto init_ctx = startup_context(cfg);
        auto plugin_init = plugins->init_all(init_ctx);
        themes->init_all(init_ctx);
        const auto plugin_init_result = plugin_init.get();
        if (plugin_init_result.is_error()) {
            utils::log::warn(std::format("Plugin init failed: {}", plugin_init_result.error_message()));
        }

        // Pipeline
        utils::log::info(std::format("[6/7] Request pipeline: timeout {}ms, breaker {}x/{}s open {}s",
            cfg.plugins.timeout_ms, cfg.breaker.max_failures, cfg.breaker.window_sec, cfg.breaker.open_sec));
        PluginBreakerRegistry breakers(PluginBreakerRegistry::Config{
            std::chrono::seconds{cfg.breaker.window_sec},
            static_cast<uint32_t>(cfg.breaker.max_failures),
            std::chrono::seconds{cfg.breaker.open_sec},
        });
        auto middleware = std::make_shared<PluginMiddleware>(*plugins, breakers,
            PluginMiddleware::Config{std::chrono::milliseconds{cfg.plugins.timeout_ms}});

        PipelineBuilder builder;
        builder.with_themes(themes)
               .with_dispatcher(std::make_shared<ThemeDispatcher>(cfg.themes.mounts))
               .with_context_builder(make_context_builder(RouterConfig{cfg.themes.config, cfg.plugins.config}))
               .with_plugins(middleware)
               .with_render_config(RenderPipeline::Config{
                   static_cast<size_t>(cfg.render.regex_tail_window)});
        if (!cfg.content.root.empty()) {
            builder.with_resolver(make_file_resolver(cfg.content.root));
        }

        HttpServer::Config server_config;
        server_config.host = cfg.server.host;
        server_config.port = static_cast<int>(cfg.server.port);
        server_config.thread_pool_size = cfg.server.thread_pool_size;
        server_config.compression = ResponseCompressor::Config{
            cfg.server.compression_enabled, cfg.server.compression_min_size_bytes,
            static_cast<int>(cfg.server.compression_level)};

        for (auto& pkg : theme_packages.value()) {
            TemplateSet templates;
            for (auto& [name, source] : pkg.templates) templates.add(name, std::move(source));
            utils::log::info(std::format("Theme '{}': {} template(s)", pkg.spec.id, templates.size()));
            builder.with_templates(pkg.spec.id, std::move(templates));
            if (!pkg.assets_dir.empty()) server_config.theme_assets[pkg.spec.id] = pkg.assets_dir;
        }

        // HTTP server
        utils::log::info("[7/7] HTTP server initializing...");
        g_server = std::make_shared<HttpServer>(builder.build(), std::move(server_config));
        g_server->start();   // blocks until a signal stops it

        g_server.reset();
        middleware.reset();
        plugins->stop();
        themes->stop();
        utils::log::info("Quill stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
