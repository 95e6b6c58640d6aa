#pragma once

#include "core/json.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace quill {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int64_t port = 8080;
    size_t thread_pool_size = 4;
    bool compression_enabled = false;
    size_t compression_min_size_bytes = 1024;
    int64_t compression_level = 6;          // zlib level 1..9
};

struct LoggingConfig {
    std::string level = "info";
};

struct ContentConfig {
    std::string root = "content";   // empty → fallback resolver
};

struct ScriptConfig {
    size_t memory_limit_mb = 64;    // 0 = unlimited
    size_t stack_size_kb = 1024;    // 0 = engine default
};

struct PluginsConfig {
    std::string dir = "plugins";
    std::vector<std::string> order;
    int64_t timeout_ms = 100;
    std::map<std::string, Json> config;   // plugin id → its config object
};

// ============================================================================
// Circuit Breaker Config
// ============================================================================

struct BreakerConfig {
    int64_t window_sec = 30;
    int64_t max_failures = 5;
    int64_t open_sec = 30;
};

struct RenderConfig {
    int64_t regex_tail_window = 4096;
};

struct ThemeMount {
    std::string path;
    std::string theme;
};

struct ThemesConfig {
    std::string dir = "themes";
    std::vector<ThemeMount> mounts;       // registration order
    Json config = Json::object();
};

// ============================================================================
// QuillConfig - Complete parsed configuration
// ============================================================================

struct QuillConfig {
    ServerConfig server;
    LoggingConfig logging;
    ContentConfig content;
    ScriptConfig script;
    PluginsConfig plugins;
    BreakerConfig breaker;
    RenderConfig render;
    ThemesConfig themes;
};

} // namespace quill
