#include "server/http_server.hpp"
#include "content/context_builder.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

// cpp-httplib is header-only, suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace quill {

namespace {

// Every method that takes part in the request flow
constexpr const char* kCatchAll = ".*";

RequestParts to_request_parts(const httplib::Request& req) {
    RequestParts parts;
    parts.path = req.path;          // already percent-decoded by httplib
    parts.method = req.method;
    parts.version = req.version;
    parts.headers.reserve(req.headers.size());
    for (const auto& [name, value] : req.headers) {
        parts.headers.emplace_back(name, value);
    }
    const auto query = req.target.find('?');
    if (query != std::string::npos) {
        parts.query = parse_query_string(std::string_view(req.target).substr(query + 1));
    }
    return parts;
}

} // anonymous namespace

HttpServer::HttpServer(std::shared_ptr<Pipeline> pipeline, Config config)
    : pipeline_(std::move(pipeline)),
      config_(std::move(config)),
      compressor_(config_.compression) {}

HttpServer::~HttpServer() = default;

// ============================================================================
// start() - creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    {
        std::lock_guard lock(server_mutex_);
        if (stop_requested_) return;
        server_ = std::make_unique<httplib::Server>();
    }
    auto& svr = *server_;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    mount_theme_assets(svr);
    register_routes(svr);

    utils::log::info(std::format("Starting Quill on {}:{} ({} threads)",
        config_.host, config_.port, config_.thread_pool_size));

    if (!svr.listen(config_.host.c_str(), config_.port)) {
        std::lock_guard lock(server_mutex_);
        if (!stop_requested_) {
            throw std::runtime_error(std::format("Failed to listen on {}:{}", config_.host, config_.port));
        }
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    stop_requested_ = true;
    if (server_) server_->stop();
    utils::log::info("Server stopped");
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get(std::string(http::kHealthPath), [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    const auto content = [this](const httplib::Request& req, httplib::Response& res) {
        handle_content(req, res);
    };
    // HEAD is served by the GET handlers
    svr.Get(kCatchAll, content);
    svr.Post(kCatchAll, content);
    svr.Put(kCatchAll, content);
    svr.Patch(kCatchAll, content);
    svr.Delete(kCatchAll, content);
    svr.Options(kCatchAll, content);
}

void HttpServer::mount_theme_assets(httplib::Server& svr) {
    for (const auto& [theme_id, dir] : config_.theme_assets) {
        const std::string mount = std::format("{}{}", http::kThemeAssetPrefix, theme_id);
        if (svr.set_mount_point(mount, dir)) {
            utils::log::info(std::format("Serving theme '{}' assets from {} at {}/", theme_id, dir, mount));
        } else {
            utils::log::warn(std::format("Theme '{}' assets directory {} does not exist", theme_id, dir));
        }
    }
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(R"({"status":"ok"})", http::kJsonContentType);
}

void HttpServer::handle_content(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    try {
        write_response(req, pipeline_->execute(to_request_parts(req)), res);
    } catch (const std::exception& e) {
        utils::log::error(std::format("{} {} failed: {}", req.method, req.path, e.what()));
        write_response(req, internal_error_response(), res);
    }
}

void HttpServer::write_response(const httplib::Request& req, HttpResponse response,
                                 httplib::Response& res) {
    res.status = response.status;

    if (compressor_.encode(response, req.get_header_value(http::kAcceptEncodingHeader))) {
        compressed_.fetch_add(1, std::memory_order_relaxed);
    }

    for (const auto& [name, value] : response.headers.entries()) {
        res.set_header(name, value);
    }
    res.body = std::move(response.body);
}

} // namespace quill
