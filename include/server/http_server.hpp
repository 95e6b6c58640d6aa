#pragma once

#include "core/pipeline.hpp"
#include "server/response_compressor.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace quill {

/**
 * @brief HTTP front end driving the request pipeline
 *
 * Routes:
 * - GET /_health            liveness, no plugins involved
 * - GET /_themes/<id>/...   static theme assets
 * - any other path          GET/HEAD/POST/PUT/PATCH/DELETE/OPTIONS → Pipeline
 */
class HttpServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8080;
        size_t thread_pool_size = 4;
        ResponseCompressor::Config compression;
        std::map<std::string, std::string> theme_assets;   // theme id → assets directory
    };

    HttpServer(std::shared_ptr<Pipeline> pipeline, Config config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks until stop(); throws std::runtime_error if the port cannot be bound
    void start();

    /// Safe to call from another thread; no-op before start()
    void stop();

    struct HttpStats {
        uint64_t requests;
        uint64_t compressed;
    };
    [[nodiscard]] HttpStats get_http_stats() const {
        return {
            requests_.load(std::memory_order_relaxed),
            compressed_.load(std::memory_order_relaxed),
        };
    }

private:
    void register_routes(httplib::Server& svr);
    void mount_theme_assets(httplib::Server& svr);

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_content(const httplib::Request& req, httplib::Response& res);

    void write_response(const httplib::Request& req, HttpResponse response, httplib::Response& res);

    std::shared_ptr<Pipeline> pipeline_;
    const Config config_;
    ResponseCompressor compressor_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    bool stop_requested_ = false;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> compressed_{0};
};

} // namespace quill
