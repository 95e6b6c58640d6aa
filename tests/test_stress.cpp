#include <catch2/catch_test_macros.hpp>

#include "core/pipeline.hpp"
#include "middleware/plugin_breaker.hpp"
#include "middleware/plugin_middleware.hpp"
#include "runtime/engine_thread.hpp"
#include "runtime/plugin_actor.hpp"
#include "runtime/theme_actor.hpp"
#include "script/quickjs_engine.hpp"
#include "server/theme_dispatcher.hpp"
#include "mocks/mock_plugin_host.hpp"
#include "mocks/mock_theme_host.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace quill;
using namespace std::chrono_literals;

// ============================================================================
// Helpers
// ============================================================================

namespace {

RequestParts make_parts(const std::string& path) {
    RequestParts parts;
    parts.path = path;
    parts.method = "GET";
    parts.version = "HTTP/1.1";
    parts.headers = {{"host", "example.com"}};
    return parts;
}

/// Echoes the request path into an HTML body, tagged by a plugin header
struct TestPipeline {
    std::shared_ptr<testing::MockThemeHost> themes = std::make_shared<testing::MockThemeHost>();
    testing::MockPluginHost plugins;
    PluginBreakerRegistry breakers{PluginBreakerRegistry::Config{}};
    std::shared_ptr<PluginMiddleware> middleware;
    std::shared_ptr<Pipeline> pipeline;

    TestPipeline() {
        plugins.add("tagger", {[](RequestContext ctx) {
            ctx.recommendations.header_patches.push_back(
                {HeaderPatchKind::SET, "X-Request-Path", ctx.path, "tagger"});
            return Result<RequestContext>::ok(std::move(ctx));
        }, nullptr, 0ms});
        themes->add("echo", [](RequestContext ctx) {
            ctx.response.body = HtmlStringBody{"<p>" + ctx.path + "</p>"};
            ctx.recommendations.body_patches.push_back(
                BodyPatch{HtmlDomPatch{"p", {DomOp::add_class("echo")}}, "echo"});
            return Result<RequestContext>::ok(std::move(ctx));
        });
        middleware = std::make_shared<PluginMiddleware>(plugins, breakers, PluginMiddleware::Config{1000ms});
        pipeline = PipelineBuilder()
            .with_themes(themes)
            .with_dispatcher(std::make_shared<ThemeDispatcher>(std::vector<ThemeMount>{{"/", "echo"}}))
            .with_context_builder(make_context_builder(RouterConfig{}))
            .with_plugins(middleware)
            .build();
    }
};

} // anonymous namespace

// ============================================================================
// Category 1: Pipeline
// ============================================================================

TEST_CASE("Stress: Pipeline 8 threads keep responses isolated", "[stress][pipeline]") {
    TestPipeline tp;

    constexpr int num_threads = 8;
    constexpr int iterations = 200;
    std::atomic<int> matches{0};
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i] {
            for (int j = 0; j < iterations; ++j) {
                const std::string path = "/t" + std::to_string(i) + "/r" + std::to_string(j);
                const auto resp = tp.pipeline->execute(make_parts(path));
                const bool ok = resp.status == 200 &&
                    resp.body == "<p class=\"echo\">" + path + "</p>" &&
                    resp.headers.get("X-Request-Path") == path;
                (ok ? matches : mismatches).fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(mismatches.load() == 0);
    REQUIRE(matches.load() == num_threads * iterations);
    const auto stats = tp.pipeline->get_stats();
    REQUIRE(stats.total_requests == static_cast<uint64_t>(num_threads * iterations));
    REQUIRE(stats.failed_requests == 0);
}

// ============================================================================
// Category 2: Breaker
// ============================================================================

TEST_CASE("Stress: Breaker counts every concurrent failure", "[stress][breaker]") {
    PluginBreakerRegistry::Config cfg;
    cfg.max_failures = 1000000;
    PluginBreakerRegistry breakers(cfg);

    constexpr int num_threads = 8;
    constexpr int iterations = 1000;
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < iterations; ++j) {
                (void)breakers.record_failure("shared", PluginBreakerRegistry::Clock::now());
                (void)breakers.is_open("shared", PluginBreakerRegistry::Clock::now());
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(breakers.state("shared").failures == static_cast<uint32_t>(num_threads * iterations));
}

TEST_CASE("Stress: Breaker trips at the threshold under contention", "[stress][breaker]") {
    PluginBreakerRegistry breakers(PluginBreakerRegistry::Config{});
    std::atomic<int> openings{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            const auto now = PluginBreakerRegistry::Clock::now();
            if (breakers.record_failure("p", now)) openings.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    // The 5th failure opens it; each later one re-opens it
    REQUIRE(openings.load() == 4);
    REQUIRE(breakers.is_open("p", PluginBreakerRegistry::Clock::now()));
}

// ============================================================================
// Category 3: Engine threads and actors
// ============================================================================

TEST_CASE("Stress: EngineThread serializes submissions from many threads", "[stress][engine]") {
    EngineThread engine("stress");
    int counter = 0;   // only touched on the engine thread
    std::atomic<int> in_flight{0};
    std::atomic<int> overlaps{0};

    constexpr int num_threads = 8;
    constexpr int iterations = 250;
    std::vector<std::thread> threads;
    std::vector<std::future<int>> futures[num_threads];
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i] {
            for (int j = 0; j < iterations; ++j) {
                futures[i].push_back(engine.submit([&] {
                    if (in_flight.fetch_add(1) != 0) overlaps.fetch_add(1);
                    const int value = ++counter;
                    in_flight.fetch_sub(1);
                    return value;
                }));
            }
        });
    }
    for (auto& t : threads) t.join();

    std::set<int> seen;
    for (auto& per_thread : futures) {
        int previous = 0;
        for (auto& f : per_thread) {
            const int value = f.get();
            // Each submitter sees its own tasks run in submission order
            REQUIRE(value > previous);
            previous = value;
            seen.insert(value);
        }
    }
    engine.stop();

    REQUIRE(overlaps.load() == 0);
    REQUIRE(seen.size() == static_cast<size_t>(num_threads * iterations));
}

TEST_CASE("Stress: PluginActor under concurrent hook calls", "[stress][actor]") {
    auto started = PluginActor::start(make_quickjs_factory(), {
        {"count", "", R"(globalThis.total = 0;
            globalThis.count = { before(ctx) { total += 1; ctx.content.meta.total = total; return ctx; } };)"},
    });
    REQUIRE(started.is_ok());
    auto& actor = *started.value();

    constexpr int num_threads = 4;
    constexpr int iterations = 50;
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    std::vector<int> totals[num_threads];
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i] {
            for (int j = 0; j < iterations; ++j) {
                RequestContext ctx;
                ctx.request_id = std::to_string(i) + "-" + std::to_string(j);
                auto result = actor.before("count", std::move(ctx)).get();
                if (result.is_error()) {
                    errors.fetch_add(1);
                    continue;
                }
                totals[i].push_back(result.value().content_meta["total"].get<int>());
            }
        });
    }
    for (auto& t : threads) t.join();
    actor.stop();

    REQUIRE(errors.load() == 0);
    std::set<int> all;
    for (const auto& per_thread : totals) all.insert(per_thread.begin(), per_thread.end());
    // Every hook ran exactly once, one at a time
    REQUIRE(all.size() == static_cast<size_t>(num_threads * iterations));
    REQUIRE(*all.rbegin() == num_threads * iterations);
}

TEST_CASE("Stress: ThemeActor renders distinct themes in parallel", "[stress][actor]") {
    std::vector<ThemeSpec> specs;
    for (const char* id : {"alpha", "beta", "gamma"}) {
        specs.push_back({id, id, std::string("registerTheme({ handle(ctx) { ctx.response.body = "
                                             "{ kind: 'htmlString', html: '") + id + ":' + ctx.request.path }; "
                                             "return ctx; } });"});
    }
    auto started = ThemeActor::start(make_quickjs_factory(), specs);
    REQUIRE(started.is_ok());
    auto& actor = *started.value();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (const auto& spec : specs) {
        threads.emplace_back([&, id = spec.id] {
            for (int j = 0; j < 50; ++j) {
                RequestContext ctx;
                ctx.path = "/" + std::to_string(j);
                const std::string expected = id + ":" + ctx.path;
                auto result = actor.render(id, std::move(ctx)).get();
                if (result.is_error() ||
                    result.value().response.body != ResponseBody{HtmlStringBody{expected}}) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) t.join();
    actor.stop();

    REQUIRE(mismatches.load() == 0);
}
