#include <benchmark/benchmark.h>

#include "content/context_builder.hpp"
#include "core/header_map.hpp"
#include "core/pipeline.hpp"
#include "middleware/plugin_breaker.hpp"
#include "render/css_selector.hpp"
#include "render/html_rewriter.hpp"
#include "render/render_pipeline.hpp"
#include "render/template_engine.hpp"
#include "runtime/ctx_bridge.hpp"
#include "runtime/plugin_actor.hpp"
#include "script/quickjs_engine.hpp"
#include "server/theme_dispatcher.hpp"
#include "mocks/mock_theme_host.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace quill;

// ============================================================================
// Helpers
// ============================================================================

namespace {

/// An article page of roughly `paragraphs` * 120 bytes
std::string make_page(int paragraphs) {
    std::string html = "<!DOCTYPE html><html><head><title>Bench</title></head><body><main class=\"post\">";
    for (int i = 0; i < paragraphs; ++i) {
        html += "<p class=\"para\" id=\"p" + std::to_string(i) +
                "\">The quick brown fox jumps over the lazy dog. <a href=\"/next\">next</a></p>";
    }
    html += "</main></body></html>";
    return html;
}

Json make_model(int items) {
    Json list = Json::array();
    for (int i = 0; i < items; ++i) {
        list.push_back({{"title", "Post " + std::to_string(i)}, {"url", "/posts/" + std::to_string(i)}});
    }
    return {{"site", "Bench"}, {"posts", std::move(list)}};
}

std::vector<BodyPatch> regex_patches() {
    return {
        BodyPatch{RegexPatch{"fox", "cat"}, "bench"},
        BodyPatch{RegexPatch{"lazy (\\w+)", "sleepy $1"}, "bench"},
    };
}

std::vector<BodyPatch> dom_patches() {
    return {
        BodyPatch{HtmlDomPatch{"main p", {DomOp::add_class("seen")}}, "bench"},
        BodyPatch{HtmlDomPatch{"a[href]", {DomOp::set_attribute("rel", "nofollow")}}, "bench"},
    };
}

RequestParts make_parts(std::string path) {
    RequestParts parts;
    parts.path = std::move(path);
    parts.method = "GET";
    parts.version = "HTTP/1.1";
    parts.headers = {
        {"host", "example.com"},
        {"user-agent", "bench/1.0"},
        {"accept", "text/html"},
        {"accept", "application/xhtml+xml"},
        {"x-forwarded-for", "10.0.0.1"},
    };
    parts.query = {{"page", "2"}};
    return parts;
}

struct BenchPipeline {
    std::shared_ptr<testing::MockThemeHost> themes = std::make_shared<testing::MockThemeHost>();
    std::shared_ptr<Pipeline> pipeline;

    BenchPipeline() {
        themes->add("blog", [](RequestContext ctx) {
            ctx.response.body = HtmlTemplateBody{"list", make_model(20)};
            ctx.recommendations.body_patches.push_back(
                BodyPatch{HtmlDomPatch{"li", {DomOp::add_class("item")}}, "blog"});
            return Result<RequestContext>::ok(std::move(ctx));
        });
        TemplateSet templates;
        templates.add("list", "<ul>{{#each posts}}<li><a href=\"{{url}}\">{{title}}</a></li>{{/each}}</ul>");
        pipeline = PipelineBuilder()
            .with_themes(themes)
            .with_dispatcher(std::make_shared<ThemeDispatcher>(std::vector<ThemeMount>{{"/", "blog"}}))
            .with_context_builder(make_context_builder(RouterConfig{}))
            .with_templates("blog", std::move(templates))
            .build();
    }
};

} // anonymous namespace

// ============================================================================
// Category A: Render pipeline
// ============================================================================

// A1: HTML string with no patches (copy-through cost)
static void BM_Render_Html_NoPatches(benchmark::State& state) {
    RenderPipeline render;
    TemplateSet templates;
    const ResponseBody body = HtmlStringBody{make_page(static_cast<int>(state.range(0)))};
    for (auto _ : state) {
        auto out = render.render(body, {}, templates);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() *
        static_cast<int64_t>(std::get<HtmlStringBody>(body).html.size()));
}
BENCHMARK(BM_Render_Html_NoPatches)->Arg(10)->Arg(100)->Arg(1000);

// A2: streamed regex patches
static void BM_Render_Html_Regex(benchmark::State& state) {
    RenderPipeline render;
    TemplateSet templates;
    const ResponseBody body = HtmlStringBody{make_page(static_cast<int>(state.range(0)))};
    const auto patches = regex_patches();
    for (auto _ : state) {
        auto out = render.render(body, patches, templates);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() *
        static_cast<int64_t>(std::get<HtmlStringBody>(body).html.size()));
}
BENCHMARK(BM_Render_Html_Regex)->Arg(10)->Arg(100)->Arg(1000);

// A3: DOM rewrite pass
static void BM_Render_Html_Dom(benchmark::State& state) {
    RenderPipeline render;
    TemplateSet templates;
    const ResponseBody body = HtmlStringBody{make_page(static_cast<int>(state.range(0)))};
    const auto patches = dom_patches();
    for (auto _ : state) {
        auto out = render.render(body, patches, templates);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() *
        static_cast<int64_t>(std::get<HtmlStringBody>(body).html.size()));
}
BENCHMARK(BM_Render_Html_Dom)->Arg(10)->Arg(100)->Arg(1000);

// A4: template expansion
static void BM_Render_Template(benchmark::State& state) {
    TemplateSet templates;
    templates.add("list", "<ul>{{#each posts}}<li><a href=\"{{url}}\">{{title}}</a></li>{{/each}}</ul>");
    const Json model = make_model(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto out = templates.render("list", model);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Render_Template)->Arg(10)->Arg(100);

// A5: JSON body with regex + JSON Patch
static void BM_Render_Json_Patch(benchmark::State& state) {
    RenderPipeline render;
    TemplateSet templates;
    const ResponseBody body = JsonBody{make_model(50)};
    const std::vector<BodyPatch> patches = {
        BodyPatch{RegexPatch{"Post ", "Entry "}, "bench"},
        BodyPatch{JsonPatchDocument{Json::parse(R"([{"op":"replace","path":"/site","value":"B"}])")}, "bench"},
    };
    for (auto _ : state) {
        auto out = render.render(body, patches, templates);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Render_Json_Patch);

// ============================================================================
// Category B: Request plumbing
// ============================================================================

// B1: header name canonicalization
static void BM_Header_Canonicalize(benchmark::State& state) {
    const std::vector<std::string> names = {
        "content-type", "X-FORWARDED-FOR", "accept-encoding", "x-request-id", "cache-control"
    };
    for (auto _ : state) {
        for (const auto& name : names) {
            auto canonical = canonicalize_header_name(name);
            benchmark::DoNotOptimize(canonical);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(names.size()));
}
BENCHMARK(BM_Header_Canonicalize);

// B2: context construction (headers, query, UUID)
static void BM_Context_Build(benchmark::State& state) {
    const auto parts = make_parts("/blog/post");
    const ResolvedContent resolved{ContentKind::HTML, Json{{"title", "Post"}}, "blog/post.html"};
    const RouterConfig router;
    for (auto _ : state) {
        auto ctx = build_context(parts, resolved, router);
        benchmark::DoNotOptimize(ctx);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Context_Build);

// B3: selector parsing
static void BM_Selector_Parse(benchmark::State& state) {
    for (auto _ : state) {
        auto parsed = SelectorList::parse("main > article p.lead, a[href^=\"http\"], #nav > li.active");
        benchmark::DoNotOptimize(parsed);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Selector_Parse);

// B4: longest-prefix mount selection
static void BM_Dispatcher_Select(benchmark::State& state) {
    const ThemeDispatcher dispatcher({
        {"/", "base"}, {"/blog", "blog"}, {"/blog/archive", "archive"}, {"/docs", "docs"}, {"/api/", "api"}
    });
    for (auto _ : state) {
        auto theme = dispatcher.select("/blog/archive/2024/05/post");
        benchmark::DoNotOptimize(theme);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Dispatcher_Select);

// B5: breaker lookups under contention
static void BM_Breaker_IsOpen_Throughput(benchmark::State& state) {
    static PluginBreakerRegistry breakers{PluginBreakerRegistry::Config{}};
    const std::string id = "plugin_" + std::to_string(state.thread_index() % 4);
    for (auto _ : state) {
        bool open = breakers.is_open(id, PluginBreakerRegistry::Clock::now());
        benchmark::DoNotOptimize(open);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Breaker_IsOpen_Throughput)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

// ============================================================================
// Category C: Script engine
// ============================================================================

// C1: raw QuickJS call round trip
static void BM_QuickJS_Call(benchmark::State& state) {
    auto engine = make_quickjs_factory()();
    (void)engine->load_module("bench", "globalThis.bench = { echo(x) { x.seen = true; return x; } };");
    const Json arg = make_model(10);
    for (auto _ : state) {
        auto out = engine->call("bench.echo", {arg});
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QuickJS_Call);

// C2: plugin before-hook through the actor thread
static void BM_PluginActor_Before(benchmark::State& state) {
    auto started = PluginActor::start(make_quickjs_factory(), {
        {"bench", "", R"(globalThis.bench = { before(ctx) {
            ctx.recommendations.headerPatches.push({ kind: 'set', name: 'X-Bench', value: '1' });
            return ctx;
        } };)"},
    });
    if (started.is_error()) {
        state.SkipWithError(started.error_message().c_str());
        return;
    }
    auto& actor = *started.value();
    const auto ctx = build_context(make_parts("/"), ResolvedContent{}, RouterConfig{});
    for (auto _ : state) {
        auto out = actor.before("bench", ctx).get();
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
    actor.stop();
}
BENCHMARK(BM_PluginActor_Before);

// ============================================================================
// Category D: Pipeline end to end (in-process theme)
// ============================================================================

// D1: single-threaded
static void BM_Pipeline_SingleThread(benchmark::State& state) {
    BenchPipeline bp;
    const auto parts = make_parts("/posts");
    for (auto _ : state) {
        auto resp = bp.pipeline->execute(parts);
        benchmark::DoNotOptimize(resp);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Pipeline_SingleThread);

// D2: multi-threaded throughput
static void BM_Pipeline_MultiThread(benchmark::State& state) {
    static std::unique_ptr<BenchPipeline> bp;
    static std::once_flag init;
    std::call_once(init, [] { bp = std::make_unique<BenchPipeline>(); });
    const auto parts = make_parts("/posts/" + std::to_string(state.thread_index()));
    for (auto _ : state) {
        auto resp = bp->pipeline->execute(parts);
        benchmark::DoNotOptimize(resp);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Pipeline_MultiThread)->Threads(1)->Threads(2)->Threads(4)->Threads(8);
