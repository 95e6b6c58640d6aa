#include <catch2/catch_test_macros.hpp>
#include "runtime/ctx_bridge.hpp"
#include "script/quickjs_engine.hpp"

using namespace quill;

namespace {

RequestContext sample_context() {
    RequestContext ctx;
    ctx.request_id = "id-1";
    ctx.path = "/docs";
    ctx.method = "GET";
    ctx.version = "HTTP/1.1";
    ctx.headers = {{"Accept", "text/html"}, {"X-Api-Key", "k"}};
    ctx.query = {{"q", "x"}};
    ctx.content_kind = ContentKind::HTML;
    ctx.content_meta = {{"title", "Docs"}};
    ctx.theme_config = {{"accent", "blue"}};
    ctx.plugin_configs["seo"] = {{"site", "S"}};
    ctx.response.headers.set("X-A", "1");
    ctx.response.headers.append("X-A", "2");
    return ctx;
}

} // anonymous namespace

TEST_CASE("CtxBridge: plugin snapshot shape", "[bridge]") {
    auto ctx = sample_context();
    ctx.recommendations.header_patches.push_back(HeaderPatch{HeaderPatchKind::SET, "X", "v", "other"});

    const auto snap = bridge::snapshot_for_plugin(ctx, "seo");
    CHECK(snap["request"]["requestId"] == "id-1");
    CHECK(snap["request"]["path"] == "/docs");
    CHECK(snap["request"]["headers"]["X-Api-Key"] == "k");
    CHECK(snap["request"]["queryParams"] == Json{{"q", "x"}});
    CHECK(snap["content"] == Json{{"kind", "html"}, {"meta", {{"title", "Docs"}}}});
    CHECK(snap["config"] == Json{{"site", "S"}});
    CHECK(snap["response"]["status"] == 200);
    CHECK(snap["response"]["headers"]["X-A"] == Json::array({"1", "2"}));
    CHECK(snap["response"]["body"] == Json{{"kind", "unset"}});
    // A hook only sees what it appends
    CHECK(snap["recommendations"]["headerPatches"].empty());

    CHECK(bridge::snapshot_for_plugin(ctx, "unknown")["config"] == Json::object());
    CHECK(bridge::snapshot_for_theme(ctx)["config"] == Json{{"accent", "blue"}});
}

TEST_CASE("CtxBridge: merge appends stamped recommendations", "[bridge]") {
    auto ctx = sample_context();
    const auto returned = Json::parse(R"({
        "recommendations": {
            "headerPatches": [
                {"kind": "set", "name": "X-Powered-By", "value": "quill"},
                {"kind": "remove", "name": "Server"},
                {"kind": "append", "name": "missing-value"},
                {"kind": "bogus", "name": "X"}
            ],
            "modelPatches": [{"patch": [{"op": "add", "path": "/x", "value": 1}]}],
            "bodyPatches": [
                {"kind": "regex", "pattern": "a", "replacement": "b"},
                {"kind": "htmlDom", "selector": "p", "ops": [
                    {"kind": "addClass", "class": "c"},
                    {"kind": "setInnerText", "text": "t"},
                    {"kind": "nonsense"}
                ]},
                {"kind": "jsonPatch", "patch": []}
            ]
        },
        "request": {"path": "/hacked"},
        "config": {"changed": true}
    })");
    bridge::merge_snapshot(returned, ctx, "seo");

    const auto& recs = ctx.recommendations;
    REQUIRE(recs.header_patches.size() == 2);
    CHECK(recs.header_patches[0] == HeaderPatch{HeaderPatchKind::SET, "X-Powered-By", "quill", "seo"});
    CHECK(recs.header_patches[1] == HeaderPatch{HeaderPatchKind::REMOVE, "Server", std::nullopt, "seo"});
    REQUIRE(recs.model_patches.size() == 1);
    CHECK(recs.model_patches[0].source == "seo");
    REQUIRE(recs.body_patches.size() == 3);
    const auto* dom = std::get_if<HtmlDomPatch>(&recs.body_patches[1].kind);
    REQUIRE(dom != nullptr);
    CHECK(dom->ops == std::vector<DomOp>{DomOp::add_class("c"),
                                         DomOp::with_content(DomOpKind::SET_INNER_TEXT, "t")});

    // Read-only parts are ignored
    CHECK(ctx.path == "/docs");
    CHECK(ctx.plugin_configs.at("seo") == Json{{"site", "S"}});
}

TEST_CASE("CtxBridge: response parsing", "[bridge]") {
    ResponseSpec previous;
    previous.body = HtmlStringBody{"<p>old</p>"};

    auto kept = bridge::parse_response(Json{{"status", 404}}, previous);
    REQUIRE(kept.has_value());
    CHECK(kept->status == 404);
    CHECK(kept->body == ResponseBody{HtmlStringBody{"<p>old</p>"}});

    auto odd = bridge::parse_response(Json{{"status", 1000}, {"body", nullptr}}, previous);
    REQUIRE(odd.has_value());
    CHECK(odd->status == 200);
    CHECK(std::holds_alternative<NoneBody>(odd->body));

    auto templated = bridge::parse_response(Json::parse(R"({
        "headers": {"X-List": ["a", "b"], "Bad Name": "x", "X-Bad": "line\nbreak"},
        "body": {"kind": "htmlTemplate", "template": "page", "model": {"n": 1}}
    })"), previous);
    REQUIRE(templated.has_value());
    CHECK(templated->headers.get_all("X-List") == std::vector<std::string>{"a", "b"});
    CHECK(templated->headers.size() == 2);
    CHECK(templated->body == ResponseBody{HtmlTemplateBody{"page", Json{{"n", 1}}}});

    CHECK_FALSE(bridge::parse_response(Json("string"), previous).has_value());
}

TEST_CASE("CtxBridge: response round trip through JSON", "[bridge]") {
    ResponseSpec spec;
    spec.status = 201;
    spec.headers.set("Content-Type", "application/json");
    spec.body = JsonBody{Json{{"ok", true}}};

    auto parsed = bridge::parse_response(bridge::response_to_json(spec), ResponseSpec{});
    REQUIRE(parsed.has_value());
    CHECK(*parsed == spec);
}

TEST_CASE("CtxBridge: non-object return leaves context alone", "[bridge]") {
    auto ctx = sample_context();
    const auto before = ctx;
    bridge::merge_snapshot(Json(42), ctx, "p");
    bridge::merge_snapshot(Json(), ctx, "p");
    CHECK(ctx.recommendations == before.recommendations);
    CHECK(ctx.response == before.response);
}

TEST_CASE("CtxBridge: shim wraps headers and reports missing hooks", "[bridge][script]") {
    QuickJsEngine engine;
    REQUIRE(engine.load_module("shim", bridge::kContextShimSource).is_ok());
    REQUIRE(engine.load_module("p", R"(
        globalThis.p = {
            before(ctx) {
                return {
                    get: ctx.request.headers.get('x-api-key'),
                    has: ctx.request.headers.has('ACCEPT'),
                    none: ctx.request.headers.has('cookie'),
                    serialized: ctx.request.headers,
                };
            },
            buggy() { const o = {}; return o.nothing(); },
        };
    )").is_ok());

    const auto snap = bridge::snapshot_for_plugin(sample_context(), "p");
    auto result = engine.call(bridge::kInvokePath, {Json("p"), Json("before"), snap});
    REQUIRE(result.is_ok());
    CHECK(result.value()["get"] == "k");
    CHECK(result.value()["has"] == true);
    CHECK(result.value()["none"] == false);
    CHECK(result.value()["serialized"] == Json{{"Accept", "text/html"}, {"X-Api-Key", "k"}});

    auto missing = engine.call(bridge::kInvokePath, {Json("p"), Json("after"), snap});
    CHECK(bridge::is_missing_hook(missing, "p", "after"));

    // A TypeError inside a defined hook is a real failure
    auto buggy = engine.call(bridge::kInvokePath, {Json("p"), Json("buggy"), snap});
    REQUIRE(buggy.is_error());
    CHECK_FALSE(bridge::is_missing_hook(buggy, "p", "buggy"));
}
