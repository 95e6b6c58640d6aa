#include <catch2/catch_test_macros.hpp>
#include "render/render_pipeline.hpp"

#include <string>

using namespace quill;

namespace {

BodyPatch regex(std::string pattern, std::string replacement) {
    return BodyPatch{RegexPatch{std::move(pattern), std::move(replacement)}, "test"};
}

BodyPatch dom(std::string selector, std::vector<DomOp> ops) {
    return BodyPatch{HtmlDomPatch{std::move(selector), std::move(ops)}, "test"};
}

BodyPatch json_patch(Json document) {
    return BodyPatch{JsonPatchDocument{std::move(document)}, "test"};
}

} // anonymous namespace

TEST_CASE("RenderPipeline: template model, then regex, then DOM", "[render]") {
    TemplateSet templates;
    templates.add("page", "<p class='a'>{{n}}</p>");
    RenderPipeline pipeline;

    auto result = pipeline.render(HtmlTemplateBody{"page", Json{{"n", 1}}},
                                  {dom("p", {DomOp::add_class("b")})}, templates);
    REQUIRE(result.is_ok());
    CHECK(result.value().bytes == "<p class=\"a b\">1</p>");
    CHECK(result.value().content_type == kHtmlContentType);
}

TEST_CASE("RenderPipeline: DOM rewrite sees the regex output", "[render]") {
    RenderPipeline pipeline;
    auto result = pipeline.render(HtmlStringBody{"<p>cat</p>"},
                                  {dom("p", {DomOp::with_content(DomOpKind::SET_INNER_TEXT, "fish & chips")}),
                                   regex("cat", "dog")},
                                  TemplateSet{});
    REQUIRE(result.is_ok());
    CHECK(result.value().bytes == "<p>fish &amp; chips</p>");

    // Regex that creates the element the selector targets
    auto created = pipeline.render(HtmlStringBody{"<i>x</i>"},
                                   {regex("<i>", "<b>"), regex("</i>", "</b>"),
                                    dom("b", {DomOp::set_attribute("id", "made")})},
                                   TemplateSet{});
    REQUIRE(created.is_ok());
    CHECK(created.value().bytes == "<b id=\"made\">x</b>");
}

TEST_CASE("RenderPipeline: HTML ignores JSON Patch documents", "[render]") {
    RenderPipeline pipeline;
    auto result = pipeline.render(HtmlStringBody{"<p>x</p>"},
                                  {json_patch(Json::parse(R"([{"op":"remove","path":"/nope"}])"))},
                                  TemplateSet{});
    REQUIRE(result.is_ok());
    CHECK(result.value().bytes == "<p>x</p>");
}

TEST_CASE("RenderPipeline: small chunks stream the same result", "[render]") {
    RenderPipeline pipeline(RenderPipeline::Config{64, 5});
    std::string html;
    for (int i = 0; i < 50; ++i) html += "<li>item " + std::to_string(i) + "</li>";

    auto result = pipeline.render(HtmlStringBody{html}, {regex("item (\\d+)", "entry $1")}, TemplateSet{});
    REQUIRE(result.is_ok());
    CHECK(result.value().bytes.find("item") == std::string::npos);
    CHECK(result.value().bytes.find("<li>entry 49</li>") != std::string::npos);
}

TEST_CASE("RenderPipeline: JSON regex then patch", "[render]") {
    RenderPipeline pipeline;
    auto result = pipeline.render(JsonBody{Json{{"msg", "hello"}}},
                                  {regex("hello", "hi"),
                                   json_patch(Json::parse(R"([{"op":"add","path":"/x","value":2}])"))},
                                  TemplateSet{});
    REQUIRE(result.is_ok());
    CHECK(Json::parse(result.value().bytes) == Json{{"msg", "hi"}, {"x", 2}});
    CHECK(result.value().content_type == kJsonContentType);
}

TEST_CASE("RenderPipeline: JSON patches apply in order", "[render]") {
    RenderPipeline pipeline;
    auto result = pipeline.render(JsonBody{Json{{"a", 1}}},
                                  {json_patch(Json::parse(R"([{"op":"add","path":"/b","value":1}])")),
                                   json_patch(Json::parse(R"([{"op":"move","from":"/a","path":"/c"}])"))},
                                  TemplateSet{});
    REQUIRE(result.is_ok());
    CHECK(Json::parse(result.value().bytes) == Json{{"b", 1}, {"c", 1}});
}

TEST_CASE("RenderPipeline: JSON broken by regex fails", "[render]") {
    RenderPipeline pipeline;
    auto result = pipeline.render(JsonBody{Json{{"k", "v"}}}, {regex("\\}", "")}, TemplateSet{});
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::JSON_AFTER_REGEX);
}

TEST_CASE("RenderPipeline: failing JSON Patch fails the render", "[render]") {
    RenderPipeline pipeline;
    auto failed = pipeline.render(JsonBody{Json{{"k", "v"}}},
                                  {json_patch(Json::parse(R"([{"op":"test","path":"/k","value":"other"}])"))},
                                  TemplateSet{});
    REQUIRE(failed.is_error());
    CHECK(failed.error_category() == ErrorCategory::JSON_PATCH_ERROR);

    auto not_array = pipeline.render(JsonBody{Json{{"k", "v"}}}, {json_patch(Json{{"op", "add"}})},
                                     TemplateSet{});
    REQUIRE(not_array.is_error());
    CHECK(not_array.error_category() == ErrorCategory::JSON_PATCH_ERROR);
}

TEST_CASE("RenderPipeline: JSON without patches serializes compactly", "[render]") {
    RenderPipeline pipeline;
    auto result = pipeline.render(JsonBody{Json{{"a", Json::array({1, 2})}}}, {}, TemplateSet{});
    REQUIRE(result.is_ok());
    CHECK(result.value().bytes == R"({"a":[1,2]})");
}

TEST_CASE("RenderPipeline: None and Unset bodies", "[render]") {
    RenderPipeline pipeline;
    auto none = pipeline.render(NoneBody{}, {regex("x", "y")}, TemplateSet{});
    REQUIRE(none.is_ok());
    CHECK(none.value().bytes.empty());
    CHECK(none.value().content_type.empty());

    auto unset = pipeline.render(UnsetBody{}, {}, TemplateSet{});
    REQUIRE(unset.is_error());
    CHECK(unset.error_category() == ErrorCategory::INTERNAL_ERROR);
}

TEST_CASE("RenderPipeline: errors in any stage return no body", "[render]") {
    RenderPipeline pipeline;
    auto bad_regex = pipeline.render(HtmlStringBody{"<p></p>"}, {regex("[", "x")}, TemplateSet{});
    REQUIRE(bad_regex.is_error());
    CHECK(bad_regex.error_category() == ErrorCategory::INVALID_REGEX);

    auto bad_selector = pipeline.render(HtmlStringBody{"<p></p>"}, {dom("p >", {DomOp::remove()})},
                                        TemplateSet{});
    REQUIRE(bad_selector.is_error());
    CHECK(bad_selector.error_category() == ErrorCategory::HTML_REWRITE_ERROR);

    auto bad_template = pipeline.render(HtmlTemplateBody{"{{#if x}}open", Json::object()}, {}, TemplateSet{});
    REQUIRE(bad_template.is_error());
    CHECK(bad_template.error_category() == ErrorCategory::TEMPLATE_ERROR);
}

TEST_CASE("RenderPipeline: alternation over a long run renders", "[render]") {
    RenderPipeline pipeline;

    const std::string short_run = "<p>" + std::string(20000, 'a') + "</p>";
    auto small = pipeline.render(HtmlStringBody{short_run}, {regex("(a|b)+", "x")}, TemplateSet{});
    REQUIRE(small.is_ok());
    CHECK(small.value().bytes == "<p>x</p>");

    const std::string long_run = "<p>" + std::string(300 * 1024, 'a') + "</p>";
    auto large = pipeline.render(HtmlStringBody{long_run}, {regex("(a|b)+", "x")}, TemplateSet{});
    REQUIRE(large.is_ok());
    CHECK(large.value().bytes.find('a') == std::string::npos);
    CHECK(large.value().bytes.ends_with("x</p>"));

    auto json = pipeline.render(JsonBody{Json{{"k", std::string(300 * 1024, 'a')}}},
                                {regex("(a|b)+", "x")}, TemplateSet{});
    REQUIRE(json.is_ok());
    CHECK(json.value().bytes == "{\"k\":\"x\"}");
}
