#include <catch2/catch_test_macros.hpp>
#include "server/theme_dispatcher.hpp"
#include "mocks/mock_theme_host.hpp"

using namespace quill;
using quill::testing::MockThemeHost;

namespace {

RequestContext context_for(std::string path) {
    RequestContext ctx;
    ctx.request_id = "test";
    ctx.path = std::move(path);
    ctx.method = "GET";
    return ctx;
}

} // anonymous namespace

TEST_CASE("ThemeDispatcher: longest matching mount wins", "[dispatch]") {
    ThemeDispatcher dispatcher({{"/", "base"}, {"/docs", "docs"}, {"/docs/api", "api"}});
    CHECK(dispatcher.select("/docs/api/x") == "api");
    CHECK(dispatcher.select("/docs/guide") == "docs");
    CHECK(dispatcher.select("/docs") == "docs");
    CHECK(dispatcher.select("/blog") == "base");
    CHECK(dispatcher.select("/") == "base");
}

TEST_CASE("ThemeDispatcher: mounts match at segment boundaries", "[dispatch]") {
    CHECK(ThemeDispatcher::mount_matches("/blog", "/blog"));
    CHECK(ThemeDispatcher::mount_matches("/blog", "/blog/post"));
    CHECK_FALSE(ThemeDispatcher::mount_matches("/blog", "/blogger"));
    CHECK(ThemeDispatcher::mount_matches("/blog/", "/blog/post"));
    CHECK(ThemeDispatcher::mount_matches("/", "/anything"));
    CHECK_FALSE(ThemeDispatcher::mount_matches("/docs", "/"));

    ThemeDispatcher dispatcher({{"/", "base"}, {"/blog", "blog"}});
    CHECK(dispatcher.select("/blogger") == "base");
}

TEST_CASE("ThemeDispatcher: equal mounts resolve to the earlier one", "[dispatch]") {
    ThemeDispatcher dispatcher({{"/a", "first"}, {"/a", "second"}});
    CHECK(dispatcher.select("/a/b") == "first");
}

TEST_CASE("ThemeDispatcher: unmatched path", "[dispatch]") {
    ThemeDispatcher dispatcher({{"/docs", "docs"}});
    CHECK_FALSE(dispatcher.select("/blog").has_value());

    MockThemeHost themes;
    auto result = dispatcher.dispatch(themes, context_for("/blog"));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INTERNAL_ERROR);
    CHECK(themes.rendered.empty());
}

TEST_CASE("ThemeDispatcher: dispatch renders with the selected theme", "[dispatch]") {
    MockThemeHost themes;
    themes.add_html("base", "<p>base</p>");
    themes.add_html("docs", "<p>docs</p>");
    ThemeDispatcher dispatcher({{"/", "base"}, {"/docs", "docs"}});

    auto result = dispatcher.dispatch(themes, context_for("/docs/intro"));
    REQUIRE(result.is_ok());
    REQUIRE(themes.rendered == std::vector<std::string>{"docs"});
    const auto* body = std::get_if<HtmlStringBody>(&result.value().response.body);
    REQUIRE(body != nullptr);
    CHECK(body->html == "<p>docs</p>");
}

TEST_CASE("ThemeDispatcher: theme errors pass through", "[dispatch]") {
    MockThemeHost themes;
    themes.add("broken", [](RequestContext) {
        return Result<RequestContext>::error(ErrorCategory::CALL_ERROR, "handle threw");
    });
    ThemeDispatcher dispatcher({{"/", "broken"}});

    auto result = dispatcher.dispatch(themes, context_for("/x"));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CALL_ERROR);
}
