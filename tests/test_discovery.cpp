#include <catch2/catch_test_macros.hpp>
#include "runtime/discovery.hpp"
#include "tmp_dir.hpp"

using namespace quill;
using quill::testing::TmpDir;

namespace {

std::vector<std::string> ids(const std::vector<PluginSpec>& specs) {
    std::vector<std::string> out;
    for (const auto& s : specs) out.push_back(s.id);
    return out;
}

PluginSpec spec(std::string id) {
    return PluginSpec{std::move(id), "", ""};
}

ThemePackage package(std::string id) {
    ThemePackage pkg;
    pkg.spec.id = std::move(id);
    return pkg;
}

} // anonymous namespace

TEST_CASE("Discovery: plugins from manifests", "[discovery]") {
    TmpDir tmp("plugins");
    tmp.file("seo/plugin.toml", "name = \"SEO helper\"\n");
    tmp.file("seo/plugin.js", "globalThis.seo = {};");
    tmp.file("auth/plugin.toml", "id = \"authz\"\nmain = \"index.js\"\n");
    tmp.file("auth/index.js", "globalThis.authz = {};");
    tmp.file("notes/readme.txt", "not a plugin");

    auto result = discover_plugins(tmp.path.string());
    REQUIRE(result.is_ok());
    const auto& specs = result.value();
    REQUIRE(ids(specs) == std::vector<std::string>{"authz", "seo"});
    CHECK(specs[0].source == "globalThis.authz = {};");
    CHECK(specs[1].name == "SEO helper");
}

TEST_CASE("Discovery: missing directory yields nothing", "[discovery]") {
    auto plugins = discover_plugins("/nonexistent/plugins");
    REQUIRE(plugins.is_ok());
    CHECK(plugins.value().empty());

    auto themes = discover_themes("");
    REQUIRE(themes.is_ok());
    CHECK(themes.value().empty());
}

TEST_CASE("Discovery: unreadable plugin script and bad manifest", "[discovery]") {
    TmpDir tmp("plugins_bad");
    tmp.file("ghost/plugin.toml", "main = \"missing.js\"\n");
    auto missing = discover_plugins(tmp.path.string());
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::PLUGIN_BOOTSTRAP);

    TmpDir tmp2("plugins_toml");
    tmp2.file("x/plugin.toml", "id = \n");
    auto bad = discover_plugins(tmp2.path.string());
    REQUIRE(bad.is_error());
    CHECK(bad.error_category() == ErrorCategory::PLUGIN_BOOTSTRAP);
}

TEST_CASE("Discovery: themes with templates and assets", "[discovery]") {
    TmpDir tmp("themes");
    tmp.file("docs/theme.toml", "name = \"Docs\"\nassets_dir = \"static\"\n");
    tmp.file("docs/theme.js", "registerTheme({ handle(ctx) { return ctx; } });");
    tmp.file("docs/templates/page.hbs", "<h1>{{title}}</h1>");
    tmp.file("docs/templates/list.html", "<ul></ul>");
    tmp.file("docs/templates/notes.txt", "ignored");
    tmp.file("docs/static/site.css", "body {}");

    auto result = discover_themes(tmp.path.string());
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 1);
    const auto& pkg = result.value()[0];
    CHECK(pkg.spec.id == "docs");
    CHECK(pkg.spec.name == "Docs");
    CHECK(pkg.templates.size() == 2);
    CHECK(pkg.templates.at("page") == "<h1>{{title}}</h1>");
    CHECK(pkg.templates.contains("list"));
    CHECK(pkg.assets_dir == (tmp.path / "docs" / "static").string());
}

TEST_CASE("Discovery: plugin ordering", "[discovery]") {
    const std::vector<PluginSpec> found = {spec("a"), spec("b"), spec("c")};

    auto all = order_plugins(found, {});
    REQUIRE(all.is_ok());
    CHECK(ids(all.value()) == std::vector<std::string>{"a", "b", "c"});

    auto chosen = order_plugins(found, {"c", "a"});
    REQUIRE(chosen.is_ok());
    CHECK(ids(chosen.value()) == std::vector<std::string>{"c", "a"});

    auto unknown = order_plugins(found, {"z"});
    REQUIRE(unknown.is_error());
    CHECK(unknown.error_category() == ErrorCategory::PLUGIN_BOOTSTRAP);

    auto repeated = order_plugins(found, {"a", "a"});
    CHECK(repeated.is_error());

    auto clash = order_plugins({spec("a"), spec("a")}, {});
    CHECK(clash.is_error());
}

TEST_CASE("Discovery: mounted theme selection", "[discovery]") {
    const std::vector<ThemeMount> mounts = {{"/", "base"}, {"/docs", "docs"}, {"/api", "base"}};

    auto selected = select_mounted_themes({package("docs"), package("unused"), package("base")}, mounts);
    REQUIRE(selected.is_ok());
    REQUIRE(selected.value().size() == 2);
    CHECK(selected.value()[0].spec.id == "base");
    CHECK(selected.value()[1].spec.id == "docs");

    auto unknown = select_mounted_themes({package("base")}, mounts);
    REQUIRE(unknown.is_error());
    CHECK(unknown.error_category() == ErrorCategory::THEME_BOOTSTRAP);
}
