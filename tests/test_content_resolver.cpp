#include <catch2/catch_test_macros.hpp>
#include "content/content_resolver.hpp"
#include "tmp_dir.hpp"

using namespace quill;
using quill::testing::TmpDir;

TEST_CASE("ContentResolver: extension classification", "[content]") {
    CHECK(classify_extension("/a/page.html") == ContentKind::HTML);
    CHECK(classify_extension("/a/page.HTM") == ContentKind::HTML);
    CHECK(classify_extension("/data.json") == ContentKind::JSON);
    CHECK(classify_extension("/logo.png") == ContentKind::ASSET);
    CHECK(classify_extension("/v1.2/readme") == ContentKind::ASSET);
    CHECK(classify_extension("/") == ContentKind::ASSET);
}

TEST_CASE("ContentResolver: request path mapping", "[content]") {
    CHECK(FileContentResolver::map_request_path("/") == "index.html");
    CHECK(FileContentResolver::map_request_path("/blog/") == "blog/index.html");
    CHECK(FileContentResolver::map_request_path("/blog/post") == "blog/post.html");
    CHECK(FileContentResolver::map_request_path("/api/data.json") == "api/data.json");
}

TEST_CASE("ContentResolver: fallback treats everything as an asset", "[content]") {
    const auto resolved = fallback_resolve("/anything.html", "GET");
    CHECK(resolved.kind == ContentKind::ASSET);
    CHECK(resolved.front_matter == Json::object());
    CHECK(resolved.body_path.empty());
}

TEST_CASE("ContentResolver: files under the root", "[content]") {
    TmpDir tmp("content");
    tmp.file("index.html", "---\ntitle: Home\n---\n<h1>Home</h1>");
    tmp.file("docs/intro.html", "<p>no front matter</p>");
    tmp.file("api/items.json", "{\"owner\": \"me\"}\n[1, 2]");

    const auto resolve = make_file_resolver(tmp.path.string());

    auto home = resolve("/", "GET");
    REQUIRE(home.is_ok());
    CHECK(home.value().kind == ContentKind::HTML);
    CHECK(home.value().front_matter == Json{{"title", "Home"}});
    CHECK(home.value().body_path == (tmp.path / "index.html").string());

    auto intro = resolve("/docs/intro", "GET");
    REQUIRE(intro.is_ok());
    CHECK(intro.value().kind == ContentKind::HTML);
    CHECK(intro.value().front_matter == Json::object());

    auto items = resolve("/api/items.json", "GET");
    REQUIRE(items.is_ok());
    CHECK(items.value().kind == ContentKind::JSON);
    CHECK(items.value().front_matter == Json{{"owner", "me"}});
}

TEST_CASE("ContentResolver: missing and escaping paths resolve empty", "[content]") {
    TmpDir tmp("content_missing");
    tmp.file("index.html", "x");
    const FileContentResolver resolver(tmp.path.string());

    auto missing = resolver.resolve("/nope", "GET");
    REQUIRE(missing.is_ok());
    CHECK(missing.value().kind == ContentKind::ASSET);
    CHECK(missing.value().body_path.empty());

    auto escape = resolver.resolve("/../../etc/passwd", "GET");
    REQUIRE(escape.is_ok());
    CHECK(escape.value().body_path.empty());
}

TEST_CASE("ContentResolver: broken front matter is ignored", "[content]") {
    TmpDir tmp("content_broken");
    tmp.file("bad.html", "---\nkey: [unclosed\n---\n<p>x</p>");
    const FileContentResolver resolver(tmp.path.string());

    auto result = resolver.resolve("/bad.html", "GET");
    REQUIRE(result.is_ok());
    CHECK(result.value().kind == ContentKind::HTML);
    CHECK(result.value().front_matter == Json::object());
}
