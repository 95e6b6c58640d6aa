#include <catch2/catch_test_macros.hpp>
#include "script/quickjs_engine.hpp"

#include <cstdint>
#include <limits>

using namespace quill;

TEST_CASE("QuickJs: evaluate returns JSON-equivalent values", "[script]") {
    QuickJsEngine engine;

    auto obj = engine.evaluate("({a: 1, b: 'two', c: [true, null], d: {e: 1.5}})");
    REQUIRE(obj.is_ok());
    CHECK(obj.value() == Json{{"a", 1}, {"b", "two"}, {"c", {true, nullptr}}, {"d", {{"e", 1.5}}}});

    auto integral = engine.evaluate("3 * 2");
    REQUIRE(integral.is_ok());
    CHECK(integral.value().is_number_integer());
    CHECK(integral.value() == 6);

    auto undefined = engine.evaluate("undefined");
    REQUIRE(undefined.is_ok());
    CHECK(undefined.value().is_null());
}

TEST_CASE("QuickJs: JSON.stringify-like member rules", "[script]") {
    QuickJsEngine engine;
    auto result = engine.evaluate("({keep: 1, fn() {}, gone: undefined, list: [undefined, () => 1], n: NaN})");
    REQUIRE(result.is_ok());
    CHECK(result.value() == Json{{"keep", 1}, {"list", {nullptr, nullptr}}, {"n", nullptr}});

    auto dated = engine.evaluate("({when: new Date(0)})");
    REQUIRE(dated.is_ok());
    CHECK(dated.value()["when"] == "1970-01-01T00:00:00.000Z");
}

TEST_CASE("QuickJs: unconvertible values", "[script]") {
    QuickJsEngine engine;

    auto fn = engine.evaluate("(function () {})");
    REQUIRE(fn.is_error());
    CHECK(fn.error_category() == ErrorCategory::CONVERSION_ERROR);

    auto symbol = engine.evaluate("Symbol('s')");
    REQUIRE(symbol.is_error());
    CHECK(symbol.error_category() == ErrorCategory::CONVERSION_ERROR);

    auto cyclic = engine.evaluate("const o = {}; o.self = o; o");
    REQUIRE(cyclic.is_error());
    CHECK(cyclic.error_category() == ErrorCategory::CONVERSION_ERROR);
}

TEST_CASE("QuickJs: syntax and runtime errors on evaluate", "[script]") {
    QuickJsEngine engine;

    auto syntax = engine.evaluate("let = ;");
    REQUIRE(syntax.is_error());
    CHECK(syntax.error_category() == ErrorCategory::EVAL_ERROR);

    auto thrown = engine.evaluate("throw new Error('boom')");
    REQUIRE(thrown.is_error());
    CHECK(thrown.error_category() == ErrorCategory::EVAL_ERROR);
    CHECK(thrown.error_message().find("boom") != std::string::npos);
}

TEST_CASE("QuickJs: call by dotted path with arguments", "[script]") {
    QuickJsEngine engine;
    REQUIRE(engine.load_module("lib", R"(
        globalThis.lib = {
            math: {
                add(a, b) { return a + b; },
                scale(obj) { return {v: obj.v * this.factor}; },
                factor: 10,
            },
            fail() { throw new Error('nope'); },
        };
    )").is_ok());

    auto sum = engine.call("lib.math.add", {Json(2), Json(3)});
    REQUIRE(sum.is_ok());
    CHECK(sum.value() == 5);

    // `this` is the holder object
    auto scaled = engine.call("lib.math.scale", {Json{{"v", 4}}});
    REQUIRE(scaled.is_ok());
    CHECK(scaled.value() == Json{{"v", 40}});

    auto thrown = engine.call("lib.fail", {});
    REQUIRE(thrown.is_error());
    CHECK(thrown.error_category() == ErrorCategory::CALL_ERROR);
    CHECK(thrown.error_message().find("nope") != std::string::npos);
}

TEST_CASE("QuickJs: values survive a round trip through script", "[script]") {
    QuickJsEngine engine;
    REQUIRE(engine.load_module("id", "globalThis.id = x => x;").is_ok());

    const auto round_trip = [&engine](const Json& value) {
        auto result = engine.call("id", {value});
        REQUIRE(result.is_ok());
        return result.value();
    };

    SECTION("integers up to 2^53 stay exact integers") {
        for (const int64_t n : {int64_t{9007199254740992}, int64_t{-9007199254740992},
                                int64_t{-9007199254740991}, int64_t{0}, int64_t{-1}}) {
            CAPTURE(n);
            const auto back = round_trip(Json(n));
            CHECK(back.is_number_integer());
            CHECK(back.get<int64_t>() == n);
        }
    }

    SECTION("non-integral and large numbers come back as doubles") {
        const auto half = round_trip(Json(1.5));
        CHECK(half.is_number_float());
        CHECK(half.get<double>() == 1.5);

        const double beyond = 9007199254740994.0;   // 2^53 + 2
        const auto large = round_trip(Json(beyond));
        CHECK(large.is_number_float());
        CHECK(large.get<double>() == beyond);

        const uint64_t huge = 18446744073709551615ull;
        const auto unsigned_back = round_trip(Json(huge));
        CHECK(unsigned_back.is_number_float());
        CHECK(unsigned_back.get<double>() == static_cast<double>(huge));
    }

    SECTION("non-finite numbers become null") {
        CHECK(round_trip(Json(std::numeric_limits<double>::infinity())).is_null());
        CHECK(round_trip(Json(-std::numeric_limits<double>::infinity())).is_null());
        CHECK(round_trip(Json(std::numeric_limits<double>::quiet_NaN())).is_null());
    }

    SECTION("nested arrays and objects") {
        const Json nested = {
            {"title", "caf\xC3\xA9"},
            {"flags", {true, false, nullptr}},
            {"matrix", Json::array({Json::array({1, 2}), Json::array(), Json::array({Json::object()})})},
            {"meta", {{"depth", {{"level", 3}, {"tags", {"a", "b"}}}}, {"ratio", 0.25}}},
        };
        CHECK(round_trip(nested) == nested);
        CHECK(round_trip(Json::array()) == Json::array());
        CHECK(round_trip(Json::object()) == Json::object());
        CHECK(round_trip(Json("")) == Json(""));
    }
}

TEST_CASE("QuickJs: missing functions and objects", "[script]") {
    QuickJsEngine engine;
    REQUIRE(engine.load_module("lib", "globalThis.lib = {value: 1};").is_ok());

    auto missing = engine.call("lib.absent", {});
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::CALL_ERROR);
    CHECK(is_missing_function(missing));

    auto not_fn = engine.call("lib.value", {});
    CHECK(is_missing_function(not_fn));

    auto no_object = engine.call("nothing.here", {});
    REQUIRE(no_object.is_error());
    CHECK(no_object.error_category() == ErrorCategory::CALL_ERROR);
    CHECK_FALSE(is_missing_function(no_object));
}

TEST_CASE("QuickJs: load_module reports the module name", "[script]") {
    QuickJsEngine engine;
    auto result = engine.load_module("broken-plugin", "this is not javascript");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::EVAL_ERROR);
    CHECK(result.error_message().find("broken-plugin") != std::string::npos);
}

TEST_CASE("QuickJs: host capabilities are absent", "[script]") {
    QuickJsEngine engine;
    auto result = engine.evaluate(
        "[typeof require, typeof process, typeof setTimeout, typeof fetch, typeof std, typeof os]");
    REQUIRE(result.is_ok());
    CHECK(result.value() == Json::array({"undefined", "undefined", "undefined", "undefined",
                                         "undefined", "undefined"}));
}

TEST_CASE("QuickJs: memory limit stops runaway allocation", "[script]") {
    QuickJsEngine::Options options;
    options.memory_limit_bytes = 8 * 1024 * 1024;
    QuickJsEngine engine(options);

    auto result = engine.evaluate("(function () { const a = []; for (;;) a.push('x'.repeat(1024)); })()");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::EVAL_ERROR);

    // The engine stays usable afterwards
    auto after = engine.evaluate("1 + 1");
    REQUIRE(after.is_ok());
    CHECK(after.value() == 2);
}

TEST_CASE("QuickJs: factory creates independent engines", "[script]") {
    const auto factory = make_quickjs_factory();
    auto a = factory();
    auto b = factory();
    REQUIRE(a->evaluate("globalThis.shared = 1").is_ok());
    auto seen = b->evaluate("typeof shared");
    REQUIRE(seen.is_ok());
    CHECK(seen.value() == "undefined");
}
