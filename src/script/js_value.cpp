#include "script/js_value.hpp"

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>

namespace quill::js {

namespace {

constexpr double kMaxSafeInteger = 9007199254740992.0;  // 2^53

/// RAII guard for a JSValue owned by the host
class ValueGuard {
public:
    ValueGuard(JSContext* ctx, JSValue v) : ctx_(ctx), v_(v) {}
    ~ValueGuard() { JS_FreeValue(ctx_, v_); }

    ValueGuard(const ValueGuard&) = delete;
    ValueGuard& operator=(const ValueGuard&) = delete;

    [[nodiscard]] JSValueConst get() const { return v_; }

private:
    JSContext* ctx_;
    JSValue v_;
};

Result<Json> conversion_error(std::string message) {
    return Result<Json>::error(ErrorCategory::CONVERSION_ERROR, std::move(message));
}

Json number_to_json(double d) {
    if (!std::isfinite(d)) return nullptr;
    if (std::trunc(d) == d && std::fabs(d) <= kMaxSafeInteger) {
        return static_cast<int64_t>(d);
    }
    return d;
}

// Skipped as object members, null as array slots (JSON.stringify rules)
bool is_unrepresentable(JSContext* ctx, JSValueConst v) {
    return JS_IsUndefined(v) || JS_IsFunction(ctx, v);
}

Result<Json> convert(JSContext* ctx, JSValueConst v, int depth);

Result<Json> convert_array(JSContext* ctx, JSValueConst v, int depth) {
    ValueGuard len_val(ctx, JS_GetPropertyStr(ctx, v, "length"));
    int64_t length = 0;
    if (JS_ToInt64(ctx, &length, len_val.get()) != 0) {
        return conversion_error(std::format("array length unreadable: {}",
                                            take_exception_message(ctx)));
    }

    Json arr = Json::array();
    for (int64_t i = 0; i < length; ++i) {
        ValueGuard elem(ctx, JS_GetPropertyUint32(ctx, v, static_cast<uint32_t>(i)));
        if (JS_IsException(elem.get())) {
            return conversion_error(std::format("array element {}: {}", i,
                                                take_exception_message(ctx)));
        }
        if (is_unrepresentable(ctx, elem.get())) {
            arr.push_back(nullptr);
            continue;
        }
        auto converted = convert(ctx, elem.get(), depth + 1);
        if (converted.is_error()) return converted;
        arr.push_back(std::move(converted.value()));
    }
    return Result<Json>::ok(std::move(arr));
}

Result<Json> convert_object(JSContext* ctx, JSValueConst v, int depth) {
    // Honour toJSON() (used by the header wrapper of the context shim)
    {
        ValueGuard to_json(ctx, JS_GetPropertyStr(ctx, v, "toJSON"));
        if (JS_IsFunction(ctx, to_json.get())) {
            ValueGuard replaced(ctx, JS_Call(ctx, to_json.get(), v, 0, nullptr));
            if (JS_IsException(replaced.get())) {
                return conversion_error(std::format("toJSON threw: {}",
                                                    take_exception_message(ctx)));
            }
            if (is_unrepresentable(ctx, replaced.get())) {
                return Result<Json>::ok(nullptr);
            }
            return convert(ctx, replaced.get(), depth + 1);
        }
    }

    JSPropertyEnum* props = nullptr;
    uint32_t prop_count = 0;
    if (JS_GetOwnPropertyNames(ctx, &props, &prop_count, v,
                               JS_GPN_STRING_MASK | JS_GPN_ENUM_ONLY) != 0) {
        return conversion_error(std::format("object keys unreadable: {}",
                                            take_exception_message(ctx)));
    }

    Json obj = Json::object();
    Result<Json> failure = Result<Json>::ok(nullptr);
    bool failed = false;

    for (uint32_t i = 0; i < prop_count; ++i) {
        if (!failed) {
            const char* key = JS_AtomToCString(ctx, props[i].atom);
            ValueGuard prop(ctx, JS_GetProperty(ctx, v, props[i].atom));
            if (key == nullptr || JS_IsException(prop.get())) {
                failure = conversion_error(std::format("object member unreadable: {}",
                                                       take_exception_message(ctx)));
                failed = true;
            } else if (!is_unrepresentable(ctx, prop.get())) {
                auto converted = convert(ctx, prop.get(), depth + 1);
                if (converted.is_error()) {
                    failure = std::move(converted);
                    failed = true;
                } else {
                    obj[key] = std::move(converted.value());
                }
            }
            if (key != nullptr) JS_FreeCString(ctx, key);
        }
        JS_FreeAtom(ctx, props[i].atom);
    }
    js_free(ctx, props);

    if (failed) return failure;
    return Result<Json>::ok(std::move(obj));
}

Result<Json> convert(JSContext* ctx, JSValueConst v, int depth) {
    if (depth > kMaxConversionDepth) {
        return conversion_error(std::format(
            "value nesting exceeds {} levels (cyclic structure?)", kMaxConversionDepth));
    }

    if (JS_IsNull(v) || JS_IsUndefined(v)) {
        return Result<Json>::ok(nullptr);
    }
    if (JS_IsBool(v)) {
        return Result<Json>::ok(JS_ToBool(ctx, v) != 0);
    }
    if (JS_IsNumber(v)) {
        double d = 0.0;
        JS_ToFloat64(ctx, &d, v);
        return Result<Json>::ok(number_to_json(d));
    }
    if (JS_IsString(v)) {
        size_t len = 0;
        const char* str = JS_ToCStringLen(ctx, &len, v);
        if (str == nullptr) {
            return conversion_error("string is not representable as UTF-8");
        }
        std::string out(str, len);
        JS_FreeCString(ctx, str);
        return Result<Json>::ok(Json(std::move(out)));
    }
    if (JS_IsFunction(ctx, v)) {
        return conversion_error("functions cannot be converted to JSON");
    }
    if (JS_IsArray(ctx, v)) {
        return convert_array(ctx, v, depth);
    }
    if (JS_IsObject(v)) {
        return convert_object(ctx, v, depth);
    }
    if (JS_IsSymbol(v)) {
        return conversion_error("symbols cannot be converted to JSON");
    }
    return conversion_error("unsupported script value type (BigInt?)");
}

} // anonymous namespace

JSValue to_js(JSContext* ctx, const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return JS_NULL;
        case Json::value_t::boolean:
            return JS_NewBool(ctx, value.get<bool>());
        case Json::value_t::number_integer:
            return JS_NewInt64(ctx, value.get<int64_t>());
        case Json::value_t::number_unsigned: {
            const auto u = value.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return JS_NewInt64(ctx, static_cast<int64_t>(u));
            }
            return JS_NewFloat64(ctx, static_cast<double>(u));
        }
        case Json::value_t::number_float:
            return JS_NewFloat64(ctx, value.get<double>());
        case Json::value_t::string: {
            const auto& s = value.get_ref<const std::string&>();
            return JS_NewStringLen(ctx, s.data(), s.size());
        }
        case Json::value_t::array: {
            JSValue arr = JS_NewArray(ctx);
            uint32_t i = 0;
            for (const auto& elem : value) {
                JS_SetPropertyUint32(ctx, arr, i++, to_js(ctx, elem));
            }
            return arr;
        }
        case Json::value_t::object: {
            JSValue obj = JS_NewObject(ctx);
            for (auto it = value.begin(); it != value.end(); ++it) {
                const std::string& key = it.key();
                JSAtom atom = JS_NewAtomLen(ctx, key.data(), key.size());
                JS_SetProperty(ctx, obj, atom, to_js(ctx, it.value()));
                JS_FreeAtom(ctx, atom);
            }
            return obj;
        }
        case Json::value_t::binary:
            break;
    }
    return JS_NULL;
}

Result<Json> from_js(JSContext* ctx, JSValueConst value) {
    return convert(ctx, value, 0);
}

std::string take_exception_message(JSContext* ctx) {
    JSValue exc = JS_GetException(ctx);
    std::string message = "unknown exception";
    if (const char* str = JS_ToCString(ctx, exc)) {
        message = str;
        JS_FreeCString(ctx, str);
    }
    JS_FreeValue(ctx, exc);
    return message;
}

} // namespace quill::js
