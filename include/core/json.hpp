#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace quill {

/**
 * @brief JSON document type used across the core
 *
 * Front matter, plugin/theme configuration, template models, JSON
 * bodies and script snapshots are all nlohmann::json values.
 */
using Json = nlohmann::json;

namespace json_util {

/// Object member as string, or fallback when absent / not a string
[[nodiscard]] inline std::string get_string(const Json& obj, std::string_view key,
                                            std::string fallback = {}) {
    if (!obj.is_object()) return fallback;
    const auto it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

/// Object member as object, or an empty object
[[nodiscard]] inline Json get_object(const Json& obj, std::string_view key) {
    if (!obj.is_object()) return Json::object();
    const auto it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_object()) return Json::object();
    return *it;
}

/// Serialize compactly; invalid UTF-8 is replaced rather than thrown
[[nodiscard]] inline std::string dump(const Json& value) {
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace json_util

} // namespace quill
