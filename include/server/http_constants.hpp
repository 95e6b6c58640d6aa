#pragma once

#include <string>
#include <string_view>

namespace quill::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kContentTypeHeader = "Content-Type";
inline const std::string kContentEncodingHeader = "Content-Encoding";
inline const std::string kAcceptEncodingHeader = "Accept-Encoding";
inline const std::string kVaryHeader = "Vary";

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kTextContentType = "text/plain; charset=utf-8";

inline constexpr std::string_view kHealthPath = "/_health";
inline constexpr std::string_view kThemeAssetPrefix = "/_themes/";

} // namespace quill::http
