#include "content/front_matter.hpp"
#include "config/toml_json.hpp"

#include <yaml-cpp/yaml.h>
#include <toml++/toml.hpp>

#include <cctype>
#include <format>

namespace quill {

namespace {

struct FenceSplit {
    std::string_view header;
    std::string_view body;
};

/// Find a line consisting only of `fence` (CR tolerated) in rest
std::optional<FenceSplit> take_until_fence(std::string_view rest, std::string_view fence) {
    size_t pos = 0;
    while (pos <= rest.size()) {
        const size_t nl = rest.find('\n', pos);
        const size_t end = (nl == std::string_view::npos) ? rest.size() : nl;
        std::string_view line = rest.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line == fence) {
            const size_t body_start = (nl == std::string_view::npos) ? rest.size() : nl + 1;
            return FenceSplit{rest.substr(0, pos), rest.substr(body_start)};
        }
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return std::nullopt;
}

std::optional<std::string_view> strip_fence_line(std::string_view text, std::string_view fence) {
    if (!text.starts_with(fence)) return std::nullopt;
    auto rest = text.substr(fence.size());
    if (rest.starts_with("\r\n")) return rest.substr(2);
    if (rest.starts_with("\n")) return rest.substr(1);
    return std::nullopt;
}

/// Balanced top-level object at the start of text (strings and escapes respected)
std::optional<FenceSplit> slice_json_object(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    if (start >= text.size() || text[start] != '{') return std::nullopt;

    size_t depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                size_t body = i + 1;
                if (text.substr(body).starts_with("\r\n")) body += 2;
                else if (body < text.size() && text[body] == '\n') body += 1;
                return FenceSplit{text.substr(start, i + 1 - start), text.substr(body)};
            }
        }
    }
    return std::nullopt;
}

Json yaml_node_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return Json();
        case YAML::NodeType::Sequence: {
            Json arr = Json::array();
            for (const auto& item : node) arr.push_back(yaml_node_to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            Json obj = Json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_node_to_json(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Scalar:
            break;
    }

    // Quoted scalars are always strings
    if (node.Tag() == "!") return Json(node.Scalar());

    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) return Json(b);
    int64_t i = 0;
    if (YAML::convert<int64_t>::decode(node, i)) return Json(i);
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) return Json(d);
    return Json(node.Scalar());
}

} // anonymous namespace

Result<Json> yaml_to_json(std::string_view yaml) {
    try {
        const YAML::Node root = YAML::Load(std::string(yaml));
        Json value = yaml_node_to_json(root);
        if (value.is_null()) value = Json::object();
        return Result<Json>::ok(std::move(value));
    } catch (const YAML::Exception& e) {
        return Result<Json>::error(ErrorCategory::CONTEXT_ERROR,
            std::format("YAML front matter parse error: {}", e.what()));
    }
}

Result<FrontMatter> parse_front_matter(std::string_view text) {
    using R = Result<FrontMatter>;
    if (text.starts_with("\xEF\xBB\xBF")) text.remove_prefix(3);

    FrontMatter out;

    if (const auto rest = strip_fence_line(text, "---")) {
        const auto split = take_until_fence(*rest, "---");
        if (!split) {
            out.body = std::string(text);
            return R::ok(std::move(out));
        }
        auto meta = yaml_to_json(split->header);
        if (meta.is_error()) return R::error_from(meta);
        out.format = FrontMatterFormat::YAML;
        out.meta = std::move(meta.value());
        out.body = std::string(split->body);
        return R::ok(std::move(out));
    }

    if (const auto rest = strip_fence_line(text, "+++")) {
        const auto split = take_until_fence(*rest, "+++");
        if (!split) {
            out.body = std::string(text);
            return R::ok(std::move(out));
        }
        try {
            const auto tbl = toml::parse(split->header);
            out.format = FrontMatterFormat::TOML;
            out.meta = toml_to_json(tbl);
            out.body = std::string(split->body);
            return R::ok(std::move(out));
        } catch (const toml::parse_error& e) {
            return R::error(ErrorCategory::CONTEXT_ERROR,
                std::format("TOML front matter parse error: {}", e.description()));
        }
    }

    if (const auto split = slice_json_object(text)) {
        auto parsed = Json::parse(split->header, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return R::error(ErrorCategory::CONTEXT_ERROR, "JSON front matter parse error");
        }
        out.format = FrontMatterFormat::JSON;
        out.meta = std::move(parsed);
        out.body = std::string(split->body);
        return R::ok(std::move(out));
    }
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first != std::string_view::npos && text[first] == '{') {
        return R::error(ErrorCategory::CONTEXT_ERROR, "JSON front matter is not a balanced object");
    }

    out.body = std::string(text);
    return R::ok(std::move(out));
}

} // namespace quill
