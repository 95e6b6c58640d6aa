#include "content/content_resolver.hpp"
#include "content/front_matter.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace quill {

namespace fs = std::filesystem;

ResolvedContent fallback_resolve(std::string_view /*path*/, std::string_view /*method*/) {
    return ResolvedContent{};
}

ContentKind classify_extension(std::string_view path) {
    const auto slash = path.rfind('/');
    const auto name = (slash == std::string_view::npos) ? path : path.substr(slash + 1);
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) return ContentKind::ASSET;

    const auto ext = utils::to_lower(name.substr(dot + 1));
    if (ext == "html" || ext == "htm") return ContentKind::HTML;
    if (ext == "json") return ContentKind::JSON;
    return ContentKind::ASSET;
}

FileContentResolver::FileContentResolver(std::string root)
    : root_(std::move(root)) {}

std::string FileContentResolver::map_request_path(std::string_view path) {
    std::string mapped(path);
    if (mapped.empty() || mapped.back() == '/') mapped += "index";

    const auto slash = mapped.rfind('/');
    const auto last = (slash == std::string::npos) ? mapped : mapped.substr(slash + 1);
    if (last.find('.') == std::string::npos) mapped += ".html";

    while (!mapped.empty() && mapped.front() == '/') mapped.erase(0, 1);
    return mapped;
}

Result<ResolvedContent> FileContentResolver::resolve(std::string_view path,
                                                     std::string_view /*method*/) const {
    const auto relative = fs::path(map_request_path(path)).lexically_normal();
    if (relative.empty() || relative.is_absolute() || *relative.begin() == "..") {
        return Result<ResolvedContent>::ok(ResolvedContent{});
    }

    const auto full = fs::path(root_) / relative;
    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) {
        return Result<ResolvedContent>::ok(ResolvedContent{});
    }

    ResolvedContent resolved;
    resolved.kind = classify_extension(relative.generic_string());
    resolved.body_path = full.string();

    const auto text = utils::read_file(resolved.body_path);
    if (!text) {
        return Result<ResolvedContent>::error(ErrorCategory::CONTEXT_ERROR,
            std::format("cannot read {}", resolved.body_path));
    }
    if (auto parsed = parse_front_matter(*text); parsed.is_ok()) {
        resolved.front_matter = std::move(parsed.value().meta);
    } else {
        utils::log::debug(std::format("Ignoring front matter of {}: {}",
                                      resolved.body_path, parsed.error_message()));
    }
    return Result<ResolvedContent>::ok(std::move(resolved));
}

ResolveFn make_file_resolver(std::string root) {
    return [resolver = FileContentResolver(std::move(root))](std::string_view path, std::string_view method) {
        return resolver.resolve(path, method);
    };
}

} // namespace quill
