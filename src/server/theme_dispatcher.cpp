#include "server/theme_dispatcher.hpp"

#include <format>

namespace quill {

ThemeDispatcher::ThemeDispatcher(std::vector<ThemeMount> mounts)
    : mounts_(std::move(mounts)) {}

bool ThemeDispatcher::mount_matches(std::string_view mount, std::string_view path) {
    if (!path.starts_with(mount)) return false;
    if (path.size() == mount.size()) return true;
    return mount.ends_with('/') || path[mount.size()] == '/';
}

std::optional<std::string> ThemeDispatcher::select(std::string_view path) const {
    const ThemeMount* best = nullptr;
    for (const auto& mount : mounts_) {
        if (!mount_matches(mount.path, path)) continue;
        if (!best || mount.path.size() > best->path.size()) best = &mount;
    }
    if (!best) return std::nullopt;
    return best->theme;
}

Result<RequestContext> ThemeDispatcher::dispatch(IThemeHost& themes, RequestContext ctx) const {
    const auto theme = select(ctx.path);
    if (!theme) {
        return Result<RequestContext>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("no theme mounted for '{}'", ctx.path));
    }

    auto reply = themes.render(*theme, std::move(ctx));
    try {
        return reply.get();
    } catch (const std::exception& e) {
        return Result<RequestContext>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("theme '{}' did not reply: {}", *theme, e.what()));
    }
}

} // namespace quill
