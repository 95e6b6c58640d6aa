#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/request_context.hpp"
#include "runtime/theme_actor.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

/**
 * @brief Picks the theme for a path and runs its handle hook
 *
 * A mount matches when its path equals the request path, or is a
 * prefix of it ending at a segment boundary ("/blog" matches
 * "/blog/post" but not "/blogger"). The longest matching mount wins;
 * equal lengths resolve to the earlier mount.
 */
class ThemeDispatcher {
public:
    explicit ThemeDispatcher(std::vector<ThemeMount> mounts);

    [[nodiscard]] std::optional<std::string> select(std::string_view path) const;

    /**
     * @brief Render ctx with the selected theme
     * @return INTERNAL_ERROR when no mount matches; theme errors as-is
     */
    [[nodiscard]] Result<RequestContext> dispatch(IThemeHost& themes, RequestContext ctx) const;

    [[nodiscard]] const std::vector<ThemeMount>& mounts() const { return mounts_; }

    /// Mount path matching rule on its own
    [[nodiscard]] static bool mount_matches(std::string_view mount, std::string_view path);

private:
    std::vector<ThemeMount> mounts_;
};

} // namespace quill
