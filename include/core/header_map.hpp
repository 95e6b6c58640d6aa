#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quill {

/**
 * @brief Canonical header-name form: first letter of each hyphen-separated
 * segment upper-cased, the rest lower-cased ("x-FOO-bar" → "X-Foo-Bar").
 */
[[nodiscard]] std::string canonicalize_header_name(std::string_view name);

/// RFC 7230 token characters only, non-empty
[[nodiscard]] bool is_valid_header_name(std::string_view name);

/// Visible ASCII, obs-text, SP and HTAB only (no CR/LF/NUL)
[[nodiscard]] bool is_valid_header_value(std::string_view value);

/**
 * @brief Ordered multi-valued header mapping
 *
 * Names are stored canonicalized; lookups are case-insensitive.
 * Insertion order is preserved, including the order of parallel
 * values for the same name.
 */
class HeaderMap {
public:
    using Entry = std::pair<std::string, std::string>;

    /// Replace all values for name with a single value
    void set(std::string_view name, std::string value);

    /// Add a parallel value (keeps existing values)
    void append(std::string_view name, std::string value);

    /// Remove every value for name; returns number removed
    size_t remove(std::string_view name);

    [[nodiscard]] bool contains(std::string_view name) const;

    /// First value for name
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> get_all(std::string_view name) const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    bool operator==(const HeaderMap& other) const = default;

private:
    std::vector<Entry> entries_;
};

} // namespace quill
