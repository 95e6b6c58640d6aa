#include "core/header_map.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace quill {

std::string canonicalize_header_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    bool segment_start = true;
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '-') {
            out += c;
            segment_start = true;
            continue;
        }
        out += static_cast<char>(segment_start ? std::toupper(uc) : std::tolower(uc));
        segment_start = false;
    }
    return out;
}

bool is_valid_header_name(std::string_view name) {
    if (name.empty()) return false;
    static constexpr std::string_view kTokenSpecials = "!#$%&'*+-.^_`|~";
    return std::all_of(name.begin(), name.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || kTokenSpecials.find(c) != std::string_view::npos;
    });
}

bool is_valid_header_value(std::string_view value) {
    return std::all_of(value.begin(), value.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return uc == '\t' || (uc >= 0x20 && uc != 0x7F);
    });
}

void HeaderMap::set(std::string_view name, std::string value) {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return utils::iequals(e.first, name); });
    if (it == entries_.end()) {
        entries_.emplace_back(canonicalize_header_name(name), std::move(value));
        return;
    }
    // Keep the position of the first occurrence, drop the rest
    it->second = std::move(value);
    const auto first = it - entries_.begin();
    entries_.erase(std::remove_if(entries_.begin() + first + 1, entries_.end(),
        [&](const Entry& e) { return utils::iequals(e.first, name); }), entries_.end());
}

void HeaderMap::append(std::string_view name, std::string value) {
    entries_.emplace_back(canonicalize_header_name(name), std::move(value));
}

size_t HeaderMap::remove(std::string_view name) {
    const auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return utils::iequals(e.first, name); }), entries_.end());
    return before - entries_.size();
}

bool HeaderMap::contains(std::string_view name) const {
    return std::any_of(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return utils::iequals(e.first, name); });
}

std::optional<std::string> HeaderMap::get(std::string_view name) const {
    for (const auto& [k, v] : entries_) {
        if (utils::iequals(k, name)) return v;
    }
    return std::nullopt;
}

std::vector<std::string> HeaderMap::get_all(std::string_view name) const {
    std::vector<std::string> out;
    for (const auto& [k, v] : entries_) {
        if (utils::iequals(k, name)) out.push_back(v);
    }
    return out;
}

} // namespace quill
