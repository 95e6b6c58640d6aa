#include "render/html_rewriter.hpp"
#include "render/css_selector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>

namespace quill {

namespace {

constexpr std::array<std::string_view, 14> kVoidElements = {
    "area", "base", "br", "col", "embed", "hr", "img",
    "input", "link", "meta", "param", "source", "track", "wbr",
};

constexpr std::array<std::string_view, 4> kRawTextElements = {"script", "style", "textarea", "title"};

// Roots of foreign content, where a trailing "/>" does close the element
constexpr std::array<std::string_view, 2> kForeignRoots = {"svg", "math"};

// Elements whose start tag implicitly closes an open sibling of the same name
constexpr std::array<std::string_view, 8> kSelfNesting = {"p", "li", "option", "tr", "td", "th", "dt", "dd"};

template<size_t N>
bool contains(const std::array<std::string_view, N>& set, std::string_view name) {
    return std::find(set.begin(), set.end(), name) != set.end();
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == ':' || c == '_';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

size_t find_ci(std::string_view haystack, std::string_view needle, size_t from) {
    if (needle.empty()) return from;
    for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
        if (utils::iequals(haystack.substr(i, needle.size()), needle)) return i;
    }
    return std::string_view::npos;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string escape_attribute(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        if (c == '&') out += "&amp;";
        else if (c == '"') out += "&quot;";
        else out += c;
    }
    return out;
}

std::vector<std::string> class_tokens(std::string_view value) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < value.size()) {
        while (i < value.size() && is_space(value[i])) ++i;
        const size_t start = i;
        while (i < value.size() && !is_space(value[i])) ++i;
        if (i > start) tokens.emplace_back(value.substr(start, i - start));
    }
    return tokens;
}

// ============================================================================
// Tokenizer pieces
// ============================================================================

struct StartTag {
    SelectorElement element;
    bool self_closing = false;
    std::string_view raw;
};

/// Parse `<name attrs...>` at pos; nullopt when the tag never terminates
std::optional<StartTag> parse_start_tag(std::string_view in, size_t pos, size_t& end) {
    StartTag tag;
    size_t i = pos + 1;
    const size_t name_start = i;
    while (i < in.size() && is_name_char(in[i])) ++i;
    tag.element.name = utils::to_lower(in.substr(name_start, i - name_start));

    for (;;) {
        while (i < in.size() && is_space(in[i])) ++i;
        if (i >= in.size()) return std::nullopt;
        if (in[i] == '>') {
            ++i;
            break;
        }
        if (in[i] == '/') {
            if (i + 1 < in.size() && in[i + 1] == '>') {
                tag.self_closing = true;
                i += 2;
                break;
            }
            ++i;
            continue;
        }

        const size_t attr_start = i;
        while (i < in.size() && !is_space(in[i]) && in[i] != '=' && in[i] != '>' && in[i] != '/') ++i;
        if (i == attr_start) {
            ++i;   // stray '='
            continue;
        }

        HtmlAttribute attr;
        attr.name = utils::to_lower(in.substr(attr_start, i - attr_start));

        size_t j = i;
        while (j < in.size() && is_space(in[j])) ++j;
        if (j < in.size() && in[j] == '=') {
            ++j;
            while (j < in.size() && is_space(in[j])) ++j;
            if (j >= in.size()) return std::nullopt;
            if (in[j] == '"' || in[j] == '\'') {
                const auto close = in.find(in[j], j + 1);
                if (close == std::string_view::npos) return std::nullopt;
                attr.value = decode_html_entities(in.substr(j + 1, close - j - 1));
                i = close + 1;
            } else {
                const size_t value_start = j;
                while (j < in.size() && !is_space(in[j]) && in[j] != '>') ++j;
                attr.value = decode_html_entities(in.substr(value_start, j - value_start));
                i = j;
            }
            attr.has_value = true;
        }

        // First occurrence wins, as in HTML
        if (!tag.element.find_attribute(attr.name)) {
            tag.element.attributes.push_back(std::move(attr));
        }
    }

    tag.raw = in.substr(pos, i - pos);
    end = i;
    return tag;
}

// ============================================================================
// Per-element edit plan
// ============================================================================

struct ElementPlan {
    std::vector<HtmlAttribute> attributes;
    bool start_tag_changed = false;
    std::string before;
    std::string prepend;
    std::string append;
    std::string after;
    std::optional<std::string> inner;
    std::optional<std::string> replacement;
    bool removed = false;
    bool unwrapped = false;
};

HtmlAttribute* find_attribute(std::vector<HtmlAttribute>& attrs, std::string_view name) {
    for (auto& a : attrs) {
        if (a.name == name) return &a;
    }
    return nullptr;
}

void set_class_tokens(ElementPlan& plan, const std::vector<std::string>& tokens) {
    std::string joined;
    for (const auto& t : tokens) {
        if (!joined.empty()) joined += ' ';
        joined += t;
    }
    auto& attrs = plan.attributes;
    if (joined.empty()) {
        attrs.erase(std::remove_if(attrs.begin(), attrs.end(),
                                   [](const HtmlAttribute& a) { return a.name == "class"; }),
                    attrs.end());
    } else if (auto* cls = find_attribute(attrs, "class")) {
        cls->value = std::move(joined);
        cls->has_value = true;
    } else {
        attrs.push_back(HtmlAttribute{"class", std::move(joined), true});
    }
    plan.start_tag_changed = true;
}

void apply_op(ElementPlan& plan, const DomOp& op) {
    const std::string payload = dom_op_is_text(op.kind) ? escape_html_text(op.content) : op.content;

    switch (op.kind) {
        case DomOpKind::SET_ATTRIBUTE: {
            const auto name = utils::to_lower(op.name);
            if (auto* attr = find_attribute(plan.attributes, name)) {
                attr->value = op.content;
                attr->has_value = true;
            } else {
                plan.attributes.push_back(HtmlAttribute{name, op.content, true});
            }
            plan.start_tag_changed = true;
            break;
        }
        case DomOpKind::REMOVE_ATTRIBUTE: {
            const auto name = utils::to_lower(op.name);
            auto& attrs = plan.attributes;
            attrs.erase(std::remove_if(attrs.begin(), attrs.end(),
                                       [&](const HtmlAttribute& a) { return a.name == name; }),
                        attrs.end());
            plan.start_tag_changed = true;
            break;
        }
        case DomOpKind::ADD_CLASS: {
            const auto* cls = find_attribute(plan.attributes, "class");
            auto tokens = class_tokens(cls ? std::string_view(cls->value) : std::string_view{});
            for (auto& token : class_tokens(op.name)) {
                if (std::find(tokens.begin(), tokens.end(), token) == tokens.end()) {
                    tokens.push_back(std::move(token));
                }
            }
            set_class_tokens(plan, tokens);
            break;
        }
        case DomOpKind::REMOVE_CLASS: {
            const auto* cls = find_attribute(plan.attributes, "class");
            if (!cls) break;
            auto tokens = class_tokens(cls->value);
            for (const auto& token : class_tokens(op.name)) {
                tokens.erase(std::remove(tokens.begin(), tokens.end(), token), tokens.end());
            }
            set_class_tokens(plan, tokens);
            break;
        }
        case DomOpKind::SET_INNER_HTML:
        case DomOpKind::SET_INNER_TEXT:
            plan.inner = payload;
            plan.prepend.clear();
            plan.append.clear();
            break;
        case DomOpKind::APPEND_HTML:
            plan.append += payload;
            break;
        case DomOpKind::PREPEND_HTML:
            plan.prepend.insert(0, payload);
            break;
        case DomOpKind::REPLACE_WITH_HTML:
        case DomOpKind::REPLACE_WITH_TEXT:
            plan.removed = true;
            plan.replacement = payload;
            break;
        case DomOpKind::INSERT_BEFORE_HTML:
        case DomOpKind::INSERT_BEFORE_TEXT:
            plan.before += payload;
            break;
        case DomOpKind::INSERT_AFTER_HTML:
        case DomOpKind::INSERT_AFTER_TEXT:
            plan.after.insert(0, payload);
            break;
        case DomOpKind::REMOVE:
            plan.removed = true;
            plan.replacement.reset();
            break;
        case DomOpKind::UNWRAP:
            plan.unwrapped = true;
            break;
    }
}

std::string serialize_start_tag(const std::string& name, const std::vector<HtmlAttribute>& attrs,
                                bool self_closing) {
    std::string out = "<" + name;
    for (const auto& attr : attrs) {
        out += ' ';
        out += attr.name;
        if (attr.has_value) {
            out += "=\"";
            out += escape_attribute(attr.value);
            out += '"';
        }
    }
    out += self_closing ? "/>" : ">";
    return out;
}

// ============================================================================
// Rewriter
// ============================================================================

struct Handler {
    SelectorList selector;
    const HtmlDomPatch* patch;
};

class Rewriter {
public:
    Rewriter(std::string_view in, const std::vector<Handler>& handlers)
        : in_(in), handlers_(handlers) {
        out_.reserve(in.size() + in.size() / 8);
    }

    std::string run() {
        size_t pos = 0;
        while (pos < in_.size()) {
            const auto lt = in_.find('<', pos);
            if (lt == std::string_view::npos) {
                emit(in_.substr(pos));
                break;
            }
            emit(in_.substr(pos, lt - pos));
            pos = lt;
            const auto rest = in_.substr(pos);

            if (rest.starts_with("<!--")) {
                const auto close = in_.find("-->", pos + 4);
                const size_t end = (close == std::string_view::npos) ? in_.size() : close + 3;
                emit(in_.substr(pos, end - pos));
                pos = end;
            } else if (rest.starts_with("<!") || rest.starts_with("<?")) {
                const auto gt = in_.find('>', pos);
                const size_t end = (gt == std::string_view::npos) ? in_.size() : gt + 1;
                emit(in_.substr(pos, end - pos));
                pos = end;
            } else if (rest.starts_with("</")) {
                size_t i = pos + 2;
                while (i < in_.size() && is_name_char(in_[i])) ++i;
                const auto name = utils::to_lower(in_.substr(pos + 2, i - pos - 2));
                const auto gt = in_.find('>', i);
                const size_t end = (gt == std::string_view::npos) ? in_.size() : gt + 1;
                if (name.empty()) {
                    emit(in_.substr(pos, end - pos));
                } else {
                    on_end_tag(name, in_.substr(pos, end - pos));
                }
                pos = end;
            } else if (rest.size() > 1 && std::isalpha(static_cast<unsigned char>(rest[1]))) {
                size_t end = 0;
                auto tag = parse_start_tag(in_, pos, end);
                if (!tag) {
                    emit(rest);
                    break;
                }
                const std::string name = tag->element.name;
                const bool raw_text = !closes_itself(*tag) && contains(kRawTextElements, name);
                on_start_tag(std::move(*tag));
                pos = end;

                if (raw_text && !stack_.empty() && stack_.back().element.name == name) {
                    const auto close = find_ci(in_, "</" + name, pos);
                    const size_t stop = (close == std::string_view::npos) ? in_.size() : close;
                    emit(in_.substr(pos, stop - pos));
                    pos = stop;
                }
            } else {
                emit("<");
                ++pos;
            }
        }

        while (!stack_.empty()) close_top({});
        return std::move(out_);
    }

private:
    struct OpenElement {
        SelectorElement element;
        ElementPlan plan;
        bool matched = false;
        bool suppresses_children = false;
    };

    void emit(std::string_view text) {
        if (suppressed_ == 0) out_ += text;
    }

    /// Void elements always; "/>" only counts inside svg or math
    [[nodiscard]] bool closes_itself(const StartTag& tag) const {
        if (contains(kVoidElements, tag.element.name)) return true;
        if (!tag.self_closing) return false;
        if (contains(kForeignRoots, tag.element.name)) return true;
        return std::any_of(stack_.begin(), stack_.end(), [](const OpenElement& open) {
            return contains(kForeignRoots, open.element.name);
        });
    }

    void on_start_tag(StartTag tag) {
        while (!stack_.empty() && stack_.back().element.name == tag.element.name &&
               contains(kSelfNesting, tag.element.name)) {
            close_top({});
        }

        std::vector<const SelectorElement*> path;
        path.reserve(stack_.size() + 1);
        for (const auto& open : stack_) path.push_back(&open.element);
        path.push_back(&tag.element);

        OpenElement open;
        open.plan.attributes = tag.element.attributes;
        for (const auto& handler : handlers_) {
            if (!handler.selector.matches(path)) continue;
            open.matched = true;
            for (const auto& op : handler.patch->ops) apply_op(open.plan, op);
        }

        const bool closes_now = closes_itself(tag);
        open.element = std::move(tag.element);

        if (!open.matched) {
            emit(tag.raw);
            if (!closes_now) stack_.push_back(std::move(open));
            return;
        }

        auto& plan = open.plan;
        emit(plan.before);
        if (plan.removed) {
            if (plan.replacement) emit(*plan.replacement);
            if (closes_now) {
                emit(plan.after);
                return;
            }
            open.suppresses_children = true;
        } else {
            if (!plan.unwrapped) {
                emit(plan.start_tag_changed
                         ? serialize_start_tag(open.element.name, plan.attributes, tag.self_closing)
                         : std::string(tag.raw));
            }
            if (closes_now) {
                emit(plan.after);
                return;
            }
            emit(plan.prepend);
            if (plan.inner) {
                emit(*plan.inner);
                open.suppresses_children = true;
            }
        }

        if (open.suppresses_children) ++suppressed_;
        stack_.push_back(std::move(open));
    }

    void on_end_tag(const std::string& name, std::string_view raw) {
        size_t index = stack_.size();
        while (index > 0 && stack_[index - 1].element.name != name) --index;
        if (index == 0) {
            emit(raw);   // stray end tag
            return;
        }
        while (stack_.size() > index) close_top({});
        close_top(raw);
    }

    /// Pop the innermost element; an empty raw_end means it closed implicitly
    void close_top(std::string_view raw_end) {
        OpenElement open = std::move(stack_.back());
        stack_.pop_back();
        if (open.suppresses_children) --suppressed_;

        if (!open.matched) {
            emit(raw_end);
            return;
        }
        const auto& plan = open.plan;
        if (!plan.removed) {
            emit(plan.append);
            if (!plan.unwrapped) emit(raw_end);
        }
        emit(plan.after);
    }

    std::string_view in_;
    const std::vector<Handler>& handlers_;
    std::vector<OpenElement> stack_;
    std::string out_;
    int suppressed_ = 0;
};

} // anonymous namespace

std::string escape_html_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default:  out += c; break;
        }
    }
    return out;
}

std::string decode_html_entities(std::string_view text) {
    if (text.find('&') == std::string_view::npos) return std::string(text);

    static constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kNamed = {{
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"}, {"nbsp", "\xC2\xA0"},
    }};

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }
        const auto semi = text.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10) {
            out += text[i++];
            continue;
        }
        const auto entity = text.substr(i + 1, semi - i - 1);
        bool decoded = false;

        if (entity.size() > 1 && entity[0] == '#') {
            const bool hex = entity[1] == 'x' || entity[1] == 'X';
            const auto digits = entity.substr(hex ? 2 : 1);
            uint32_t cp = 0;
            bool ok = !digits.empty();
            for (const char c : digits) {
                const int v = std::isdigit(static_cast<unsigned char>(c)) ? c - '0'
                            : (hex && std::isxdigit(static_cast<unsigned char>(c)))
                                ? std::tolower(static_cast<unsigned char>(c)) - 'a' + 10
                                : -1;
                if (v < 0 || cp > 0x10FFFF) {
                    ok = false;
                    break;
                }
                cp = cp * (hex ? 16 : 10) + static_cast<uint32_t>(v);
            }
            if (ok) {
                append_utf8(out, cp);
                decoded = true;
            }
        } else {
            for (const auto& [name, value] : kNamed) {
                if (entity == name) {
                    out += value;
                    decoded = true;
                    break;
                }
            }
        }

        if (decoded) {
            i = semi + 1;
        } else {
            out += text[i++];
        }
    }
    return out;
}

Result<std::string> rewrite_html(std::string_view html, const std::vector<HtmlDomPatch>& patches) {
    std::vector<Handler> handlers;
    handlers.reserve(patches.size());
    for (const auto& patch : patches) {
        auto selector = SelectorList::parse(patch.selector);
        if (selector.is_error()) return Result<std::string>::error_from(selector);
        handlers.push_back(Handler{std::move(selector.value()), &patch});
    }
    if (handlers.empty()) return Result<std::string>::ok(std::string(html));

    return Result<std::string>::ok(Rewriter(html, handlers).run());
}

} // namespace quill
