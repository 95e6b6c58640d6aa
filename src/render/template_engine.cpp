#include "render/template_engine.hpp"
#include "core/utils.hpp"

#include <deque>
#include <format>
#include <optional>
#include <stdexcept>
#include <vector>

namespace quill {

namespace {

constexpr int kMaxPartialDepth = 32;

class TemplateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Parsing
// ============================================================================

struct Node {
    enum class Kind { TEXT, ESCAPED, RAW, BLOCK, PARTIAL };

    Kind kind = Kind::TEXT;
    std::string text;   // literal text, value path, block helper or partial name
    std::string arg;    // block argument / partial context path
    std::vector<Node> body;
    std::vector<Node> inverse;
};

bool is_block_helper(std::string_view name) {
    return name == "if" || name == "unless" || name == "each" || name == "with";
}

/// "name rest of args" → {name, trimmed rest}
std::pair<std::string, std::string> split_head(std::string_view expr) {
    const auto trimmed = utils::trim(expr);
    const auto space = trimmed.find_first_of(" \t\r\n");
    if (space == std::string::npos) return {trimmed, {}};
    return {trimmed.substr(0, space), utils::trim(std::string_view(trimmed).substr(space + 1))};
}

class Parser {
public:
    explicit Parser(std::string_view source) : src_(source) {}

    std::vector<Node> parse() {
        auto [nodes, stop] = parse_nodes(nullptr);
        if (stop != Stop::END) throw TemplateError("unexpected block terminator at top level");
        return std::move(nodes);
    }

private:
    enum class Stop { END, ELSE, CLOSE };

    struct Parsed {
        std::vector<Node> nodes;
        Stop stop;
    };

    Parsed parse_nodes(const std::string* open_helper) {
        std::vector<Node> nodes;
        while (pos_ < src_.size()) {
            const auto open = src_.find("{{", pos_);
            if (open == std::string_view::npos) {
                push_text(nodes, src_.substr(pos_));
                pos_ = src_.size();
                break;
            }
            push_text(nodes, src_.substr(pos_, open - pos_));

            // {{!-- long comment --}}
            if (src_.substr(open).starts_with("{{!--")) {
                const auto close = src_.find("--}}", open + 5);
                if (close == std::string_view::npos) throw TemplateError("unterminated comment");
                pos_ = close + 4;
                continue;
            }

            // {{{ raw }}}
            if (src_.substr(open).starts_with("{{{")) {
                const auto close = src_.find("}}}", open + 3);
                if (close == std::string_view::npos) throw TemplateError("unterminated {{{ tag");
                Node node;
                node.kind = Node::Kind::RAW;
                node.text = utils::trim(src_.substr(open + 3, close - open - 3));
                if (node.text.empty()) throw TemplateError("empty {{{ }}} tag");
                nodes.push_back(std::move(node));
                pos_ = close + 3;
                continue;
            }

            const auto close = src_.find("}}", open + 2);
            if (close == std::string_view::npos) throw TemplateError("unterminated {{ tag");
            const std::string content = utils::trim(src_.substr(open + 2, close - open - 2));
            pos_ = close + 2;

            if (content.empty()) throw TemplateError("empty {{ }} tag");

            switch (content.front()) {
                case '!':
                    break;
                case '#':
                    nodes.push_back(parse_block(content.substr(1)));
                    break;
                case '/': {
                    const auto name = utils::trim(std::string_view(content).substr(1));
                    if (!open_helper || name != *open_helper) {
                        throw TemplateError(std::format("unexpected {{{{/{}}}}}", name));
                    }
                    return {std::move(nodes), Stop::CLOSE};
                }
                case '>': {
                    auto [name, ctx_path] = split_head(std::string_view(content).substr(1));
                    if (name.empty()) throw TemplateError("partial without a name");
                    Node node;
                    node.kind = Node::Kind::PARTIAL;
                    node.text = std::move(name);
                    node.arg = std::move(ctx_path);
                    nodes.push_back(std::move(node));
                    break;
                }
                default:
                    if (content == "else") {
                        if (!open_helper) throw TemplateError("{{else}} outside of a block");
                        return {std::move(nodes), Stop::ELSE};
                    }
                    Node node;
                    node.kind = Node::Kind::ESCAPED;
                    node.text = content;
                    nodes.push_back(std::move(node));
                    break;
            }
        }
        return {std::move(nodes), Stop::END};
    }

    Node parse_block(std::string_view expr) {
        auto [helper, arg] = split_head(expr);
        if (!is_block_helper(helper)) {
            throw TemplateError(std::format("unknown block helper '{}'", helper));
        }
        if (arg.empty()) {
            throw TemplateError(std::format("{{{{#{}}}}} needs an argument", helper));
        }

        Node node;
        node.kind = Node::Kind::BLOCK;
        node.text = helper;
        node.arg = arg;

        auto first = parse_nodes(&node.text);
        node.body = std::move(first.nodes);
        if (first.stop == Stop::ELSE) {
            auto second = parse_nodes(&node.text);
            if (second.stop != Stop::CLOSE) {
                throw TemplateError(std::format("unclosed {{{{#{}}}}}", helper));
            }
            node.inverse = std::move(second.nodes);
        } else if (first.stop != Stop::CLOSE) {
            throw TemplateError(std::format("unclosed {{{{#{}}}}}", helper));
        }
        return node;
    }

    static void push_text(std::vector<Node>& nodes, std::string_view text) {
        if (text.empty()) return;
        Node node;
        node.text = std::string(text);
        nodes.push_back(std::move(node));
    }

    std::string_view src_;
    size_t pos_ = 0;
};

// ============================================================================
// Rendering
// ============================================================================

std::string escape_expression(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (const char c : in) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            case '`':  out += "&#x60;"; break;
            case '=':  out += "&#x3D;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string to_text(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return {};
        case Json::value_t::string:
            return value.get<std::string>();
        case Json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case Json::value_t::array: {
            std::string out;
            for (size_t i = 0; i < value.size(); ++i) {
                if (i) out += ',';
                out += to_text(value[i]);
            }
            return out;
        }
        case Json::value_t::object:
            return "[object Object]";
        default:
            return value.dump();
    }
}

class Renderer {
public:
    Renderer(const std::map<std::string, std::string, std::less<>>& templates, const Json& model)
        : templates_(templates) {
        frames_.push_back(Frame{&model, std::nullopt});
    }

    std::string render(const std::vector<Node>& nodes) {
        render_nodes(nodes);
        return std::move(out_);
    }

private:
    struct Frame {
        const Json* value;
        std::optional<Json> data;   // @index, @key, @first, @last
    };

    void render_nodes(const std::vector<Node>& nodes) {
        for (const auto& node : nodes) render_node(node);
    }

    void render_node(const Node& node) {
        switch (node.kind) {
            case Node::Kind::TEXT:
                out_ += node.text;
                break;
            case Node::Kind::ESCAPED:
                if (const Json* v = lookup(node.text)) out_ += escape_expression(to_text(*v));
                break;
            case Node::Kind::RAW:
                if (const Json* v = lookup(node.text)) out_ += to_text(*v);
                break;
            case Node::Kind::BLOCK:
                render_block(node);
                break;
            case Node::Kind::PARTIAL:
                render_partial(node);
                break;
        }
    }

    void render_block(const Node& node) {
        const Json* value = lookup(node.arg);
        const bool truthy = value && template_truthy(*value);

        if (node.text == "if") {
            render_nodes(truthy ? node.body : node.inverse);
        } else if (node.text == "unless") {
            render_nodes(truthy ? node.inverse : node.body);
        } else if (node.text == "with") {
            if (!truthy) {
                render_nodes(node.inverse);
                return;
            }
            frames_.push_back(Frame{value, std::nullopt});
            render_nodes(node.body);
            frames_.pop_back();
        } else {
            render_each(node, value);
        }
    }

    void render_each(const Node& node, const Json* value) {
        if (!value || (!value->is_array() && !value->is_object()) || value->empty()) {
            render_nodes(node.inverse);
            return;
        }

        const size_t count = value->size();
        size_t index = 0;
        for (auto it = value->begin(); it != value->end(); ++it, ++index) {
            Json data = {{"index", index}, {"first", index == 0}, {"last", index + 1 == count}};
            if (value->is_object()) data["key"] = it.key();
            frames_.push_back(Frame{&*it, std::move(data)});
            render_nodes(node.body);
            frames_.pop_back();
        }
    }

    void render_partial(const Node& node) {
        const auto it = templates_.find(node.text);
        if (it == templates_.end()) {
            throw TemplateError(std::format("unknown partial '{}'", node.text));
        }
        if (++partial_depth_ > kMaxPartialDepth) {
            throw TemplateError(std::format("partial '{}' nested too deeply", node.text));
        }

        const auto nodes = Parser(it->second).parse();
        if (node.arg.empty()) {
            render_nodes(nodes);
        } else {
            const Json* value = lookup(node.arg);
            frames_.push_back(Frame{value ? value : &null_, std::nullopt});
            render_nodes(nodes);
            frames_.pop_back();
        }
        --partial_depth_;
    }

    /// nullptr when the path does not resolve
    const Json* lookup(std::string_view path) const {
        size_t depth = 0;
        while (path.starts_with("../")) {
            ++depth;
            path.remove_prefix(3);
        }
        const size_t top = frames_.size() - 1;
        const size_t frame_index = depth > top ? 0 : top - depth;

        if (path.starts_with("@")) {
            const std::string name(path.substr(1));
            for (size_t i = frame_index + 1; i-- > 0;) {
                const auto& data = frames_[i].data;
                if (!data) continue;
                const auto found = data->find(name);
                if (found != data->end()) return &*found;
            }
            return nullptr;
        }

        const Json* current = frames_[frame_index].value;
        if (path == "this" || path == ".") return current;
        if (path.starts_with("this.")) path.remove_prefix(5);
        else if (path.starts_with("./")) path.remove_prefix(2);

        for (const auto& segment : utils::split(std::string(path), '.')) {
            if (!current) return nullptr;
            if (current->is_object()) {
                const auto found = current->find(segment);
                if (found == current->end()) return nullptr;
                current = &*found;
            } else if (current->is_array()) {
                const auto index = utils::try_parse_int<size_t>(segment);
                if (!index || *index >= current->size()) return nullptr;
                current = &(*current)[*index];
            } else {
                return nullptr;
            }
        }
        return current;
    }

    const std::map<std::string, std::string, std::less<>>& templates_;
    std::deque<Frame> frames_;     // deque keeps frame addresses stable
    std::string out_;
    int partial_depth_ = 0;
    const Json null_;
};

} // anonymous namespace

bool template_truthy(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return false;
        case Json::value_t::boolean:
            return value.get<bool>();
        case Json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case Json::value_t::array:
            return !value.empty();
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
            return value.get<double>() != 0.0;
        default:
            return true;
    }
}

void TemplateSet::add(std::string name, std::string source) {
    templates_.insert_or_assign(std::move(name), std::move(source));
}

bool TemplateSet::contains(std::string_view name) const {
    return templates_.find(name) != templates_.end();
}

Result<std::string> TemplateSet::render(std::string_view name_or_source, const Json& model) const {
    const auto it = templates_.find(name_or_source);
    return render_source(it != templates_.end() ? std::string_view(it->second) : name_or_source, model);
}

Result<std::string> TemplateSet::render_source(std::string_view source, const Json& model) const {
    try {
        const auto nodes = Parser(source).parse();
        return Result<std::string>::ok(Renderer(templates_, model).render(nodes));
    } catch (const TemplateError& e) {
        return Result<std::string>::error(ErrorCategory::TEMPLATE_ERROR, e.what());
    }
}

} // namespace quill
