#include "render/css_selector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace quill {

const HtmlAttribute* SelectorElement::find_attribute(std::string_view attr) const {
    for (const auto& a : attributes) {
        if (a.name == attr) return &a;
    }
    return nullptr;
}

// ============================================================================
// Parsing
// ============================================================================

class SelectorParser {
public:
    explicit SelectorParser(std::string_view input) : in_(input) {}

    std::vector<SelectorList::Complex> parse_list() {
        std::vector<SelectorList::Complex> list;
        for (;;) {
            skip_ws();
            list.push_back(parse_complex());
            skip_ws();
            if (eof()) break;
            if (peek() != ',') fail("expected ',' or end of selector");
            ++pos_;
        }
        return list;
    }

private:
    SelectorList::Complex parse_complex() {
        SelectorList::Complex complex;
        complex.parts.push_back(parse_compound());
        for (;;) {
            const bool had_ws = skip_ws();
            if (eof() || peek() == ',') break;

            auto combinator = SelectorList::Combinator::DESCENDANT;
            if (peek() == '>') {
                combinator = SelectorList::Combinator::CHILD;
                ++pos_;
                skip_ws();
            } else if (peek() == '+' || peek() == '~') {
                fail(std::format("combinator '{}' is not supported", peek()));
            } else if (!had_ws) {
                fail(std::format("unexpected '{}'", peek()));
            }
            complex.combinators.push_back(combinator);
            complex.parts.push_back(parse_compound());
        }
        return complex;
    }

    SelectorList::Compound parse_compound() {
        SelectorList::Compound compound;
        bool any = false;

        if (!eof() && peek() == '*') {
            ++pos_;
            any = true;
        } else if (!eof() && is_ident_char(peek())) {
            compound.tag = utils::to_lower(parse_ident());
            any = true;
        }

        while (!eof()) {
            const char c = peek();
            if (c == '#') {
                ++pos_;
                compound.ids.push_back(parse_ident());
            } else if (c == '.') {
                ++pos_;
                compound.classes.push_back(parse_ident());
            } else if (c == '[') {
                ++pos_;
                compound.attributes.push_back(parse_attribute());
            } else if (c == ':') {
                fail("pseudo-classes are not supported");
            } else {
                break;
            }
            any = true;
        }

        if (!any) fail("expected a selector");
        return compound;
    }

    SelectorList::AttributeTest parse_attribute() {
        using Op = SelectorList::AttributeTest::Op;
        SelectorList::AttributeTest test;
        skip_ws();
        test.name = utils::to_lower(parse_ident());
        skip_ws();
        if (eof()) fail("unterminated attribute selector");

        if (peek() == ']') {
            ++pos_;
            return test;
        }

        if (peek() == '=') {
            test.op = Op::EQUALS;
            ++pos_;
        } else {
            if (pos_ + 1 >= in_.size() || in_[pos_ + 1] != '=') fail("bad attribute operator");
            switch (peek()) {
                case '~': test.op = Op::INCLUDES; break;
                case '^': test.op = Op::PREFIX; break;
                case '$': test.op = Op::SUFFIX; break;
                case '*': test.op = Op::CONTAINS; break;
                default: fail(std::format("bad attribute operator '{}='", peek()));
            }
            pos_ += 2;
        }

        skip_ws();
        if (eof()) fail("unterminated attribute selector");
        if (peek() == '"' || peek() == '\'') {
            const char quote = peek();
            const auto close = in_.find(quote, pos_ + 1);
            if (close == std::string_view::npos) fail("unterminated string");
            test.value = std::string(in_.substr(pos_ + 1, close - pos_ - 1));
            pos_ = close + 1;
        } else {
            test.value = parse_ident();
        }
        skip_ws();
        if (eof() || peek() != ']') fail("expected ']'");
        ++pos_;
        return test;
    }

    std::string parse_ident() {
        const size_t start = pos_;
        while (!eof() && is_ident_char(peek())) ++pos_;
        if (pos_ == start) fail("expected an identifier");
        return std::string(in_.substr(start, pos_ - start));
    }

    static bool is_ident_char(char c) {
        const auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || c == '-' || c == '_' || u >= 0x80;
    }

    bool skip_ws() {
        const size_t start = pos_;
        while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) ++pos_;
        return pos_ != start;
    }

    [[noreturn]] void fail(const std::string& why) const {
        throw std::invalid_argument(std::format("{} at offset {}", why, pos_));
    }

    bool eof() const { return pos_ >= in_.size(); }
    char peek() const { return in_[pos_]; }

    std::string_view in_;
    size_t pos_ = 0;
};

Result<SelectorList> SelectorList::parse(std::string_view selector) {
    try {
        SelectorList list;
        list.selectors_ = SelectorParser(selector).parse_list();
        return Result<SelectorList>::ok(std::move(list));
    } catch (const std::invalid_argument& e) {
        return Result<SelectorList>::error(ErrorCategory::HTML_REWRITE_ERROR,
            std::format("invalid selector '{}': {}", selector, e.what()));
    }
}

// ============================================================================
// Matching
// ============================================================================

bool SelectorList::matches(const std::vector<const SelectorElement*>& path) const {
    if (path.empty()) return false;
    for (const auto& complex : selectors_) {
        if (match_from(complex, complex.parts.size() - 1, path, path.size() - 1)) return true;
    }
    return false;
}

bool SelectorList::match_from(const Complex& complex, size_t part,
                              const std::vector<const SelectorElement*>& path, size_t element) {
    if (!compound_matches(complex.parts[part], *path[element])) return false;
    if (part == 0) return true;

    if (complex.combinators[part - 1] == Combinator::CHILD) {
        return element > 0 && match_from(complex, part - 1, path, element - 1);
    }
    for (size_t ancestor = element; ancestor-- > 0;) {
        if (match_from(complex, part - 1, path, ancestor)) return true;
    }
    return false;
}

bool SelectorList::compound_matches(const Compound& compound, const SelectorElement& element) {
    if (!compound.tag.empty() && compound.tag != element.name) return false;

    for (const auto& id : compound.ids) {
        const auto* attr = element.find_attribute("id");
        if (!attr || attr->value != id) return false;
    }

    if (!compound.classes.empty()) {
        const auto* attr = element.find_attribute("class");
        if (!attr) return false;
        std::vector<std::string_view> tokens;
        std::string_view rest = attr->value;
        while (!rest.empty()) {
            const auto start = rest.find_first_not_of(" \t\r\n\f");
            if (start == std::string_view::npos) break;
            rest.remove_prefix(start);
            const auto end = rest.find_first_of(" \t\r\n\f");
            tokens.push_back(rest.substr(0, end));
            rest = (end == std::string_view::npos) ? std::string_view{} : rest.substr(end);
        }
        for (const auto& cls : compound.classes) {
            if (std::find(tokens.begin(), tokens.end(), cls) == tokens.end()) return false;
        }
    }

    for (const auto& test : compound.attributes) {
        if (!attribute_matches(test, element)) return false;
    }
    return true;
}

bool SelectorList::attribute_matches(const AttributeTest& test, const SelectorElement& element) {
    const auto* attr = element.find_attribute(test.name);
    if (!attr) return false;
    const std::string_view value = attr->value;

    switch (test.op) {
        case AttributeTest::Op::EXISTS:
            return true;
        case AttributeTest::Op::EQUALS:
            return value == test.value;
        case AttributeTest::Op::INCLUDES: {
            if (test.value.empty()) return false;
            std::string_view rest = value;
            while (!rest.empty()) {
                const auto start = rest.find_first_not_of(" \t\r\n\f");
                if (start == std::string_view::npos) break;
                rest.remove_prefix(start);
                const auto end = rest.find_first_of(" \t\r\n\f");
                if (rest.substr(0, end) == test.value) return true;
                rest = (end == std::string_view::npos) ? std::string_view{} : rest.substr(end);
            }
            return false;
        }
        case AttributeTest::Op::PREFIX:
            return !test.value.empty() && value.starts_with(test.value);
        case AttributeTest::Op::SUFFIX:
            return !test.value.empty() && value.ends_with(test.value);
        case AttributeTest::Op::CONTAINS:
            return !test.value.empty() && value.find(test.value) != std::string_view::npos;
    }
    return false;
}

} // namespace quill
