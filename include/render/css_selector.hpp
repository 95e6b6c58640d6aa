#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace quill {

/**
 * @brief Attribute as seen by the selector engine (entities decoded)
 */
struct HtmlAttribute {
    std::string name;    // lower-cased
    std::string value;
    bool has_value = false;

    bool operator==(const HtmlAttribute&) const = default;
};

/**
 * @brief Element facts a selector can test
 */
struct SelectorElement {
    std::string name;    // lower-cased tag name
    std::vector<HtmlAttribute> attributes;

    [[nodiscard]] const HtmlAttribute* find_attribute(std::string_view attr) const;
};

/**
 * @brief Parsed CSS selector list (subset)
 *
 * Type and universal selectors, #id, .class, [attr], [attr=v],
 * [attr~=v], [attr^=v], [attr$=v], [attr*=v], compound selectors,
 * descendant and child combinators, comma-separated lists.
 */
class SelectorList {
public:
    /// HTML_REWRITE_ERROR on unsupported or malformed input
    [[nodiscard]] static Result<SelectorList> parse(std::string_view selector);

    /**
     * @brief Test the last element of `path` (root first, element last)
     */
    [[nodiscard]] bool matches(const std::vector<const SelectorElement*>& path) const;

private:
    struct AttributeTest {
        enum class Op { EXISTS, EQUALS, INCLUDES, PREFIX, SUFFIX, CONTAINS };
        std::string name;
        Op op = Op::EXISTS;
        std::string value;
    };

    struct Compound {
        std::string tag;                  // empty = any element
        std::vector<std::string> ids;
        std::vector<std::string> classes;
        std::vector<AttributeTest> attributes;
    };

    enum class Combinator { DESCENDANT, CHILD };

    struct Complex {
        std::vector<Compound> parts;
        std::vector<Combinator> combinators;   // combinators[i] joins parts[i] and parts[i + 1]
    };

    friend class SelectorParser;

    static bool compound_matches(const Compound& compound, const SelectorElement& element);
    static bool attribute_matches(const AttributeTest& test, const SelectorElement& element);
    static bool match_from(const Complex& complex, size_t part, const std::vector<const SelectorElement*>& path,
                           size_t element);

    std::vector<Complex> selectors_;
};

} // namespace quill
