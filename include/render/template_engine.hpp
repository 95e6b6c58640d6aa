#pragma once

#include "core/error.hpp"
#include "core/json.hpp"

#include <map>
#include <string>
#include <string_view>

namespace quill {

/**
 * @brief Named handlebars-style templates sharing one partial namespace
 *
 * Supported: {{path}} (escaped), {{{path}}} (raw), dotted paths, this,
 * ../ parent access, @index/@key/@first/@last, {{#if}}, {{#unless}},
 * {{#each}}, {{#with}} (all with {{else}}), {{> partial [path]}} and
 * {{! comments}} / {{!-- comments --}}.
 *
 * Immutable after setup; render() is safe to call from many threads.
 */
class TemplateSet {
public:
    void add(std::string name, std::string source);

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] size_t size() const { return templates_.size(); }

    /**
     * @brief Render a registered template, or treat the argument as source
     * @return TEMPLATE_ERROR on malformed templates or unknown partials
     */
    [[nodiscard]] Result<std::string> render(std::string_view name_or_source, const Json& model) const;

    /// Render source text directly (partials resolve against this set)
    [[nodiscard]] Result<std::string> render_source(std::string_view source, const Json& model) const;

private:
    std::map<std::string, std::string, std::less<>> templates_;
};

/// Handlebars truthiness: false, null, 0, "" and [] are false
[[nodiscard]] bool template_truthy(const Json& value);

} // namespace quill
