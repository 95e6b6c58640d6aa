#pragma once

#include "runtime/theme_actor.hpp"

#include <format>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace quill::testing {

/**
 * @brief IThemeHost whose themes are plain functions, answered synchronously
 */
class MockThemeHost : public IThemeHost {
public:
    using RenderFn = std::function<Result<RequestContext>(RequestContext)>;

    void add(const std::string& id, RenderFn fn) { themes_[id] = std::move(fn); }

    /// Theme that replies with a fixed HTML string body
    void add_html(const std::string& id, std::string html) {
        add(id, [html](RequestContext ctx) {
            ctx.response.body = HtmlStringBody{html};
            return Result<RequestContext>::ok(std::move(ctx));
        });
    }

    std::future<Result<RequestContext>> render(const std::string& theme_id, RequestContext ctx) override {
        {
            std::lock_guard lock(mutex_);
            rendered.push_back(theme_id);
        }
        std::promise<Result<RequestContext>> promise;
        const auto it = themes_.find(theme_id);
        if (it == themes_.end()) {
            promise.set_value(Result<RequestContext>::error(ErrorCategory::CALL_ERROR,
                std::format("unknown theme '{}'", theme_id)));
        } else {
            promise.set_value(it->second(std::move(ctx)));
        }
        return promise.get_future();
    }

    std::vector<std::string> rendered;

private:
    std::map<std::string, RenderFn> themes_;
    std::mutex mutex_;
};

} // namespace quill::testing
