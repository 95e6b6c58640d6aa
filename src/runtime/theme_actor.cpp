#include "runtime/theme_actor.hpp"
#include "core/utils.hpp"

#include <format>

namespace quill {

ThemeActor::~ThemeActor() {
    stop();
}

Result<std::unique_ptr<ThemeActor>> ThemeActor::start(ScriptEngineFactory factory,
                                                      const std::vector<ThemeSpec>& specs) {
    using R = Result<std::unique_ptr<ThemeActor>>;
    std::unique_ptr<ThemeActor> actor(new ThemeActor());

    for (const auto& spec : specs) {
        if (actor->slots_.contains(spec.id)) {
            return R::error(ErrorCategory::THEME_BOOTSTRAP,
                std::format("theme '{}' registered twice", spec.id));
        }
        auto slot = std::make_unique<Slot>(spec.id);
        auto boot = slot->thread.submit([raw = slot.get(), factory, spec]() -> Result<void> {
            auto created = ThemeRuntime::create(factory(), spec);
            if (created.is_error()) return Result<void>::error_from(created);
            raw->runtime = std::move(created.value());
            return Result<void>::ok();
        });

        Result<void> booted = Result<void>::ok();
        try {
            booted = boot.get();
        } catch (const std::exception& e) {
            booted = Result<void>::error(ErrorCategory::THEME_BOOTSTRAP,
                std::format("theme '{}' engine failed to start: {}", spec.id, e.what()));
        }
        // Whatever happened, the slot owns a live thread and must be stopped by us
        actor->slots_.emplace(spec.id, std::move(slot));
        if (booted.is_error()) {
            return R::error(ErrorCategory::THEME_BOOTSTRAP, booted.error_message());
        }
    }

    utils::log::info(std::format("Theme actor started with {} theme(s)", actor->slots_.size()));
    return R::ok(std::move(actor));
}

void ThemeActor::init_all(const RequestContext& ctx) {
    std::vector<std::pair<std::string, std::future<Result<void>>>> pending;
    for (auto& [id, slot] : slots_) {
        pending.emplace_back(id, slot->thread.submit([raw = slot.get(), ctx]() {
            return raw->runtime->init(ctx);
        }));
    }
    for (auto& [id, future] : pending) {
        try {
            const auto result = future.get();
            if (result.is_error()) {
                utils::log::warn(std::format("theme '{}' init failed: {}", id, result.error_message()));
            }
        } catch (const std::exception& e) {
            utils::log::warn(std::format("theme '{}' init failed: {}", id, e.what()));
        }
    }
}

std::future<Result<RequestContext>> ThemeActor::render(const std::string& theme_id,
                                                       RequestContext ctx) {
    const auto it = slots_.find(theme_id);
    if (it == slots_.end()) {
        std::promise<Result<RequestContext>> unknown;
        unknown.set_value(Result<RequestContext>::error(ErrorCategory::CALL_ERROR,
            std::format("unknown theme '{}'", theme_id)));
        return unknown.get_future();
    }
    Slot* slot = it->second.get();
    return slot->thread.submit([slot, ctx = std::move(ctx)]() mutable {
        try {
            return slot->runtime->render(std::move(ctx));
        } catch (const std::exception& e) {
            return Result<RequestContext>::error(ErrorCategory::INTERNAL_ERROR, e.what());
        }
    });
}

std::vector<std::string> ThemeActor::theme_ids() const {
    std::vector<std::string> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) ids.push_back(id);
    return ids;
}

void ThemeActor::stop() {
    for (auto& [id, slot] : slots_) {
        Slot* raw = slot.get();
        (void)raw->thread.post([raw] { raw->runtime.reset(); });
        raw->thread.stop();
    }
}

} // namespace quill
