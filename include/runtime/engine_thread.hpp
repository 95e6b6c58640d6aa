#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace quill {

/**
 * @brief Dedicated OS thread draining an unbounded FIFO of tasks
 *
 * Everything a script engine touches is created, used and destroyed
 * through tasks posted here, which pins the engine to one thread and
 * serializes every call into it. Tasks never run concurrently.
 */
class EngineThread {
public:
    using Task = std::function<void()>;

    explicit EngineThread(std::string name);
    ~EngineThread();

    EngineThread(const EngineThread&) = delete;
    EngineThread& operator=(const EngineThread&) = delete;

    /**
     * @brief Enqueue a task
     * @return false if the thread is stopping (task not queued)
     */
    bool post(Task task);

    /**
     * @brief Enqueue fn and get its result through a future
     *
     * An exception thrown by fn is stored in the future. If the
     * thread is already stopping the future holds a runtime_error.
     */
    template<typename Fn>
    auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn&>> {
        using R = std::invoke_result_t<Fn&>;
        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();
        const bool queued = post([promise, fn = std::move(fn)]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    fn();
                    promise->set_value();
                } else {
                    promise->set_value(fn());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        if (!queued) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error(name_ + ": engine thread stopped")));
        }
        return future;
    }

    /// Finish queued tasks, then join. Idempotent.
    void stop();

    /// True when called from the worker thread itself
    [[nodiscard]] bool on_worker_thread() const;

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void run();

    std::string name_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace quill
