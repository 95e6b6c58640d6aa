#include "runtime/engine_thread.hpp"
#include "core/utils.hpp"

#include <format>

namespace quill {

EngineThread::EngineThread(std::string name)
    : name_(std::move(name)) {
    worker_ = std::thread(&EngineThread::run, this);
}

EngineThread::~EngineThread() {
    stop();
}

bool EngineThread::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void EngineThread::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable() && !on_worker_thread()) {
        worker_.join();
    }
}

bool EngineThread::on_worker_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void EngineThread::run() {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break;  // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
    utils::log::debug(std::format("{}: engine thread exited", name_));
}

} // namespace quill
