#pragma once
#include <atomic>
#include <memory>

namespace clipmind {

// Cooperative cancellation for long passes. Copies share the same flag, so
// the caller keeps one copy and hands another to the worker.
class TaskHandle {
public:
    TaskHandle() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace clipmind
