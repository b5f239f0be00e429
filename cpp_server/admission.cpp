#include "admission.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>

AdmissionController::AdmissionController(int max_concurrent, int max_queued,
                                         std::chrono::milliseconds queue_wait)
    : max_concurrent_(std::max(1, max_concurrent)),
      max_queued_(std::max(0, max_queued)),
      queue_wait_(queue_wait) {}

AdmissionController::Slot AdmissionController::Acquire(const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (active_ < max_concurrent_) {
        active_++;
        return Slot(this);
    }

    if (queued_ >= max_queued_) {
        Logger::Warn("Rejecting invocation: " + std::to_string(active_) + " running, " +
                     std::to_string(queued_) + " queued", "Dispatcher");
        throw OverloadError("Server is at capacity (" + std::to_string(max_concurrent_) +
                            " concurrent invocations, queue full); retry later");
    }

    queued_++;
    auto deadline = std::chrono::steady_clock::now() + queue_wait_;
    while (active_ >= max_concurrent_) {
        if (token.IsCancelled()) {
            queued_--;
            lock.unlock();
            token.ThrowIfCancelled("Waiting for an execution slot");
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            queued_--;
            throw OverloadError("No execution slot became free within " +
                                std::to_string(queue_wait_.count()) + " ms; retry later");
        }
        cv_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                          std::chrono::milliseconds(50)));
    }
    queued_--;
    active_++;
    return Slot(this);
}

void AdmissionController::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_--;
    }
    cv_.notify_one();
}

int AdmissionController::Active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

int AdmissionController::Queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_;
}
