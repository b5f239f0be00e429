#ifndef ADMISSION_HPP
#define ADMISSION_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include "cancellation.hpp"

// Bounds the number of tool invocations executing at once. Callers beyond the
// limit wait in a bounded queue; a full queue or an expired wait is an
// OverloadError.
class AdmissionController {
public:
    // Releases its slot on destruction.
    class Slot {
    public:
        Slot() : owner_(nullptr) {}
        explicit Slot(AdmissionController* owner) : owner_(owner) {}
        ~Slot() { Reset(); }

        Slot(Slot&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                Reset();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        void Reset() {
            if (owner_) {
                owner_->Release();
                owner_ = nullptr;
            }
        }

        bool Held() const { return owner_ != nullptr; }

    private:
        AdmissionController* owner_;
    };

    AdmissionController(int max_concurrent, int max_queued, std::chrono::milliseconds queue_wait);

    // Throws OverloadError, or CancelledError/TimeoutError if `token` fires while queued.
    Slot Acquire(const CancellationToken& token = CancellationToken::None());

    int Active() const;
    int Queued() const;

private:
    void Release();

    const int max_concurrent_;
    const int max_queued_;
    const std::chrono::milliseconds queue_wait_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int active_ = 0;
    int queued_ = 0;
};

#endif // ADMISSION_HPP
