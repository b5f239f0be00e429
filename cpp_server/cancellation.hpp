#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>
#include <memory>
#include <string>
#include "errors.hpp"

enum class CancelReason {
    None,
    Cancelled,
    TimedOut
};

// Read side of a cancellation flag. Copies share the same flag; a token made by
// a linked source also fires when its parent does.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    bool IsCancelled() const { return Reason() != CancelReason::None; }

    CancelReason Reason() const {
        for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
            int reason = s->reason.load();
            if (reason != 0) {
                return static_cast<CancelReason>(reason);
            }
        }
        return CancelReason::None;
    }

    // Throws CancelledError or TimeoutError once the flag has fired.
    void ThrowIfCancelled(const std::string& what) const {
        switch (Reason()) {
            case CancelReason::None:
                return;
            case CancelReason::TimedOut:
                throw TimeoutError(what + ": invocation timed out");
            case CancelReason::Cancelled:
                throw CancelledError(what + ": invocation cancelled");
        }
    }

    // A token that never fires.
    static const CancellationToken& None() {
        static const CancellationToken token;
        return token;
    }

private:
    friend class CancellationSource;

    struct State {
        std::atomic<int> reason{0};
        std::shared_ptr<State> parent;
    };

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource() = default;

    // Fires when either this source or `parent` is cancelled.
    explicit CancellationSource(const CancellationToken& parent) {
        token_.state_->parent = parent.state_;
    }

    // First reason wins; later calls are ignored.
    bool Cancel(CancelReason reason = CancelReason::Cancelled) {
        int expected = 0;
        return token_.state_->reason.compare_exchange_strong(expected, static_cast<int>(reason));
    }

    const CancellationToken& Token() const { return token_; }

private:
    CancellationToken token_;
};

#endif // CANCELLATION_HPP
