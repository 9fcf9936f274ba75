#pragma once

#include "errors.hpp"

namespace hilo {

// Non-blocking mutual exclusion around code paths that move value out.
// A nested acquisition fails immediately with ReentrantCall.
class ReentrancyGuard {
public:
    class Lock {
    public:
        explicit Lock(ReentrancyGuard& guard) : guard_(&guard) {
            if (guard_->entered_) {
                throw MarketError(ErrorCode::ReentrantCall, "Reentrant call rejected");
            }
            guard_->entered_ = true;
        }

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

        Lock(Lock&& other) noexcept : guard_(other.guard_) { other.guard_ = nullptr; }
        Lock& operator=(Lock&&) = delete;

        ~Lock() {
            if (guard_ != nullptr) {
                guard_->entered_ = false;
            }
        }

    private:
        ReentrancyGuard* guard_;
    };

    ReentrancyGuard() = default;
    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    Lock acquire() { return Lock(*this); }
    bool entered() const { return entered_; }

private:
    bool entered_ = false;
};

} // namespace hilo
