#include "mpt/concurrency_limiter.hpp"

#include <stdexcept>

namespace mpt {

ConcurrencyLimiter::Permit::~Permit() { release(); }

ConcurrencyLimiter::Permit::Permit(Permit &&other) noexcept : limiter_(other.limiter_) {
    other.limiter_ = nullptr;
}

ConcurrencyLimiter::Permit &ConcurrencyLimiter::Permit::operator=(Permit &&other) noexcept {
    if (this != &other) {
        release();
        limiter_ = other.limiter_;
        other.limiter_ = nullptr;
    }
    return *this;
}

void ConcurrencyLimiter::Permit::release() {
    if (limiter_ != nullptr) {
        limiter_->release_one();
        limiter_ = nullptr;
    }
}

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t permits) : capacity_(permits), available_(permits) {
    if (capacity_ == 0) {
        throw std::invalid_argument("concurrency budget must be > 0");
    }
}

ConcurrencyLimiter::Permit ConcurrencyLimiter::acquire(const CancellationToken &cancel) {
    auto wake = cancel.on_cancel([this] {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });
    auto deadline = cancel.deadline();
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [&] { return available_ > 0 || cancel.cancelled(); };
    if (deadline) {
        cv_.wait_until(lock, *deadline, ready);
    } else {
        cv_.wait(lock, ready);
    }
    if (available_ == 0 || cancel.cancelled()) {
        return Permit();
    }
    --available_;
    return Permit(this);
}

ConcurrencyLimiter::Permit ConcurrencyLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ == 0) {
        return Permit();
    }
    --available_;
    return Permit(this);
}

std::size_t ConcurrencyLimiter::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

void ConcurrencyLimiter::release_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    cv_.notify_all();
}

} // namespace mpt
