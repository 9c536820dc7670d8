#pragma once

#include "mpt/cancellation.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace mpt {

// Counting budget of part attempts shared by every transfer that is handed
// the same limiter. Waiting for a permit blocks and wakes on cancellation.
class ConcurrencyLimiter {
  public:
    class Permit {
      public:
        Permit() = default;
        ~Permit();

        Permit(Permit &&other) noexcept;
        Permit &operator=(Permit &&other) noexcept;

        Permit(const Permit &) = delete;
        Permit &operator=(const Permit &) = delete;

        explicit operator bool() const noexcept { return limiter_ != nullptr; }

        void release();

      private:
        friend class ConcurrencyLimiter;
        explicit Permit(ConcurrencyLimiter *limiter) : limiter_(limiter) {}

        ConcurrencyLimiter *limiter_{nullptr};
    };

    explicit ConcurrencyLimiter(std::size_t permits);

    ConcurrencyLimiter(const ConcurrencyLimiter &) = delete;
    ConcurrencyLimiter &operator=(const ConcurrencyLimiter &) = delete;

    // Empty permit when `cancel` fires (or its deadline passes) first.
    Permit acquire(const CancellationToken &cancel);

    Permit try_acquire();

    std::size_t capacity() const noexcept { return capacity_; }

    std::size_t available() const;

  private:
    void release_one();

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t available_;
};

} // namespace mpt
