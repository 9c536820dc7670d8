#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace mpt {

using SteadyClock = std::chrono::steady_clock;

namespace detail {
struct CancellationState;
} // namespace detail

// Keeps a cancellation callback registered; unregisters on destruction.
class CancellationRegistration {
  public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, std::uint64_t id);
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration &&other) noexcept;
    CancellationRegistration &operator=(CancellationRegistration &&other) noexcept;

    CancellationRegistration(const CancellationRegistration &) = delete;
    CancellationRegistration &operator=(const CancellationRegistration &) = delete;

  private:
    void reset();

    std::weak_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

// Observer side of a cancellation signal. A default-constructed token is
// never cancelled. A token also reports cancelled once its deadline passes.
class CancellationToken {
  public:
    CancellationToken() = default;

    bool cancelled() const;

    // Blocks up to `timeout`; returns true as soon as the token is cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const;

    std::optional<SteadyClock::time_point> deadline() const;

    // Runs `callback` once on cancel(), or immediately if already cancelled.
    // Callbacks run outside internal locks on the cancelling thread. Deadline
    // expiry alone does not run callbacks; waiters bound themselves by deadline().
    CancellationRegistration on_cancel(std::function<void()> callback) const;

  private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
  public:
    CancellationSource();

    // Linked source: cancelled whenever `parent` is, and inherits its deadline.
    explicit CancellationSource(const CancellationToken &parent);

    // A moved-from source ignores cancel() and set_deadline() and hands out
    // tokens that never cancel.
    CancellationSource(CancellationSource &&) noexcept = default;
    CancellationSource &operator=(CancellationSource &&) noexcept = default;

    void cancel();

    // Tightens the deadline; a later deadline than the current one is ignored.
    void set_deadline(SteadyClock::time_point deadline);

    bool cancelled() const;

    CancellationToken token() const;

  private:
    static void cancel_state(detail::CancellationState &state);

    std::shared_ptr<detail::CancellationState> state_;
    CancellationRegistration parent_link_;
};

} // namespace mpt
