#include "mpt/cancellation.hpp"

#include <thread>
#include <utility>
#include <vector>

namespace mpt {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    std::optional<SteadyClock::time_point> deadline;
    std::map<std::uint64_t, std::function<void()>> callbacks;
    std::uint64_t next_id{1};

    bool expired_locked() const {
        return cancelled || (deadline && SteadyClock::now() >= *deadline);
    }
};

} // namespace detail

CancellationRegistration::CancellationRegistration(std::weak_ptr<detail::CancellationState> state,
                                                   std::uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationRegistration::~CancellationRegistration() { reset(); }

CancellationRegistration::CancellationRegistration(CancellationRegistration &&other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancellationRegistration &CancellationRegistration::operator=(CancellationRegistration &&other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (id_ == 0) {
        return;
    }
    if (auto state = state_.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationToken::cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->expired_locked();
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    auto until = SteadyClock::now() + timeout;
    if (state_->deadline && *state_->deadline < until) {
        until = *state_->deadline;
    }
    state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
    return state_->expired_locked();
}

std::optional<SteadyClock::time_point> CancellationToken::deadline() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const {
    if (!state_) {
        return {};
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }
    callback();
    return {};
}

CancellationSource::CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken &parent) : CancellationSource() {
    state_->deadline = parent.deadline();
    std::weak_ptr<detail::CancellationState> weak = state_;
    parent_link_ = parent.on_cancel([weak] {
        if (auto state = weak.lock()) {
            CancellationSource::cancel_state(*state);
        }
    });
}

void CancellationSource::cancel() {
    if (state_) {
        cancel_state(*state_);
    }
}

void CancellationSource::cancel_state(detail::CancellationState &state) {
    std::map<std::uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.cancelled) {
            return;
        }
        state.cancelled = true;
        callbacks.swap(state.callbacks);
    }
    state.cv.notify_all();
    for (auto &entry : callbacks) {
        entry.second();
    }
}

void CancellationSource::set_deadline(SteadyClock::time_point deadline) {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->deadline && *state_->deadline <= deadline) {
            return;
        }
        state_->deadline = deadline;
    }
    state_->cv.notify_all();
}

bool CancellationSource::cancelled() const { return token().cancelled(); }

CancellationToken CancellationSource::token() const { return CancellationToken(state_); }

} // namespace mpt
