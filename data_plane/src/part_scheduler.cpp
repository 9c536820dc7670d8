#include "mpt/part_scheduler.hpp"

#include "mpt/log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace mpt {

struct PartScheduler::RunContext {
    const PartPlan &plan;
    const JobFactory &make_job;
    const PartExecutor &execute;
    const SchedulerHooks &hooks;
    // Linked to the caller's token; fired on the first fatal part failure.
    CancellationSource abort;
};

void SchedulerConfig::validate() const {
    if (concurrency_limit == 0) {
        throw std::invalid_argument("concurrency limit must be > 0");
    }
    if (max_attempts == 0) {
        throw std::invalid_argument("max attempts must be > 0");
    }
    if (initial_backoff.count() < 0 || max_backoff < initial_backoff) {
        throw std::invalid_argument("backoff bounds must satisfy 0 <= initial <= max");
    }
    if (!(backoff_multiplier >= 1.0)) {
        throw std::invalid_argument("backoff multiplier must be >= 1");
    }
}

std::chrono::milliseconds SchedulerConfig::backoff_for(std::uint32_t failed_attempt) const {
    const auto exponent = failed_attempt > 0 ? failed_attempt - 1 : 0;
    const double delay = static_cast<double>(initial_backoff.count()) *
                         std::pow(backoff_multiplier, static_cast<double>(exponent));
    const double capped = std::min(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

const char *to_string(PartState state) noexcept {
    switch (state) {
    case PartState::kPending:
        return "Pending";
    case PartState::kInFlight:
        return "InFlight";
    case PartState::kRetrying:
        return "Retrying";
    case PartState::kSucceeded:
        return "Succeeded";
    case PartState::kFailed:
        return "Failed";
    }
    return "Unknown";
}

const char *to_string(TransferPhase phase) noexcept {
    switch (phase) {
    case TransferPhase::kPlanning:
        return "Planning";
    case TransferPhase::kRunning:
        return "Running";
    case TransferPhase::kCompleted:
        return "Completed";
    case TransferPhase::kAborting:
        return "Aborting";
    case TransferPhase::kAborted:
        return "Aborted";
    case TransferPhase::kFailed:
        return "Failed";
    }
    return "Unknown";
}

PartScheduler::PartScheduler(SchedulerConfig config, ConcurrencyLimiter *budget)
    : config_(config), budget_(budget) {
    config_.validate();
}

std::vector<PartResult> PartScheduler::run(const PartPlan &plan, const JobFactory &make_job,
                                           const PartExecutor &execute, const CancellationToken &cancel,
                                           const SchedulerHooks &hooks) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = TransferState{};
        state_.plan = plan;
        state_.phase = TransferPhase::kRunning;
        pending_.clear();
        for (std::size_t i = 0; i < plan.parts.size(); ++i) {
            state_.parts[plan.parts[i].part_number] = PartState::kPending;
            pending_.push_back(i);
        }
        failure_.reset();
        running_ = 0;
        peak_ = 0;
    }

    RunContext ctx{plan, make_job, execute, hooks, CancellationSource(cancel)};
    const auto workers = std::min(config_.concurrency_limit, plan.parts.size());
    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (std::size_t i = 0; i < workers; ++i) {
            threads.emplace_back(&PartScheduler::worker_thread, this, std::ref(ctx));
        }
    } catch (const std::system_error &) {
        ctx.abort.cancel();
        for (auto &thread : threads) {
            thread.join();
        }
        throw;
    }
    for (auto &thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (!failure_ && state_.completed.size() == plan.parts.size()) {
        state_.phase = TransferPhase::kCompleted;
        std::vector<PartResult> results;
        results.reserve(state_.completed.size());
        for (const auto &entry : state_.completed) {
            results.push_back(entry.second);
        }
        return results;
    }

    state_.phase = TransferPhase::kAborting;
    state_.cancelled = true;
    TransferError error = failure_ ? *failure_
                                   : TransferError(ErrorKind::kCancelled,
                                                   cancel.deadline() && SteadyClock::now() >= *cancel.deadline()
                                                       ? "transfer deadline exceeded"
                                                       : "transfer cancelled");
    const auto done = state_.completed.size();
    lock.unlock();

    MPT_LOG(kWarning) << "aborting transfer after " << done << " of " << plan.parts.size()
                      << " parts: " << error.what();
    bool aborted = true;
    if (hooks.on_abort) {
        try {
            hooks.on_abort();
        } catch (const std::exception &e) {
            MPT_LOG(kError) << "abort cleanup failed: " << e.what();
            aborted = false;
        }
    }

    lock.lock();
    state_.phase = aborted ? TransferPhase::kAborted : TransferPhase::kFailed;
    throw error;
}

void PartScheduler::worker_thread(RunContext &ctx) {
    PartSpec spec{};
    while (next_part(ctx, spec)) {
        run_part(ctx, spec);
    }
}

bool PartScheduler::next_part(RunContext &ctx, PartSpec &spec) {
    const auto token = ctx.abort.token();
    if (token.cancelled()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (failure_ || pending_.empty()) {
        return false;
    }
    spec = ctx.plan.parts[pending_.front()];
    pending_.pop_front();
    state_.in_flight.insert(spec.part_number);
    state_.parts[spec.part_number] = PartState::kInFlight;
    return true;
}

void PartScheduler::run_part(RunContext &ctx, const PartSpec &spec) {
    const auto token = ctx.abort.token();
    for (std::uint32_t attempt = 1;; ++attempt) {
        std::optional<TransferError> error;
        std::optional<PartResult> result;
        {
            ConcurrencyLimiter::Permit permit;
            if (budget_ != nullptr) {
                permit = budget_->acquire(token);
                if (!permit) {
                    record_cancelled(spec);
                    return;
                }
            }
            if (token.cancelled()) {
                record_cancelled(spec);
                return;
            }

            begin_attempt(spec);
            try {
                if (ctx.hooks.before_attempt) {
                    ctx.hooks.before_attempt(spec, attempt);
                }
                PartJob job = ctx.make_job(spec, attempt);
                result = ctx.execute(job, token);
            } catch (const TransferError &e) {
                error = e;
            } catch (const std::exception &e) {
                error = TransferError(ErrorKind::kPartTransportError, e.what(), spec.part_number);
            }
            end_attempt();
        }

        if (result) {
            result->part_number = spec.part_number;
            result->attempts = attempt;
            record_success(ctx, std::move(*result));
            return;
        }

        // Failures observed after cancellation are fallout of the abort, not causes.
        if (token.cancelled()) {
            record_cancelled(spec);
            return;
        }
        if (!error->retryable() || attempt >= config_.max_attempts) {
            record_failure(ctx, spec, attempt, *error);
            return;
        }

        const auto delay = config_.backoff_for(attempt);
        MPT_LOG(kWarning) << "part " << spec.part_number << " attempt " << attempt << '/'
                          << config_.max_attempts << " failed, retrying in " << delay.count()
                          << "ms: " << error->what();
        set_part_state(spec, PartState::kRetrying);
        if (token.wait_for(delay)) {
            record_cancelled(spec);
            return;
        }
        set_part_state(spec, PartState::kInFlight);
    }
}

void PartScheduler::begin_attempt(const PartSpec &spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++running_;
    peak_ = std::max(peak_, running_);
    state_.parts[spec.part_number] = PartState::kInFlight;
}

void PartScheduler::end_attempt() {
    std::lock_guard<std::mutex> lock(mutex_);
    --running_;
}

void PartScheduler::record_success(RunContext &ctx, PartResult result) {
    const auto part_number = result.part_number;
    const auto bytes = result.bytes_transferred;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.in_flight.erase(part_number);
        state_.parts[part_number] = PartState::kSucceeded;
        state_.completed[part_number] = std::move(result);
    }
    MPT_LOG(kDebug) << "part " << part_number << " done (" << bytes << " bytes)";
    if (ctx.hooks.progress != nullptr) {
        ctx.hooks.progress->post(part_number, bytes);
    }
}

void PartScheduler::record_failure(RunContext &ctx, const PartSpec &spec, std::uint32_t attempt,
                                   const TransferError &error) {
    std::ostringstream message;
    message << "part failed after " << attempt << (attempt == 1 ? " attempt" : " attempts");
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.in_flight.erase(spec.part_number);
        state_.parts[spec.part_number] = PartState::kFailed;
        if (!failure_) {
            failure_ = error.for_part(spec.part_number, message.str());
            state_.phase = TransferPhase::kAborting;
            state_.cancelled = true;
            first = true;
        }
    }
    if (first) {
        MPT_LOG(kError) << "part " << spec.part_number << " failed: " << error.what();
    }
    ctx.abort.cancel();
}

void PartScheduler::record_cancelled(const PartSpec &spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.in_flight.erase(spec.part_number);
    state_.parts[spec.part_number] = PartState::kPending;
    state_.cancelled = true;
}

void PartScheduler::set_part_state(const PartSpec &spec, PartState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.parts[spec.part_number] = state;
}

TransferState PartScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TransferPhase PartScheduler::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.phase;
}

std::size_t PartScheduler::peak_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

} // namespace mpt
