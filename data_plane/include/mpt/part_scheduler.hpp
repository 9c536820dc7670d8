#pragma once

#include "mpt/cancellation.hpp"
#include "mpt/concurrency_limiter.hpp"
#include "mpt/errors.hpp"
#include "mpt/partition_planner.hpp"
#include "mpt/progress.hpp"
#include "mpt/range_reader.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mpt {

struct SchedulerConfig {
    std::size_t concurrency_limit{8};
    std::uint32_t max_attempts{3};
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{5000};
    double backoff_multiplier{2.0};

    // Throws std::invalid_argument.
    void validate() const;

    // Delay before retrying after the given (1-based) failed attempt.
    std::chrono::milliseconds backoff_for(std::uint32_t failed_attempt) const;
};

enum class PartState { kPending, kInFlight, kRetrying, kSucceeded, kFailed };

enum class TransferPhase { kPlanning, kRunning, kCompleted, kAborting, kAborted, kFailed };

const char *to_string(PartState state) noexcept;
const char *to_string(TransferPhase phase) noexcept;

struct PartJob {
    PartSpec spec;
    std::uint32_t attempt;
    // Set for uploads; downloads write into the destination instead.
    std::optional<RangeReader> reader;
};

struct PartResult {
    std::uint32_t part_number{0};
    std::string remote_identifier;
    std::optional<std::uint32_t> checksum;
    std::uint64_t bytes_transferred{0};
    std::uint32_t attempts{0};
};

struct TransferState {
    PartPlan plan;
    std::map<std::uint32_t, PartResult> completed;
    std::set<std::uint32_t> in_flight;
    std::map<std::uint32_t, PartState> parts;
    bool cancelled{false};
    TransferPhase phase{TransferPhase::kPlanning};
};

// Builds the job for one attempt of a part; called again, with a fresh
// reader, for every retry.
using JobFactory = std::function<PartJob(const PartSpec &spec, std::uint32_t attempt)>;

// Performs one attempt. Throws TransferError to report failure; any other
// exception counts as a transport error.
using PartExecutor = std::function<PartResult(PartJob &job, const CancellationToken &cancel)>;

struct SchedulerHooks {
    // Runs before every attempt; throwing fails the attempt.
    std::function<void(const PartSpec &spec, std::uint32_t attempt)> before_attempt;
    // Runs exactly once on the abort path, after every worker has stopped.
    std::function<void()> on_abort;
    ProgressDispatcher *progress{nullptr};
};

// Runs the parts of one transfer with bounded concurrency. Retryable part
// failures are retried with exponential backoff; the first fatal failure (or
// exhausted retries, or cancellation) cancels the remaining parts, runs the
// abort hook and surfaces as a single TransferError. One run at a time.
class PartScheduler {
  public:
    explicit PartScheduler(SchedulerConfig config, ConcurrencyLimiter *budget = nullptr);

    // Returns the results in ascending part number order.
    std::vector<PartResult> run(const PartPlan &plan, const JobFactory &make_job,
                                const PartExecutor &execute, const CancellationToken &cancel,
                                const SchedulerHooks &hooks = {});

    TransferState state() const;

    TransferPhase phase() const;

    // Highest number of attempts that ran at the same time during the last run.
    std::size_t peak_in_flight() const;

    const SchedulerConfig &config() const noexcept { return config_; }

  private:
    struct RunContext;

    void worker_thread(RunContext &ctx);
    bool next_part(RunContext &ctx, PartSpec &spec);
    void run_part(RunContext &ctx, const PartSpec &spec);
    void begin_attempt(const PartSpec &spec);
    void end_attempt();
    void record_success(RunContext &ctx, PartResult result);
    void record_failure(RunContext &ctx, const PartSpec &spec, std::uint32_t attempt,
                        const TransferError &error);
    void record_cancelled(const PartSpec &spec);
    void set_part_state(const PartSpec &spec, PartState state);

    SchedulerConfig config_;
    ConcurrencyLimiter *budget_;

    mutable std::mutex mutex_;
    TransferState state_;
    std::deque<std::size_t> pending_;
    std::optional<TransferError> failure_;
    std::size_t running_{0};
    std::size_t peak_{0};
};

} // namespace mpt
