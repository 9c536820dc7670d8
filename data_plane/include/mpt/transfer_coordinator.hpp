#pragma once

#include "mpt/cancellation.hpp"
#include "mpt/checksum_manager.hpp"
#include "mpt/concurrency_limiter.hpp"
#include "mpt/part_scheduler.hpp"
#include "mpt/partition_planner.hpp"
#include "mpt/progress.hpp"
#include "mpt/source.hpp"
#include "mpt/transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>
#include <string>

namespace mpt {

struct TransferConfig {
    PlannerConfig planner;
    SchedulerConfig scheduler;
    ChecksumPolicy checksum;
    // Once elapsed, the transfer ends exactly as if the caller had cancelled it.
    std::optional<std::chrono::milliseconds> timeout;

    // Throws std::invalid_argument.
    void validate() const;
};

struct TransferSummary {
    std::uint64_t bytes_transferred{0};
    std::size_t part_count{0};
    std::optional<std::uint32_t> checksum;
    std::string object_identifier;
    bool multipart{false};
};

// In-progress asynchronous transfer.
class TransferHandle {
  public:
    TransferHandle(CancellationSource cancel, std::future<TransferSummary> result);

    TransferHandle(TransferHandle &&) noexcept = default;
    TransferHandle &operator=(TransferHandle &&) noexcept = default;

    void cancel();

    // Blocks until the transfer ends; rethrows its TransferError.
    TransferSummary wait();

    bool ready() const;

  private:
    CancellationSource cancel_;
    std::future<TransferSummary> result_;
};

// Drives one transfer at a time per call: open the source, plan it, run the
// parts through the scheduler and close the remote session whatever happens.
// A coordinator may run several transfers concurrently; each call owns its
// own source, plan and scheduler. Transfers started from coordinators that
// share a ConcurrencyLimiter share its budget.
class TransferCoordinator {
  public:
    TransferCoordinator(ObjectTransport &transport, TransferConfig config,
                        ConcurrencyLimiter *budget = nullptr);

    // Throws TransferError.
    TransferSummary execute(SourceDescriptor source, const ObjectLocation &destination,
                            const CancellationToken &cancel = {}, ProgressSink *progress = nullptr);

    // Ranged download of `object` into `destination`. Throws TransferError.
    TransferSummary download(const ObjectLocation &object, const std::filesystem::path &destination,
                             const CancellationToken &cancel = {}, ProgressSink *progress = nullptr);

    // The coordinator, and the sink when given, must outlive the handle's wait().
    TransferHandle start(SourceDescriptor source, ObjectLocation destination,
                         ProgressSink *progress = nullptr);

    TransferHandle start_download(ObjectLocation object, std::filesystem::path destination,
                                  ProgressSink *progress = nullptr);

    const TransferConfig &config() const noexcept { return config_; }

  private:
    TransferSummary upload_simple(const OpenedSource &source, const PartPlan &plan,
                                  const ObjectLocation &destination, const ChecksumManager &checksums,
                                  const CancellationToken &cancel, ProgressDispatcher &progress);

    TransferSummary upload_multipart(const OpenedSource &source, const PartPlan &plan,
                                     const ObjectLocation &destination, const ChecksumManager &checksums,
                                     const CancellationToken &cancel, ProgressDispatcher &progress);

    CancellationSource transfer_scope(const CancellationToken &cancel) const;

    ObjectTransport &transport_;
    TransferConfig config_;
    PartitionPlanner planner_;
    ConcurrencyLimiter *budget_;
};

} // namespace mpt
