#pragma once

#include "mpt/source.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mpt {

constexpr std::uint64_t kMiB = 1024ull * 1024ull;
constexpr std::uint64_t kGiB = 1024ull * kMiB;

struct PlannerConfig {
    std::uint64_t min_part_size{8 * kMiB};
    std::uint64_t max_part_size{5 * kGiB};
    std::uint32_t max_parts{10000};
    // Desired part count; 0 leaves the choice to the size limits.
    std::uint32_t target_part_count_hint{0};
    // Objects up to this size go out as one simple operation.
    std::uint64_t single_operation_threshold{16 * kMiB};

    // Throws std::invalid_argument.
    void validate() const;
};

struct PartSpec {
    std::uint32_t part_number;
    std::uint64_t offset;
    std::uint64_t length;

    bool operator==(const PartSpec &other) const {
        return part_number == other.part_number && offset == other.offset && length == other.length;
    }
};

struct PartPlan {
    std::vector<PartSpec> parts;
    // One part sent as a single non-multipart operation.
    bool simple{false};
    std::uint64_t total_size{0};
    std::uint64_t part_size{0};

    std::size_t size() const noexcept { return parts.size(); }

    bool operator==(const PartPlan &other) const {
        return parts == other.parts && simple == other.simple && total_size == other.total_size &&
               part_size == other.part_size;
    }
};

class PartitionPlanner {
  public:
    explicit PartitionPlanner(PlannerConfig config);

    // Throws TransferError(kSizeUnsupported) when the object cannot fit in
    // max_parts parts of at most max_part_size bytes.
    PartPlan plan(std::uint64_t total_size) const;

    // Throws TransferError(kConfiguration) for an unbounded or inexact hint.
    PartPlan plan(const SizeHint &hint) const;

    const PlannerConfig &config() const noexcept { return config_; }

  private:
    PlannerConfig config_;
};

} // namespace mpt
