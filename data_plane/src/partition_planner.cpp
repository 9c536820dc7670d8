#include "mpt/partition_planner.hpp"

#include "mpt/errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace mpt {

namespace {

std::uint64_t ceil_div(std::uint64_t value, std::uint64_t divisor) {
    return value / divisor + (value % divisor != 0 ? 1 : 0);
}

} // namespace

void PlannerConfig::validate() const {
    if (min_part_size == 0) {
        throw std::invalid_argument("min part size must be > 0");
    }
    if (max_part_size < min_part_size) {
        throw std::invalid_argument("max part size must be >= min part size");
    }
    if (max_parts == 0) {
        throw std::invalid_argument("max parts must be > 0");
    }
    if (single_operation_threshold > max_part_size) {
        throw std::invalid_argument("single operation threshold must be <= max part size");
    }
}

PartitionPlanner::PartitionPlanner(PlannerConfig config) : config_(config) { config_.validate(); }

PartPlan PartitionPlanner::plan(std::uint64_t total_size) const {
    PartPlan plan;
    plan.total_size = total_size;

    if (total_size <= std::max(config_.min_part_size, config_.single_operation_threshold)) {
        plan.simple = true;
        plan.part_size = total_size;
        plan.parts.push_back(PartSpec{1, 0, total_size});
        return plan;
    }

    if (ceil_div(total_size, config_.max_part_size) > config_.max_parts) {
        std::ostringstream oss;
        oss << "object of " << total_size << " bytes needs more than " << config_.max_parts
            << " parts of at most " << config_.max_part_size << " bytes";
        throw TransferError(ErrorKind::kSizeUnsupported, oss.str());
    }

    std::uint64_t part_size = std::max(config_.min_part_size, ceil_div(total_size, config_.max_parts));
    if (config_.target_part_count_hint > 0) {
        part_size = std::max(part_size, ceil_div(total_size, config_.target_part_count_hint));
    }
    part_size = std::min(part_size, config_.max_part_size);

    const auto count = ceil_div(total_size, part_size);
    plan.part_size = part_size;
    plan.parts.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        const auto offset = i * part_size;
        const auto length = std::min<std::uint64_t>(part_size, total_size - offset);
        plan.parts.push_back(PartSpec{static_cast<std::uint32_t>(i + 1), offset, length});
    }
    return plan;
}

PartPlan PartitionPlanner::plan(const SizeHint &hint) const {
    if (!hint.bounded()) {
        throw TransferError(ErrorKind::kConfiguration,
                            "source size is unbounded; part count limits cannot be honored");
    }
    if (!hint.is_exact()) {
        std::ostringstream oss;
        oss << "source size is only known to lie in [" << hint.lower_bound << ", "
            << *hint.upper_bound << "]";
        throw TransferError(ErrorKind::kConfiguration, oss.str());
    }
    return plan(hint.lower_bound);
}

} // namespace mpt
