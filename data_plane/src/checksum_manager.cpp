#include "mpt/checksum_manager.hpp"

#include "mpt/checksum.hpp"
#include "mpt/errors.hpp"
#include "mpt/log.hpp"

#include <sstream>

namespace mpt {

ChecksumManager::ChecksumManager(const OpenedSource &source, ChecksumPolicy policy)
    : source_(&source), policy_(policy), length_(source.length()), checksum_(source.checksum()),
      fingerprint_(source.fingerprint()) {}

ChecksumManager::ChecksumManager(std::uint64_t length, std::optional<std::uint32_t> checksum,
                                 ChecksumPolicy policy)
    : source_(nullptr), policy_(policy), length_(length), checksum_(checksum) {
    fingerprint_.file_size = length;
}

void ChecksumManager::snapshot_parts(const PartPlan &plan) {
    part_checksums_.clear();
    if (source_ == nullptr || !source_->file_backed() || !checksum_) {
        return;
    }
    try {
        for (const auto &spec : plan.parts) {
            part_checksums_[spec.part_number] = source_->compute_range_checksum(spec.offset, spec.length);
        }
    } catch (const TransferError &e) {
        throw TransferError(ErrorKind::kSourceMutated, "source can no longer be read in full", std::nullopt,
                            e.what());
    }
}

void ChecksumManager::validate_before_attempt(const PartSpec &spec) const {
    validate_before_attempt();
    if (policy_.verify_part_before_each_attempt && !policy_.verify_content_before_each_attempt) {
        validate_part_content(spec);
    }
}

void ChecksumManager::validate_before_attempt() const {
    validate_source();
    if (policy_.verify_content_before_each_attempt) {
        validate_source_content();
    }
}

void ChecksumManager::validate_before_finalize() const {
    validate_source();
    if (policy_.verify_content_before_finalize) {
        validate_source_content();
    }
}

void ChecksumManager::validate_source() const {
    if (source_ == nullptr || !source_->file_backed()) {
        return;
    }
    SourceFingerprint current;
    try {
        current = source_->probe();
    } catch (const TransferError &e) {
        throw TransferError(ErrorKind::kSourceMutated, "source is no longer accessible", std::nullopt,
                            e.what());
    }
    if (current != fingerprint_) {
        std::ostringstream oss;
        oss << "source metadata changed since open (size " << fingerprint_.file_size << " -> "
            << current.file_size << ")";
        MPT_LOG(kWarning) << oss.str();
        throw TransferError(ErrorKind::kSourceMutated, oss.str());
    }
}

void ChecksumManager::validate_source_content() const {
    if (source_ == nullptr || !checksum_) {
        return;
    }
    std::uint32_t current = 0;
    try {
        current = source_->compute_checksum();
    } catch (const TransferError &e) {
        throw TransferError(ErrorKind::kSourceMutated, "source can no longer be read in full",
                            std::nullopt, e.what());
    }
    if (current != *checksum_) {
        std::ostringstream oss;
        oss << "source checksum changed since open (" << Checksum::to_hex(*checksum_) << " -> "
            << Checksum::to_hex(current) << ")";
        MPT_LOG(kWarning) << oss.str();
        throw TransferError(ErrorKind::kSourceMutated, oss.str());
    }
}

void ChecksumManager::validate_part_content(const PartSpec &spec) const {
    if (part_checksums_.count(spec.part_number) == 0) {
        return;
    }
    std::uint32_t current = 0;
    try {
        current = source_->compute_range_checksum(spec.offset, spec.length);
    } catch (const TransferError &e) {
        throw TransferError(ErrorKind::kSourceMutated, "part range can no longer be read", spec.part_number,
                            e.what());
    }
    verify_part_source(spec, current);
}

void ChecksumManager::verify_part_source(const PartSpec &spec, std::uint32_t read_digest) const {
    auto it = part_checksums_.find(spec.part_number);
    if (it == part_checksums_.end() || it->second == read_digest) {
        return;
    }
    std::ostringstream oss;
    oss << "part content changed since open (" << Checksum::to_hex(it->second) << " -> "
        << Checksum::to_hex(read_digest) << ")";
    MPT_LOG(kWarning) << oss.str();
    throw TransferError(ErrorKind::kSourceMutated, oss.str(), spec.part_number);
}

void ChecksumManager::verify_part(const PartSpec &spec, std::uint32_t local_digest,
                                  const std::optional<std::uint32_t> &remote_digest) const {
    if (!remote_digest || *remote_digest == local_digest) {
        return;
    }
    std::ostringstream oss;
    oss << "transport digest " << Checksum::to_hex(*remote_digest) << " does not match local digest "
        << Checksum::to_hex(local_digest);
    throw TransferError(ErrorKind::kPartChecksumMismatch, oss.str(), spec.part_number);
}

void ChecksumManager::verify_object(std::uint32_t digest) const {
    if (!checksum_ || *checksum_ == digest) {
        return;
    }
    std::ostringstream oss;
    oss << "object checksum " << Checksum::to_hex(digest) << " does not match expected "
        << Checksum::to_hex(*checksum_);
    throw TransferError(ErrorKind::kSourceMutated, oss.str());
}

} // namespace mpt
