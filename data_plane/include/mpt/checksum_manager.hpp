#pragma once

#include "mpt/partition_planner.hpp"
#include "mpt/source.hpp"

#include <cstdint>
#include <map>
#include <optional>

namespace mpt {

struct ChecksumPolicy {
    // Re-read the part's own range before every attempt and compare it with
    // the digest recorded by snapshot_parts(). Metadata is re-probed either way.
    bool verify_part_before_each_attempt{true};
    // Re-read the whole source before every part attempt.
    bool verify_content_before_each_attempt{false};
    // Re-read the whole source once before the transfer is finalized.
    bool verify_content_before_finalize{true};
};

// Snapshot of a source (or of a remote object, for downloads) taken at plan
// time. Every validation compares against this snapshot and throws
// TransferError(kSourceMutated) on drift.
class ChecksumManager {
  public:
    ChecksumManager(const OpenedSource &source, ChecksumPolicy policy = {});

    // Remote object snapshot; there is no local source to re-probe.
    ChecksumManager(std::uint64_t length, std::optional<std::uint32_t> checksum,
                    ChecksumPolicy policy = {});

    // Records the digest of every part range of a file-backed source.
    // Buffer sources are immutable and remote snapshots have no local bytes,
    // so neither records anything.
    void snapshot_parts(const PartPlan &plan);

    void validate_before_attempt() const;

    // Whole-source checks above plus the part's range against its snapshot.
    void validate_before_attempt(const PartSpec &spec) const;

    void validate_before_finalize() const;

    // Cheap check: size and file metadata.
    void validate_source() const;

    // Full re-read of the source region.
    void validate_source_content() const;

    // Throws a retryable TransferError(kPartChecksumMismatch) when the
    // transport reported a digest different from the local one.
    void verify_part(const PartSpec &spec, std::uint32_t local_digest,
                     const std::optional<std::uint32_t> &remote_digest) const;

    // Re-reads the part's range. No-op for parts without a snapshot.
    void validate_part_content(const PartSpec &spec) const;

    // Throws TransferError(kSourceMutated) when the bytes a transport read
    // for a part differ from the snapshot taken for it.
    void verify_part_source(const PartSpec &spec, std::uint32_t read_digest) const;

    // For downloads: compares the digest of the assembled object.
    void verify_object(std::uint32_t digest) const;

    std::uint64_t baseline_length() const noexcept { return length_; }

    std::optional<std::uint32_t> baseline_checksum() const noexcept { return checksum_; }

  private:
    const OpenedSource *source_;
    ChecksumPolicy policy_;
    std::uint64_t length_;
    std::optional<std::uint32_t> checksum_;
    SourceFingerprint fingerprint_;
    std::map<std::uint32_t, std::uint32_t> part_checksums_;
};

} // namespace mpt
