#pragma once

#include "mpt/range_reader.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace mpt {

struct SizeHint {
    std::uint64_t lower_bound{0};
    std::optional<std::uint64_t> upper_bound;

    static SizeHint exact(std::uint64_t size) { return SizeHint{size, size}; }

    static SizeHint unbounded(std::uint64_t lower_bound = 0) { return SizeHint{lower_bound, std::nullopt}; }

    bool bounded() const noexcept { return upper_bound.has_value(); }

    bool is_exact() const noexcept { return upper_bound && *upper_bound == lower_bound; }
};

struct InMemoryBuffer {
    std::shared_ptr<const std::vector<char>> bytes;
    std::uint64_t known_length{0};
};

struct FileRegion {
    std::filesystem::path path;
    std::uint64_t start_offset{0};
    // When set, the size is not derived from the file's metadata. open() still
    // fstat()s the descriptor once to record the fingerprint used for
    // mutation checks.
    std::optional<std::uint64_t> explicit_length;
};

using SourceDescriptor = std::variant<InMemoryBuffer, FileRegion>;

SourceDescriptor buffer_source(std::vector<char> bytes);

SourceDescriptor file_source(std::filesystem::path path, std::uint64_t start_offset = 0,
                             std::optional<std::uint64_t> explicit_length = std::nullopt);

// Metadata observed for a source; any difference from the value cached at
// open time means the source changed underneath the transfer.
struct SourceFingerprint {
    std::uint64_t file_size{0};
    std::optional<std::int64_t> mtime_ns;
    std::optional<std::uint64_t> inode;

    bool operator==(const SourceFingerprint &other) const {
        return file_size == other.file_size && mtime_ns == other.mtime_ns && inode == other.inode;
    }
    bool operator!=(const SourceFingerprint &other) const { return !(*this == other); }
};

// A source after open(): size, checksum and fingerprint are fixed here and
// never re-probed implicitly.
class OpenedSource {
  public:
    // Throws TransferError(kSourceUnreadable).
    static OpenedSource open(SourceDescriptor descriptor);

    const SourceDescriptor &descriptor() const noexcept { return descriptor_; }

    SizeHint size_hint() const noexcept { return size_hint_; }

    // Requires a bounded size hint.
    std::uint64_t length() const;

    std::optional<std::uint32_t> checksum() const noexcept { return checksum_; }

    const SourceFingerprint &fingerprint() const noexcept { return fingerprint_; }

    bool file_backed() const noexcept { return std::holds_alternative<FileRegion>(descriptor_); }

    // Throws std::out_of_range for ranges outside [0, length()).
    RangeReader read_range(std::uint64_t offset, std::uint64_t length) const;

    // Stats the file again; buffer sources return the cached fingerprint.
    SourceFingerprint probe() const;

    // Re-reads the whole region and returns its current CRC-32.
    std::uint32_t compute_checksum() const;

    // Same for [offset, offset + length) of the region. Throws
    // std::out_of_range like read_range().
    std::uint32_t compute_range_checksum(std::uint64_t offset, std::uint64_t length) const;

  private:
    OpenedSource(SourceDescriptor descriptor, SizeHint size_hint,
                 std::optional<std::uint32_t> checksum, SourceFingerprint fingerprint);

    SourceDescriptor descriptor_;
    SizeHint size_hint_;
    std::optional<std::uint32_t> checksum_;
    SourceFingerprint fingerprint_;
};

std::vector<std::filesystem::path> enumerate_files(const std::filesystem::path &root);

} // namespace mpt
