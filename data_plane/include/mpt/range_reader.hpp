#pragma once

#include "mpt/checksum.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace mpt {

// Bounded view of [offset, offset + length) of a source. Reads never go past
// the range. File-backed readers open a private descriptor on first read and
// close it on destruction. The CRC-32 of every byte handed out is tracked so
// the part digest is known once the reader is exhausted.
class RangeReader {
  public:
    static RangeReader over_buffer(std::shared_ptr<const std::vector<char>> buffer,
                                   std::uint64_t offset, std::uint64_t length);

    static RangeReader over_file(std::filesystem::path path, std::uint64_t offset,
                                 std::uint64_t length);

    RangeReader(RangeReader &&other) noexcept;
    RangeReader &operator=(RangeReader &&other) noexcept;
    ~RangeReader();

    RangeReader(const RangeReader &) = delete;
    RangeReader &operator=(const RangeReader &) = delete;

    // Copies up to `size` bytes; returns 0 once the range is exhausted.
    std::size_t read(char *out, std::size_t size);

    std::vector<char> read_all();

    // Zero-copy access to the unread bytes of a buffer-backed reader. Bytes
    // taken this way must be acknowledged with consume().
    std::optional<std::string_view> contiguous_view() const;

    void consume(std::size_t size);

    std::uint64_t offset() const noexcept { return offset_; }
    std::uint64_t length() const noexcept { return length_; }
    std::uint64_t remaining() const noexcept { return length_ - consumed_; }
    bool exhausted() const noexcept { return consumed_ == length_; }
    bool file_backed() const noexcept { return !buffer_; }

    std::uint32_t digest() const { return digest_.value(); }

  private:
    RangeReader(std::shared_ptr<const std::vector<char>> buffer, std::filesystem::path path,
                std::uint64_t offset, std::uint64_t length);

    void open_file();
    void close_file() noexcept;

    std::shared_ptr<const std::vector<char>> buffer_;
    std::filesystem::path path_;
    int fd_{-1};
    std::uint64_t offset_;
    std::uint64_t length_;
    std::uint64_t consumed_{0};
    Checksum::Crc32Accumulator digest_;
};

} // namespace mpt
