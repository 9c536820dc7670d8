#include "mpt/range_reader.hpp"

#include "mpt/errors.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mpt {

RangeReader::RangeReader(std::shared_ptr<const std::vector<char>> buffer, std::filesystem::path path,
                         std::uint64_t offset, std::uint64_t length)
    : buffer_(std::move(buffer)), path_(std::move(path)), offset_(offset), length_(length) {}

RangeReader RangeReader::over_buffer(std::shared_ptr<const std::vector<char>> buffer,
                                     std::uint64_t offset, std::uint64_t length) {
    if (!buffer) {
        throw std::invalid_argument("buffer range requires a buffer");
    }
    if (offset > buffer->size() || length > buffer->size() - offset) {
        throw std::out_of_range("range exceeds buffer size");
    }
    return RangeReader(std::move(buffer), {}, offset, length);
}

RangeReader RangeReader::over_file(std::filesystem::path path, std::uint64_t offset,
                                   std::uint64_t length) {
    return RangeReader(nullptr, std::move(path), offset, length);
}

RangeReader::RangeReader(RangeReader &&other) noexcept
    : buffer_(std::move(other.buffer_)), path_(std::move(other.path_)), fd_(other.fd_),
      offset_(other.offset_), length_(other.length_), consumed_(other.consumed_),
      digest_(other.digest_) {
    other.fd_ = -1;
}

RangeReader &RangeReader::operator=(RangeReader &&other) noexcept {
    if (this != &other) {
        close_file();
        buffer_ = std::move(other.buffer_);
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        offset_ = other.offset_;
        length_ = other.length_;
        consumed_ = other.consumed_;
        digest_ = other.digest_;
        other.fd_ = -1;
    }
    return *this;
}

RangeReader::~RangeReader() { close_file(); }

void RangeReader::open_file() {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        std::ostringstream oss;
        oss << "failed to open '" << path_.string() << "': " << std::strerror(errno);
        throw TransferError(ErrorKind::kSourceUnreadable, oss.str());
    }
}

void RangeReader::close_file() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::size_t RangeReader::read(char *out, std::size_t size) {
    const auto to_copy = static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining()));
    if (to_copy == 0) {
        return 0;
    }
    if (buffer_) {
        std::memcpy(out, buffer_->data() + offset_ + consumed_, to_copy);
        digest_.update(out, to_copy);
        consumed_ += to_copy;
        return to_copy;
    }
    if (fd_ < 0) {
        open_file();
    }
    while (true) {
        ssize_t rc = ::pread(fd_, out, to_copy, static_cast<off_t>(offset_ + consumed_));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::ostringstream oss;
            oss << "read of '" << path_.string() << "' failed: " << std::strerror(errno);
            throw TransferError(ErrorKind::kSourceUnreadable, oss.str());
        }
        if (rc == 0) {
            std::ostringstream oss;
            oss << "unexpected EOF in '" << path_.string() << "' at offset " << offset_ + consumed_;
            throw TransferError(ErrorKind::kSourceMutated, oss.str());
        }
        const auto got = static_cast<std::size_t>(rc);
        digest_.update(out, got);
        consumed_ += got;
        return got;
    }
}

std::vector<char> RangeReader::read_all() {
    std::vector<char> data(static_cast<std::size_t>(remaining()));
    std::size_t filled = 0;
    while (filled < data.size()) {
        filled += read(data.data() + filled, data.size() - filled);
    }
    return data;
}

std::optional<std::string_view> RangeReader::contiguous_view() const {
    if (!buffer_) {
        return std::nullopt;
    }
    return std::string_view(buffer_->data() + offset_ + consumed_,
                            static_cast<std::size_t>(remaining()));
}

void RangeReader::consume(std::size_t size) {
    if (!buffer_) {
        throw std::logic_error("consume() requires a buffer-backed reader");
    }
    if (size > remaining()) {
        throw std::out_of_range("consume() past the end of the range");
    }
    digest_.update(buffer_->data() + offset_ + consumed_, size);
    consumed_ += size;
}

} // namespace mpt
