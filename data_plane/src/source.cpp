#include "mpt/source.hpp"

#include "mpt/checksum.hpp"
#include "mpt/errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mpt {

namespace {

constexpr std::size_t kChecksumBufferSize = 1u << 20;

TransferError unreadable(const std::filesystem::path &path, const std::string &what) {
    std::ostringstream oss;
    oss << what << " '" << path.string() << "': " << std::strerror(errno);
    return TransferError(ErrorKind::kSourceUnreadable, oss.str());
}

SourceFingerprint fingerprint_of(const struct stat &st) {
    SourceFingerprint fp;
    fp.file_size = static_cast<std::uint64_t>(st.st_size);
    fp.mtime_ns = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000 + st.st_mtim.tv_nsec;
    fp.inode = static_cast<std::uint64_t>(st.st_ino);
    return fp;
}

class FileDescriptor {
  public:
    explicit FileDescriptor(const std::filesystem::path &path)
        : fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
        if (fd_ < 0) {
            throw unreadable(path, "failed to open source");
        }
    }
    ~FileDescriptor() { ::close(fd_); }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    int get() const { return fd_; }

  private:
    int fd_;
};

std::uint32_t checksum_region(int fd, const std::filesystem::path &path, std::uint64_t offset,
                              std::uint64_t length) {
    Checksum::Crc32Accumulator accumulator;
    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(
        std::max<std::uint64_t>(length, 1), kChecksumBufferSize)));
    std::uint64_t done = 0;
    while (done < length) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), length - done));
        ssize_t rc = ::pread(fd, buffer.data(), want, static_cast<off_t>(offset + done));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw unreadable(path, "failed to read source");
        }
        if (rc == 0) {
            std::ostringstream oss;
            oss << "source '" << path.string() << "' ends at offset " << offset + done
                << ", expected " << length << " bytes from offset " << offset;
            throw TransferError(ErrorKind::kSourceUnreadable, oss.str());
        }
        accumulator.update(buffer.data(), static_cast<std::size_t>(rc));
        done += static_cast<std::uint64_t>(rc);
    }
    return accumulator.value();
}

} // namespace

SourceDescriptor buffer_source(std::vector<char> bytes) {
    const auto size = static_cast<std::uint64_t>(bytes.size());
    return InMemoryBuffer{std::make_shared<const std::vector<char>>(std::move(bytes)), size};
}

SourceDescriptor file_source(std::filesystem::path path, std::uint64_t start_offset,
                             std::optional<std::uint64_t> explicit_length) {
    return FileRegion{std::move(path), start_offset, explicit_length};
}

OpenedSource::OpenedSource(SourceDescriptor descriptor, SizeHint size_hint,
                           std::optional<std::uint32_t> checksum, SourceFingerprint fingerprint)
    : descriptor_(std::move(descriptor)), size_hint_(size_hint), checksum_(checksum),
      fingerprint_(fingerprint) {}

OpenedSource OpenedSource::open(SourceDescriptor descriptor) {
    if (auto *buffer = std::get_if<InMemoryBuffer>(&descriptor)) {
        if (!buffer->bytes) {
            buffer->bytes = std::make_shared<const std::vector<char>>();
        }
        if (buffer->known_length != buffer->bytes->size()) {
            std::ostringstream oss;
            oss << "buffer declares " << buffer->known_length << " bytes but holds "
                << buffer->bytes->size();
            throw TransferError(ErrorKind::kSourceUnreadable, oss.str());
        }
        const auto checksum = Checksum::crc32(*buffer->bytes);
        SourceFingerprint fp;
        fp.file_size = buffer->known_length;
        const auto hint = SizeHint::exact(buffer->known_length);
        return OpenedSource(std::move(descriptor), hint, checksum, fp);
    }

    auto &region = std::get<FileRegion>(descriptor);
    std::uint64_t length = 0;
    if (region.explicit_length) {
        length = *region.explicit_length;
    } else {
        struct stat st {};
        if (::stat(region.path.c_str(), &st) != 0) {
            throw unreadable(region.path, "failed to stat source");
        }
        if (!S_ISREG(st.st_mode)) {
            // Pipes and devices report no usable size.
            return OpenedSource(std::move(descriptor), SizeHint::unbounded(), std::nullopt, {});
        }
        const auto file_size = static_cast<std::uint64_t>(st.st_size);
        if (region.start_offset > file_size) {
            std::ostringstream oss;
            oss << "start offset " << region.start_offset << " is past the end of '"
                << region.path.string() << "' (" << file_size << " bytes)";
            throw TransferError(ErrorKind::kSourceUnreadable, oss.str());
        }
        length = file_size - region.start_offset;
    }

    FileDescriptor fd(region.path);
    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
        throw unreadable(region.path, "failed to stat source");
    }
    const auto checksum = checksum_region(fd.get(), region.path, region.start_offset, length);
    return OpenedSource(std::move(descriptor), SizeHint::exact(length), checksum, fingerprint_of(st));
}

std::uint64_t OpenedSource::length() const {
    if (!size_hint_.bounded()) {
        throw TransferError(ErrorKind::kConfiguration, "source size is unbounded");
    }
    return *size_hint_.upper_bound;
}

RangeReader OpenedSource::read_range(std::uint64_t offset, std::uint64_t length) const {
    const auto total = this->length();
    if (offset > total || length > total - offset) {
        std::ostringstream oss;
        oss << "range [" << offset << ", " << offset + length << ") exceeds source length " << total;
        throw std::out_of_range(oss.str());
    }
    if (const auto *buffer = std::get_if<InMemoryBuffer>(&descriptor_)) {
        return RangeReader::over_buffer(buffer->bytes, offset, length);
    }
    const auto &region = std::get<FileRegion>(descriptor_);
    return RangeReader::over_file(region.path, region.start_offset + offset, length);
}

SourceFingerprint OpenedSource::probe() const {
    const auto *region = std::get_if<FileRegion>(&descriptor_);
    if (region == nullptr) {
        return fingerprint_;
    }
    struct stat st {};
    if (::stat(region->path.c_str(), &st) != 0) {
        throw unreadable(region->path, "failed to stat source");
    }
    return fingerprint_of(st);
}

std::uint32_t OpenedSource::compute_checksum() const { return compute_range_checksum(0, length()); }

std::uint32_t OpenedSource::compute_range_checksum(std::uint64_t offset, std::uint64_t length) const {
    const auto total = this->length();
    if (offset > total || length > total - offset) {
        std::ostringstream oss;
        oss << "range [" << offset << ", " << offset + length << ") exceeds source length " << total;
        throw std::out_of_range(oss.str());
    }
    if (const auto *buffer = std::get_if<InMemoryBuffer>(&descriptor_)) {
        return Checksum::crc32(buffer->bytes->data() + offset, static_cast<std::size_t>(length));
    }
    const auto &region = std::get<FileRegion>(descriptor_);
    FileDescriptor fd(region.path);
    return checksum_region(fd.get(), region.path, region.start_offset + offset, length);
}

std::vector<std::filesystem::path> enumerate_files(const std::filesystem::path &root) {
    std::vector<std::filesystem::path> files;
    if (!std::filesystem::exists(root)) {
        throw std::invalid_argument("root does not exist: " + root.string());
    }
    if (std::filesystem::is_regular_file(root)) {
        files.push_back(root);
        return files;
    }
    for (auto const &entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace mpt
