#include "mpt/local_object_store.hpp"

#include "mpt/checksum.hpp"
#include "mpt/errors.hpp"
#include "mpt/log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace mpt {

namespace {

constexpr std::size_t kBufferSize = 1024 * 1024;

TransferError io_error(ErrorKind kind, const std::string &what, const std::filesystem::path &path) {
    std::ostringstream oss;
    oss << what << " '" << path.string() << "': " << std::strerror(errno);
    return TransferError(kind, oss.str());
}

class ScopedFd {
  public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;

    int get() const { return fd_; }

    // close() reports deferred write errors, so it is checked on the success path.
    bool close() {
        int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0;
    }

  private:
    int fd_;
};

int open_file_for_read(const std::filesystem::path &path, ErrorKind kind) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw io_error(kind, "failed to open", path);
    }
    return fd;
}

int open_file_for_write(const std::filesystem::path &path, ErrorKind kind) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw TransferError(kind, "failed to create '" + path.parent_path().string() + "': " + ec.message());
    }
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw io_error(kind, "failed to open", path);
    }
    return fd;
}

void write_all(int fd, const char *data, std::size_t length, const std::filesystem::path &path,
               ErrorKind kind) {
    std::size_t written = 0;
    while (written < length) {
        ssize_t rc = ::write(fd, data + written, length - written);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw io_error(kind, "write failed for", path);
        }
        written += static_cast<std::size_t>(rc);
    }
}

std::size_t pread_some(int fd, char *out, std::size_t length, std::uint64_t offset,
                       const std::filesystem::path &path, ErrorKind kind) {
    while (true) {
        ssize_t rc = ::pread(fd, out, length, static_cast<off_t>(offset));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw io_error(kind, "read failed for", path);
        }
        return static_cast<std::size_t>(rc);
    }
}

void remove_quietly(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        MPT_LOG(kWarning) << "failed to remove '" << path.string() << "': " << ec.message();
    }
}

// Streams the reader into `target` through a temporary sibling, renaming it
// into place only once every byte is on disk.
std::uint32_t store_reader(RangeReader &reader, const std::filesystem::path &target,
                           const CancellationToken &cancel, ErrorKind kind) {
    auto temp = target;
    temp += ".tmp";
    Checksum::Crc32Accumulator digest;
    try {
        ScopedFd fd(open_file_for_write(temp, kind));
        // Buffer-backed readers are written straight from their memory.
        std::vector<char> buffer(reader.file_backed() ? kBufferSize : 0);
        while (!reader.exhausted()) {
            if (cancel.cancelled()) {
                throw TransferError(ErrorKind::kCancelled, "upload cancelled");
            }
            if (auto view = reader.contiguous_view()) {
                const auto chunk = std::min(view->size(), kBufferSize);
                write_all(fd.get(), view->data(), chunk, temp, kind);
                digest.update(view->data(), chunk);
                reader.consume(chunk);
                continue;
            }
            std::size_t got = reader.read(buffer.data(), buffer.size());
            write_all(fd.get(), buffer.data(), got, temp, kind);
            digest.update(buffer.data(), got);
        }
        if (!fd.close()) {
            throw io_error(kind, "close failed for", temp);
        }
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec) {
            throw TransferError(kind, "failed to rename '" + temp.string() + "': " + ec.message());
        }
    } catch (const TransferError &) {
        remove_quietly(temp);
        throw;
    }
    return digest.value();
}

std::string part_file_name(std::uint32_t part_number) {
    std::ostringstream oss;
    oss << part_number << ".part";
    return oss.str();
}

} // namespace

LocalObjectStore::LocalObjectStore(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

std::filesystem::path LocalObjectStore::object_path(const ObjectLocation &object) const {
    if (object.bucket.empty() || object.key.empty()) {
        throw std::invalid_argument("object location needs a bucket and a key");
    }
    const std::filesystem::path relative = std::filesystem::path(object.bucket) / object.key;
    for (const auto &component : relative) {
        if (component == ".." || component == "." || component == ".sessions") {
            throw std::invalid_argument("invalid object location: " + relative.string());
        }
    }
    if (relative.is_absolute()) {
        throw std::invalid_argument("invalid object location: " + relative.string());
    }
    return root_ / relative;
}

std::string LocalObjectStore::start_session(const ObjectLocation &destination) {
    const auto target = object_path(destination);
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream id;
    id << "mpu-" << ::getpid() << '-' << next_session_++;
    auto directory = root_ / ".sessions" / id.str();
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw TransferError(ErrorKind::kSessionError,
                            "failed to create session directory '" + directory.string() + "': " + ec.message());
    }
    sessions_.emplace(id.str(), Session{destination, directory, {}});
    MPT_LOG(kDebug) << "started session " << id.str() << " for " << target.string();
    return id.str();
}

LocalObjectStore::Session &LocalObjectStore::find_session(const std::string &session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw TransferError(ErrorKind::kSessionError, "unknown session " + session_id);
    }
    return it->second;
}

PartIdentifier LocalObjectStore::upload_part(const std::string &session_id, std::uint32_t part_number,
                                             RangeReader &reader, const CancellationToken &cancel) {
    std::filesystem::path part_path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        part_path = find_session(session_id).directory / part_file_name(part_number);
    }
    const auto crc = store_reader(reader, part_path, cancel, ErrorKind::kPartTransportError);
    const auto etag = Checksum::to_hex(crc);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        remove_quietly(part_path);
        throw TransferError(ErrorKind::kSessionError, "session " + session_id + " closed during upload",
                            part_number);
    }
    it->second.etags[part_number] = etag;
    return PartIdentifier{etag, crc};
}

std::string LocalObjectStore::complete_session(const std::string &session_id,
                                               const std::vector<CompletedPart> &parts) {
    Session session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = find_session(session_id);
    }
    if (parts.empty()) {
        throw TransferError(ErrorKind::kSessionError, "cannot complete session " + session_id + " without parts");
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0 && parts[i].part_number <= parts[i - 1].part_number) {
            throw TransferError(ErrorKind::kSessionError, "parts must be listed in ascending order");
        }
        auto it = session.etags.find(parts[i].part_number);
        if (it == session.etags.end() || it->second != parts[i].etag) {
            throw TransferError(ErrorKind::kSessionError, "part was not uploaded with etag " + parts[i].etag,
                                parts[i].part_number);
        }
    }

    const auto target = object_path(session.destination);
    auto temp = target;
    temp += ".tmp";
    Checksum::Crc32Accumulator digest;
    try {
        ScopedFd out(open_file_for_write(temp, ErrorKind::kSessionError));
        std::vector<char> buffer(kBufferSize);
        for (const auto &part : parts) {
            const auto part_path = session.directory / part_file_name(part.part_number);
            ScopedFd in(open_file_for_read(part_path, ErrorKind::kSessionError));
            std::uint64_t offset = 0;
            while (true) {
                auto got = pread_some(in.get(), buffer.data(), buffer.size(), offset, part_path,
                                      ErrorKind::kSessionError);
                if (got == 0) {
                    break;
                }
                write_all(out.get(), buffer.data(), got, temp, ErrorKind::kSessionError);
                digest.update(buffer.data(), got);
                offset += got;
            }
        }
        if (!out.close()) {
            throw io_error(ErrorKind::kSessionError, "close failed for", temp);
        }
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec) {
            throw TransferError(ErrorKind::kSessionError, "failed to rename '" + temp.string() + "': " + ec.message());
        }
    } catch (const TransferError &) {
        remove_quietly(temp);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(session_id);
    }
    remove_quietly(session.directory);
    std::ostringstream etag;
    etag << digest.hex() << '-' << parts.size();
    MPT_LOG(kDebug) << "completed session " << session_id << " as " << target.string();
    return etag.str();
}

void LocalObjectStore::abort_session(const std::string &session_id) {
    std::filesystem::path directory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        directory = find_session(session_id).directory;
        sessions_.erase(session_id);
    }
    remove_quietly(directory);
    MPT_LOG(kDebug) << "aborted session " << session_id;
}

PartIdentifier LocalObjectStore::put_object(const ObjectLocation &destination, RangeReader &reader,
                                            const CancellationToken &cancel) {
    const auto crc = store_reader(reader, object_path(destination), cancel, ErrorKind::kPartTransportError);
    return PartIdentifier{Checksum::to_hex(crc), crc};
}

ObjectInfo LocalObjectStore::stat_object(const ObjectLocation &object) {
    const auto path = object_path(object);
    ScopedFd fd(open_file_for_read(path, ErrorKind::kSourceUnreadable));
    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
        throw io_error(ErrorKind::kSourceUnreadable, "failed to stat", path);
    }
    ObjectInfo info;
    info.size = static_cast<std::uint64_t>(st.st_size);
    Checksum::Crc32Accumulator digest;
    std::vector<char> buffer(kBufferSize);
    std::uint64_t offset = 0;
    while (offset < info.size) {
        auto got = pread_some(fd.get(), buffer.data(), buffer.size(), offset, path, ErrorKind::kSourceUnreadable);
        if (got == 0) {
            break;
        }
        digest.update(buffer.data(), got);
        offset += got;
    }
    info.checksum = digest.value();
    info.etag = digest.hex();
    return info;
}

RangeData LocalObjectStore::download_range(const ObjectLocation &object, std::uint64_t offset,
                                           std::uint64_t length, const CancellationToken &cancel) {
    const auto path = object_path(object);
    ScopedFd fd(open_file_for_read(path, ErrorKind::kPartTransportError));
    RangeData data;
    data.bytes.resize(static_cast<std::size_t>(length));
    std::size_t filled = 0;
    while (filled < data.bytes.size()) {
        if (cancel.cancelled()) {
            throw TransferError(ErrorKind::kCancelled, "download cancelled");
        }
        const auto want = std::min(kBufferSize, data.bytes.size() - filled);
        auto got = pread_some(fd.get(), data.bytes.data() + filled, want, offset + filled, path,
                              ErrorKind::kPartTransportError);
        if (got == 0) {
            std::ostringstream oss;
            oss << "object '" << path.string() << "' ended at offset " << offset + filled;
            throw TransferError(ErrorKind::kPartTransportError, oss.str());
        }
        filled += got;
    }
    data.checksum = Checksum::crc32(data.bytes);
    return data;
}

std::size_t LocalObjectStore::open_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace mpt
