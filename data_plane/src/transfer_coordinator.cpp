#include "mpt/transfer_coordinator.hpp"

#include "mpt/checksum.hpp"
#include "mpt/errors.hpp"
#include "mpt/log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace mpt {

namespace {

TransferConfig validated(TransferConfig config) {
    config.validate();
    return config;
}

// Session calls report every failure as a SessionError.
template <typename Call>
auto session_call(const char *what, Call &&call) -> decltype(call()) {
    try {
        return call();
    } catch (const TransferError &e) {
        if (e.kind() == ErrorKind::kSessionError) {
            throw;
        }
        throw TransferError(ErrorKind::kSessionError, what, e.part_number(), e.what());
    } catch (const std::exception &e) {
        throw TransferError(ErrorKind::kSessionError, what, std::nullopt, e.what());
    }
}

// Keeps a remote multipart session open until it is completed or aborted;
// a session still open at scope exit is aborted. abort_session() is issued
// at most once.
class SessionGuard {
  public:
    SessionGuard(ObjectTransport &transport, std::string session_id)
        : transport_(transport), session_id_(std::move(session_id)) {}

    ~SessionGuard() {
        if (!open_) {
            return;
        }
        try {
            abort();
        } catch (const std::exception &e) {
            MPT_LOG(kError) << "failed to abort session " << session_id_ << ": " << e.what();
        }
    }

    SessionGuard(const SessionGuard &) = delete;
    SessionGuard &operator=(const SessionGuard &) = delete;

    const std::string &id() const noexcept { return session_id_; }

    std::string complete(const std::vector<CompletedPart> &parts) {
        auto object_id = session_call("failed to complete multipart session",
                                      [&] { return transport_.complete_session(session_id_, parts); });
        open_ = false;
        MPT_LOG(kInfo) << "completed session " << session_id_ << " with " << parts.size() << " parts";
        return object_id;
    }

    void abort() {
        if (!open_) {
            return;
        }
        open_ = false;
        MPT_LOG(kInfo) << "aborting session " << session_id_;
        session_call("failed to abort multipart session", [&] { transport_.abort_session(session_id_); });
    }

  private:
    ObjectTransport &transport_;
    std::string session_id_;
    bool open_{true};
};

PartResult finish_upload_part(PartJob &job, const PartIdentifier &id, const ChecksumManager &checksums) {
    auto &reader = *job.reader;
    if (!reader.exhausted()) {
        std::ostringstream oss;
        oss << "transport consumed " << reader.length() - reader.remaining() << " of " << reader.length()
            << " bytes";
        throw TransferError(ErrorKind::kPartTransportError, oss.str(), job.spec.part_number);
    }
    checksums.verify_part_source(job.spec, reader.digest());
    checksums.verify_part(job.spec, reader.digest(), id.checksum);
    PartResult result;
    result.part_number = job.spec.part_number;
    result.remote_identifier = id.etag;
    result.checksum = reader.digest();
    result.bytes_transferred = job.spec.length;
    result.attempts = job.attempt;
    return result;
}

// Download target written with positional writes, renamed over the final
// path on commit() and removed otherwise.
class PartialFile {
  public:
    PartialFile(std::filesystem::path destination, std::uint64_t size)
        : destination_(std::move(destination)), path_(destination_) {
        path_ += ".mpt-partial";
        if (destination_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(destination_.parent_path(), ec);
            if (ec) {
                throw TransferError(ErrorKind::kSourceUnreadable, "failed to create directory for '" +
                                                                      destination_.string() + "': " + ec.message());
            }
        }
        fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_TRUNC | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw error(ErrorKind::kSourceUnreadable, "failed to open");
        }
        if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
            auto err = error(ErrorKind::kSourceUnreadable, "failed to size");
            discard();
            throw err;
        }
    }

    ~PartialFile() {
        if (!committed_) {
            discard();
        }
    }

    PartialFile(const PartialFile &) = delete;
    PartialFile &operator=(const PartialFile &) = delete;

    const std::filesystem::path &path() const noexcept { return path_; }

    void write_at(std::uint64_t offset, const std::vector<char> &bytes, std::uint32_t part_number) const {
        std::size_t written = 0;
        while (written < bytes.size()) {
            ssize_t rc = ::pwrite(fd_, bytes.data() + written, bytes.size() - written,
                                  static_cast<off_t>(offset + written));
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                auto err = error(ErrorKind::kPartTransportError, "write failed for");
                throw TransferError(err.kind(), "failed to store downloaded bytes", part_number, err.what());
            }
            written += static_cast<std::size_t>(rc);
        }
    }

    void close() {
        if (fd_ < 0) {
            return;
        }
        const int fd = fd_;
        fd_ = -1;
        if (::fsync(fd) != 0) {
            auto err = error(ErrorKind::kSourceUnreadable, "failed to flush");
            ::close(fd);
            throw err;
        }
        if (::close(fd) != 0) {
            throw error(ErrorKind::kSourceUnreadable, "failed to close");
        }
    }

    void commit() {
        close();
        std::error_code ec;
        std::filesystem::rename(path_, destination_, ec);
        if (ec) {
            throw TransferError(ErrorKind::kSourceUnreadable,
                                "failed to move download into '" + destination_.string() + "': " + ec.message());
        }
        committed_ = true;
    }

  private:
    TransferError error(ErrorKind kind, const char *what) const {
        std::ostringstream oss;
        oss << what << " '" << path_.string() << "': " << std::strerror(errno);
        return TransferError(kind, oss.str());
    }

    void discard() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::filesystem::path destination_;
    std::filesystem::path path_;
    int fd_{-1};
    bool committed_{false};
};

} // namespace

void TransferConfig::validate() const {
    planner.validate();
    scheduler.validate();
    if (timeout && timeout->count() <= 0) {
        throw std::invalid_argument("timeout must be > 0");
    }
}

TransferHandle::TransferHandle(CancellationSource cancel, std::future<TransferSummary> result)
    : cancel_(std::move(cancel)), result_(std::move(result)) {}

void TransferHandle::cancel() { cancel_.cancel(); }

TransferSummary TransferHandle::wait() { return result_.get(); }

bool TransferHandle::ready() const {
    return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

TransferCoordinator::TransferCoordinator(ObjectTransport &transport, TransferConfig config,
                                         ConcurrencyLimiter *budget)
    : transport_(transport), config_(validated(std::move(config))), planner_(config_.planner),
      budget_(budget) {}

CancellationSource TransferCoordinator::transfer_scope(const CancellationToken &cancel) const {
    CancellationSource scope(cancel);
    if (config_.timeout) {
        scope.set_deadline(SteadyClock::now() + *config_.timeout);
    }
    return scope;
}

TransferSummary TransferCoordinator::execute(SourceDescriptor source_descriptor,
                                             const ObjectLocation &destination,
                                             const CancellationToken &cancel, ProgressSink *progress) {
    const auto scope = transfer_scope(cancel);
    const auto token = scope.token();

    const auto source = OpenedSource::open(std::move(source_descriptor));
    const auto plan = planner_.plan(source.size_hint());
    ChecksumManager checksums(source, config_.checksum);
    checksums.snapshot_parts(plan);
    ProgressDispatcher dispatcher(progress);

    MPT_LOG(kInfo) << "uploading " << plan.total_size << " bytes to " << destination.bucket << '/'
                   << destination.key << " as " << (plan.simple ? "a simple operation" : "multipart")
                   << " (" << plan.size() << " parts)";
    if (plan.simple) {
        return upload_simple(source, plan, destination, checksums, token, dispatcher);
    }
    return upload_multipart(source, plan, destination, checksums, token, dispatcher);
}

TransferSummary TransferCoordinator::upload_simple(const OpenedSource &source, const PartPlan &plan,
                                                   const ObjectLocation &destination,
                                                   const ChecksumManager &checksums,
                                                   const CancellationToken &cancel,
                                                   ProgressDispatcher &progress) {
    PartScheduler scheduler(config_.scheduler, budget_);
    SchedulerHooks hooks;
    hooks.before_attempt = [&](const PartSpec &spec, std::uint32_t) { checksums.validate_before_attempt(spec); };
    hooks.progress = &progress;

    auto results = scheduler.run(
        plan,
        [&](const PartSpec &spec, std::uint32_t attempt) {
            return PartJob{spec, attempt, source.read_range(spec.offset, spec.length)};
        },
        [&](PartJob &job, const CancellationToken &part_cancel) {
            auto id = transport_.put_object(destination, *job.reader, part_cancel);
            return finish_upload_part(job, id, checksums);
        },
        cancel, hooks);
    // put_object() has already committed the object here. A mutation found
    // now fails the transfer but cannot take the object back; the range
    // checks before and after the put are what keep changed bytes out.
    checksums.validate_before_finalize();

    TransferSummary summary;
    summary.bytes_transferred = plan.total_size;
    summary.part_count = results.size();
    summary.checksum = source.checksum();
    summary.object_identifier = results.front().remote_identifier;
    summary.multipart = false;
    return summary;
}

TransferSummary TransferCoordinator::upload_multipart(const OpenedSource &source, const PartPlan &plan,
                                                      const ObjectLocation &destination,
                                                      const ChecksumManager &checksums,
                                                      const CancellationToken &cancel,
                                                      ProgressDispatcher &progress) {
    if (cancel.cancelled()) {
        throw TransferError(ErrorKind::kCancelled, "transfer cancelled before it started");
    }
    SessionGuard session(transport_, session_call("failed to start multipart session",
                                                  [&] { return transport_.start_session(destination); }));
    MPT_LOG(kInfo) << "started session " << session.id() << " for " << plan.size() << " parts of "
                   << plan.part_size << " bytes";

    PartScheduler scheduler(config_.scheduler, budget_);
    SchedulerHooks hooks;
    hooks.before_attempt = [&](const PartSpec &spec, std::uint32_t) { checksums.validate_before_attempt(spec); };
    hooks.on_abort = [&] { session.abort(); };
    hooks.progress = &progress;

    auto results = scheduler.run(
        plan,
        [&](const PartSpec &spec, std::uint32_t attempt) {
            return PartJob{spec, attempt, source.read_range(spec.offset, spec.length)};
        },
        [&](PartJob &job, const CancellationToken &part_cancel) {
            auto id = transport_.upload_part(session.id(), job.spec.part_number, *job.reader, part_cancel);
            return finish_upload_part(job, id, checksums);
        },
        cancel, hooks);

    checksums.validate_before_finalize();
    if (cancel.cancelled()) {
        throw TransferError(ErrorKind::kCancelled, "transfer cancelled before completion");
    }

    std::vector<CompletedPart> parts;
    parts.reserve(results.size());
    for (const auto &result : results) {
        parts.push_back(CompletedPart{result.part_number, result.remote_identifier});
    }

    TransferSummary summary;
    summary.object_identifier = session.complete(parts);
    summary.bytes_transferred = plan.total_size;
    summary.part_count = parts.size();
    summary.checksum = source.checksum();
    summary.multipart = true;
    return summary;
}

TransferSummary TransferCoordinator::download(const ObjectLocation &object,
                                              const std::filesystem::path &destination,
                                              const CancellationToken &cancel, ProgressSink *progress) {
    const auto scope = transfer_scope(cancel);
    const auto token = scope.token();

    ObjectInfo info;
    try {
        info = transport_.stat_object(object);
    } catch (const TransferError &) {
        throw;
    } catch (const std::exception &e) {
        throw TransferError(ErrorKind::kSourceUnreadable, "failed to stat remote object", std::nullopt, e.what());
    }
    const auto plan = planner_.plan(info.size);
    ChecksumManager checksums(info.size, info.checksum, config_.checksum);
    ProgressDispatcher dispatcher(progress);
    PartialFile file(destination, info.size);

    MPT_LOG(kInfo) << "downloading " << object.bucket << '/' << object.key << " (" << info.size
                   << " bytes, " << plan.size() << " parts) to " << destination.string();

    PartScheduler scheduler(config_.scheduler, budget_);
    SchedulerHooks hooks;
    hooks.progress = &dispatcher;
    scheduler.run(
        plan,
        [](const PartSpec &spec, std::uint32_t attempt) { return PartJob{spec, attempt, std::nullopt}; },
        [&](PartJob &job, const CancellationToken &part_cancel) {
            auto data = transport_.download_range(object, job.spec.offset, job.spec.length, part_cancel);
            if (data.bytes.size() != job.spec.length) {
                std::ostringstream oss;
                oss << "received " << data.bytes.size() << " of " << job.spec.length << " bytes";
                throw TransferError(ErrorKind::kPartTransportError, oss.str(), job.spec.part_number);
            }
            const auto digest = Checksum::crc32(data.bytes);
            checksums.verify_part(job.spec, digest, data.checksum);
            file.write_at(job.spec.offset, data.bytes, job.spec.part_number);
            PartResult result;
            result.remote_identifier = info.etag;
            result.checksum = digest;
            result.bytes_transferred = job.spec.length;
            return result;
        },
        token, hooks);

    file.close();
    const auto written = OpenedSource::open(file_source(file.path()));
    checksums.verify_object(written.checksum().value_or(0));
    file.commit();

    TransferSummary summary;
    summary.bytes_transferred = info.size;
    summary.part_count = plan.size();
    summary.checksum = written.checksum();
    summary.object_identifier = info.etag;
    summary.multipart = !plan.simple;
    return summary;
}

TransferHandle TransferCoordinator::start(SourceDescriptor source, ObjectLocation destination,
                                          ProgressSink *progress) {
    CancellationSource cancel;
    auto token = cancel.token();
    auto result = std::async(std::launch::async,
                             [this, source = std::move(source), destination = std::move(destination), token,
                              progress]() mutable { return execute(std::move(source), destination, token, progress); });
    return TransferHandle(std::move(cancel), std::move(result));
}

TransferHandle TransferCoordinator::start_download(ObjectLocation object, std::filesystem::path destination,
                                                   ProgressSink *progress) {
    CancellationSource cancel;
    auto token = cancel.token();
    auto result = std::async(std::launch::async,
                             [this, object = std::move(object), destination = std::move(destination), token,
                              progress]() { return download(object, destination, token, progress); });
    return TransferHandle(std::move(cancel), std::move(result));
}

} // namespace mpt
