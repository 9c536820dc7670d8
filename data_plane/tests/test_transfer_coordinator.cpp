#include "mpt/cancellation.hpp"
#include "mpt/checksum.hpp"
#include "mpt/concurrency_limiter.hpp"
#include "mpt/errors.hpp"
#include "mpt/local_object_store.hpp"
#include "mpt/source.hpp"
#include "mpt/transfer_coordinator.hpp"

#include "test_support.hpp"

#include <sys/stat.h>
#include <sys/types.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using namespace std::chrono_literals;
using mpt_test::PartScript;
using mpt_test::ScriptedTransport;
using mpt_test::TempDir;

// Small parts so a few kilobytes make a multipart transfer.
mpt::TransferConfig small_parts(std::size_t concurrency = 3) {
    mpt::TransferConfig config;
    config.planner.min_part_size = 1000;
    config.planner.single_operation_threshold = 1000;
    config.scheduler.concurrency_limit = concurrency;
    config.scheduler.max_attempts = 3;
    config.scheduler.initial_backoff = 1ms;
    config.scheduler.max_backoff = 4ms;
    return config;
}

void test_multipart_upload_to_local_store() {
    TempDir dir("mpt_coordinator_local_test");
    auto data = mpt_test::pattern(100000, 7);
    auto path = dir / "source.bin";
    mpt_test::write_file(path, data);

    mpt::LocalObjectStore store(dir / "store");
    mpt::TransferConfig config = small_parts(4);
    config.planner.min_part_size = 16384;
    config.planner.single_operation_threshold = 16384;
    mpt::TransferCoordinator coordinator(store, config);
    mpt_test::RecordingSink sink;

    const mpt::ObjectLocation object{"bucket", "nested/object.bin"};
    auto summary = coordinator.execute(mpt::file_source(path), object, {}, &sink);
    assert(summary.multipart);
    assert(summary.part_count == 7);
    assert(summary.bytes_transferred == 100000);
    assert(summary.checksum == mpt::Checksum::crc32(data));
    assert(summary.object_identifier == mpt::Checksum::crc32_hex(data) + "-7");
    assert(mpt_test::read_file(store.object_path(object)) == data);
    assert(store.open_sessions() == 0);
    assert(sink.parts().size() == 7);
    assert(sink.bytes() == 100000);

    // Download it back through ranged reads.
    auto dest = dir / "out" / "copy.bin";
    auto back = coordinator.download(object, dest);
    assert(back.part_count == 7);
    assert(back.checksum == summary.checksum);
    assert(mpt_test::read_file(dest) == data);
    auto partial = dest;
    partial += ".mpt-partial";
    assert(!std::filesystem::exists(partial));

    // A region of the same file.
    const mpt::ObjectLocation region{"bucket", "region.bin"};
    auto part = coordinator.execute(mpt::file_source(path, 5000, 40000), region);
    assert(part.bytes_transferred == 40000);
    assert(part.part_count == 3);
    assert(mpt_test::read_file(store.object_path(region)) ==
           std::vector<char>(data.begin() + 5000, data.begin() + 45000));
}

void test_simple_upload() {
    ScriptedTransport transport;
    mpt::TransferCoordinator coordinator(transport, small_parts());
    auto data = mpt_test::pattern(1000);
    const mpt::ObjectLocation object{"bucket", "small"};
    auto summary = coordinator.execute(mpt::buffer_source(data), object);
    assert(!summary.multipart);
    assert(summary.part_count == 1);
    assert(summary.object_identifier == "put-etag");
    assert(transport.put_calls() == 1);
    assert(transport.start_calls() == 0);
    assert(transport.object(object) == data);
}

void test_simple_upload_is_retried() {
    ScriptedTransport transport;
    PartScript flaky;
    flaky.transient_failures = 2;
    transport.script(1, flaky);
    mpt::TransferCoordinator coordinator(transport, small_parts());
    auto data = mpt_test::pattern(500);
    auto summary = coordinator.execute(mpt::buffer_source(data), {"bucket", "flaky"});
    assert(!summary.multipart);
    assert(transport.attempts(1) == 3);
    assert(transport.object({"bucket", "flaky"}) == data);
}

void test_zero_length_upload() {
    ScriptedTransport transport;
    mpt::TransferCoordinator coordinator(transport, small_parts());
    const mpt::ObjectLocation object{"bucket", "empty"};
    auto summary = coordinator.execute(mpt::buffer_source({}), object);
    assert(!summary.multipart);
    assert(summary.part_count == 1);
    assert(summary.bytes_transferred == 0);
    assert(summary.checksum == 0u);
    assert(transport.has_object(object));
    assert(transport.object(object).empty());
}

void test_transient_failures_with_bounded_concurrency() {
    ScriptedTransport transport;
    PartScript once;
    once.transient_failures = 1;
    once.delay = 2ms;
    PartScript twice;
    twice.transient_failures = 2;
    PartScript slow;
    slow.delay = 2ms;
    for (std::uint32_t part = 1; part <= 10; ++part) {
        transport.script(part, slow);
    }
    transport.script(2, once);
    transport.script(7, twice);
    PartScript foreign;
    foreign.transient_failures = 1;
    foreign.foreign_exception = true;
    transport.script(9, foreign);
    PartScript corrupt;
    corrupt.corrupt_digests = 1;
    transport.script(4, corrupt);

    mpt::TransferCoordinator coordinator(transport, small_parts(3));
    auto data = mpt_test::pattern(10000, 3);
    const mpt::ObjectLocation object{"bucket", "retried"};
    auto summary = coordinator.execute(mpt::buffer_source(data), object);
    assert(summary.multipart);
    assert(summary.part_count == 10);
    assert(transport.attempts(2) == 2);
    assert(transport.attempts(7) == 3);
    assert(transport.attempts(9) == 2);
    assert(transport.attempts(4) == 2);
    assert(transport.peak_concurrency() <= 3);
    assert(transport.complete_calls() == 1);
    assert(transport.abort_calls() == 0);
    assert(transport.object(object) == data);

    auto order = transport.completed_order();
    assert(order.size() == 10);
    for (std::size_t i = 0; i < order.size(); ++i) {
        assert(order[i] == i + 1);
    }
}

void test_fatal_part_aborts_once() {
    ScriptedTransport transport;
    PartScript fatal;
    fatal.fatal = true;
    transport.script(2, fatal);
    PartScript slow;
    slow.delay = 2s;
    for (std::uint32_t part = 3; part <= 10; ++part) {
        transport.script(part, slow);
    }
    mpt::TransferCoordinator coordinator(transport, small_parts(3));
    const mpt::ObjectLocation object{"bucket", "fatal"};
    const auto start = mpt::SteadyClock::now();
    try {
        coordinator.execute(mpt::buffer_source(mpt_test::pattern(10000)), object);
        assert(false);
    } catch (const mpt::TransferError &e) {
        assert(e.kind() == mpt::ErrorKind::kSessionError);
        assert(e.part_number() == 2u);
    }
    assert(mpt::SteadyClock::now() - start < 1500ms);
    assert(transport.abort_calls() == 1);
    assert(transport.complete_calls() == 0);
    assert(!transport.has_object(object));
}

void test_exhausted_retries_abort() {
    ScriptedTransport transport;
    PartScript broken;
    broken.transient_failures = 100;
    transport.script(5, broken);
    mpt::TransferCoordinator coordinator(transport, small_parts(2));
    try {
        coordinator.execute(mpt::buffer_source(mpt_test::pattern(10000)), {"bucket", "exhausted"});
        assert(false);
    } catch (const mpt::TransferError &e) {
        assert(e.kind() == mpt::ErrorKind::kPartTransportError);
        assert(e.part_number() == 5u);
    }
    assert(transport.attempts(5) == 3);
    assert(transport.abort_calls() == 1);
    assert(transport.complete_calls() == 0);
}

void test_source_mutation_is_detected() {
    TempDir dir("mpt_coordinator_mutation_test");
    auto path = dir / "source.bin";
    mpt_test::write_file(path, mpt_test::pattern(10000));

    ScriptedTransport transport;
    transport.on_start_session = [&] { mpt_test::touch_later(path); };
    mpt::TransferCoordinator coordinator(transport, small_parts(3));
    assert(mpt_test::throws_kind([&] { coordinator.execute(mpt::file_source(path), {"bucket", "mutated"}); },
                                 mpt::ErrorKind::kSourceMutated));
    assert(transport.part_successes() == 0);
    assert(transport.abort_calls() == 1);
    assert(transport.complete_calls() == 0);
}

void test_rewrite_with_same_metadata_uploads_nothing() {
    TempDir dir("mpt_coordinator_same_meta_test");
    auto path = dir / "source.bin";
    mpt_test::write_file(path, mpt_test::pattern(10000, 4));

    ScriptedTransport transport;
    transport.on_start_session = [&] {
        auto data = mpt_test::read_file(path);
        for (std::size_t i = 0; i < data.size(); i += 1000) {
            data[i] ^= 1;
        }
        mpt_test::rewrite_keeping_metadata(path, data);
    };
    mpt::TransferCoordinator coordinator(transport, small_parts(3));
    assert(mpt_test::throws_kind([&] { coordinator.execute(mpt::file_source(path), {"bucket", "same-meta"}); },
                                 mpt::ErrorKind::kSourceMutated));
    assert(transport.part_successes() == 0);
    assert(transport.abort_calls() == 1);
    assert(transport.complete_calls() == 0);
}

// Changes one part's bytes from inside its own upload call, after the
// attempt's range check has passed but before the transport reads them.
class MidCallRewriteTransport : public ScriptedTransport {
  public:
    MidCallRewriteTransport(std::filesystem::path path, std::uint32_t part, std::uint64_t offset)
        : path_(std::move(path)), part_(part), offset_(offset) {}

    mpt::PartIdentifier upload_part(const std::string &session_id, std::uint32_t part_number,
                                    mpt::RangeReader &reader, const mpt::CancellationToken &cancel) override {
        if (part_number == part_) {
            auto data = mpt_test::read_file(path_);
            data[offset_] ^= 1;
            mpt_test::rewrite_keeping_metadata(path_, data);
        }
        return ScriptedTransport::upload_part(session_id, part_number, reader, cancel);
    }

    mpt::PartIdentifier put_object(const mpt::ObjectLocation &destination, mpt::RangeReader &reader,
                                   const mpt::CancellationToken &cancel) override {
        auto data = mpt_test::read_file(path_);
        data[offset_] ^= 1;
        mpt_test::rewrite_keeping_metadata(path_, data);
        return ScriptedTransport::put_object(destination, reader, cancel);
    }

  private:
    std::filesystem::path path_;
    std::uint32_t part_;
    std::uint64_t offset_;
};

void test_rewrite_during_part_call() {
    TempDir dir("mpt_coordinator_mid_call_test");
    auto path = dir / "source.bin";
    mpt_test::write_file(path, mpt_test::pattern(10000, 5));

    MidCallRewriteTransport transport(path, 3, 2500);
    mpt::TransferCoordinator coordinator(transport, small_parts(1));
    try {
        coordinator.execute(mpt::file_source(path), {"bucket", "mid-call"});
        assert(false);
    } catch (const mpt::TransferError &e) {
        assert(e.kind() == mpt::ErrorKind::kSourceMutated);
        assert(e.part_number() == 3u);
    }
    // The changed part is never retried and the session never completes.
    assert(transport.attempts(3) == 1);
    assert(transport.abort_calls() == 1);
    assert(transport.complete_calls() == 0);
}

void test_rewrite_during_simple_upload() {
    TempDir dir("mpt_coordinator_mid_put_test");
    auto path = dir / "source.bin";
    mpt_test::write_file(path, mpt_test::pattern(500, 6));

    MidCallRewriteTransport transport(path, 1, 100);
    mpt::TransferCoordinator coordinator(transport, small_parts());
    assert(mpt_test::throws_kind([&] { coordinator.execute(mpt::file_source(path), {"bucket", "mid-put"}); },
                                 mpt::ErrorKind::kSourceMutated));
    assert(transport.attempts(1) == 1);
    assert(transport.start_calls() == 0);
}

// Rewrites the source once the last part has been uploaded, so every part
// succeeds and only the check before completion can notice.
class RewritingTransport : public ScriptedTransport {
  public:
    RewritingTransport(std::filesystem::path path, std::uint32_t last_part)
        : path_(std::move(path)), last_part_(last_part) {}

    mpt::PartIdentifier upload_part(const std::string &session_id, std::uint32_t part_number,
                                    mpt::RangeReader &reader, const mpt::CancellationToken &cancel) override {
        auto id = ScriptedTransport::upload_part(session_id, part_number, reader, cancel);
        if (part_number == last_part_) {
            auto data = mpt_test::read_file(path_);
            data[0] ^= 1;
            mpt_test::write_file(path_, data);
            mpt_test::touch_later(path_);
        }
        return id;
    }

  private:
    std::filesystem::path path_;
    std::uint32_t last_part_;
};

void test_mutation_before_finalize() {
    TempDir dir("mpt_coordinator_finalize_test");
    auto path = dir / "source.bin";
    mpt_test::write_file(path, mpt_test::pattern(10000));

    RewritingTransport transport(path, 10);
    mpt::TransferCoordinator coordinator(transport, small_parts(1));
    assert(mpt_test::throws_kind([&] { coordinator.execute(mpt::file_source(path), {"bucket", "rewritten"}); },
                                 mpt::ErrorKind::kSourceMutated));
    assert(transport.part_successes() == 10);
    assert(transport.abort_calls() == 1);
    assert(transport.complete_calls() == 0);
}

void test_cancel_through_handle() {
    ScriptedTransport transport;
    PartScript slow;
    slow.delay = 5s;
    for (std::uint32_t part = 1; part <= 10; ++part) {
        transport.script(part, slow);
    }
    mpt::TransferCoordinator coordinator(transport, small_parts(3));
    auto handle = coordinator.start(mpt::buffer_source(mpt_test::pattern(10000)), {"bucket", "cancelled"});
    std::this_thread::sleep_for(30ms);
    assert(!handle.ready());
    handle.cancel();
    const auto start = mpt::SteadyClock::now();
    assert(mpt_test::throws_kind([&] { handle.wait(); }, mpt::ErrorKind::kCancelled));
    assert(mpt::SteadyClock::now() - start < 3s);
    assert(transport.abort_calls() == transport.start_calls());
    assert(transport.complete_calls() == 0);
}

void test_cancelled_before_start() {
    ScriptedTransport transport;
    mpt::TransferCoordinator coordinator(transport, small_parts());
    mpt::CancellationSource cancel;
    cancel.cancel();
    assert(mpt_test::throws_kind(
        [&] { coordinator.execute(mpt::buffer_source(mpt_test::pattern(10000)), {"bucket", "x"}, cancel.token()); },
        mpt::ErrorKind::kCancelled));
    assert(transport.start_calls() == 0);
    assert(transport.part_calls() == 0);
}

void test_timeout() {
    ScriptedTransport transport;
    PartScript slow;
    slow.delay = 5s;
    for (std::uint32_t part = 1; part <= 10; ++part) {
        transport.script(part, slow);
    }
    auto config = small_parts(3);
    config.timeout = 50ms;
    mpt::TransferCoordinator coordinator(transport, config);
    const auto start = mpt::SteadyClock::now();
    try {
        coordinator.execute(mpt::buffer_source(mpt_test::pattern(10000)), {"bucket", "slow"});
        assert(false);
    } catch (const mpt::TransferError &e) {
        assert(e.kind() == mpt::ErrorKind::kCancelled);
        assert(std::string(e.what()).find("deadline exceeded") != std::string::npos);
    }
    assert(mpt::SteadyClock::now() - start < 3s);
    assert(transport.abort_calls() == 1);
    assert(transport.complete_calls() == 0);
}

void test_shared_budget() {
    ScriptedTransport transport;
    PartScript slow;
    slow.delay = 2ms;
    for (std::uint32_t part = 1; part <= 10; ++part) {
        transport.script(part, slow);
    }
    mpt::ConcurrencyLimiter budget(2);
    mpt::TransferCoordinator first(transport, small_parts(4), &budget);
    mpt::TransferCoordinator second(transport, small_parts(4), &budget);
    auto a = first.start(mpt::buffer_source(mpt_test::pattern(10000, 1)), {"bucket", "a"});
    auto b = second.start(mpt::buffer_source(mpt_test::pattern(10000, 2)), {"bucket", "b"});
    assert(a.wait().part_count == 10);
    assert(b.wait().part_count == 10);
    assert(transport.peak_concurrency() <= 2);
    assert(budget.available() == 2);
    assert(transport.object({"bucket", "a"}) == mpt_test::pattern(10000, 1));
    assert(transport.object({"bucket", "b"}) == mpt_test::pattern(10000, 2));
}

void test_download_retries_and_failures() {
    TempDir dir("mpt_coordinator_download_test");
    ScriptedTransport transport;
    auto data = mpt_test::pattern(10000, 11);
    const mpt::ObjectLocation object{"bucket", "remote"};
    transport.put(object, data);
    transport.set_download_part_size(1000);
    PartScript corrupt;
    corrupt.corrupt_digests = 1;
    transport.script(4, corrupt);

    mpt::TransferCoordinator coordinator(transport, small_parts(3));
    auto dest = dir / "remote.bin";
    auto handle = coordinator.start_download(object, dest);
    auto summary = handle.wait();
    assert(summary.multipart);
    assert(summary.part_count == 10);
    assert(summary.checksum == mpt::Checksum::crc32(data));
    assert(transport.attempts(4) == 2);
    assert(mpt_test::read_file(dest) == data);

    PartScript fatal;
    fatal.fatal = true;
    fatal.fatal_kind = mpt::ErrorKind::kSourceUnreadable;
    transport.script(6, fatal);
    auto failed = dir / "failed.bin";
    assert(mpt_test::throws_kind([&] { coordinator.download(object, failed); },
                                 mpt::ErrorKind::kSourceUnreadable));
    assert(!std::filesystem::exists(failed));
    auto partial = failed;
    partial += ".mpt-partial";
    assert(!std::filesystem::exists(partial));

    assert(mpt_test::throws_kind([&] { coordinator.download({"bucket", "missing"}, dir / "missing.bin"); },
                                 mpt::ErrorKind::kSourceUnreadable));
    assert(!std::filesystem::exists(dir / "missing.bin"));
}

void test_configuration_errors() {
    ScriptedTransport transport;
    auto bad = small_parts();
    bad.timeout = 0ms;
    assert(mpt_test::throws<std::invalid_argument>([&] { mpt::TransferCoordinator coordinator(transport, bad); }));

    TempDir dir("mpt_coordinator_fifo_test");
    auto fifo = dir / "pipe";
    assert(::mkfifo(fifo.c_str(), 0600) == 0);
    mpt::TransferCoordinator coordinator(transport, small_parts());
    assert(mpt_test::throws_kind([&] { coordinator.execute(mpt::file_source(fifo), {"bucket", "pipe"}); },
                                 mpt::ErrorKind::kConfiguration));
    assert(mpt_test::throws_kind(
        [&] { coordinator.execute(mpt::file_source(dir / "absent"), {"bucket", "absent"}); },
        mpt::ErrorKind::kSourceUnreadable));
    assert(transport.part_calls() == 0);
}

} // namespace

int main() {
    test_multipart_upload_to_local_store();
    test_simple_upload();
    test_simple_upload_is_retried();
    test_zero_length_upload();
    test_transient_failures_with_bounded_concurrency();
    test_fatal_part_aborts_once();
    test_exhausted_retries_abort();
    test_source_mutation_is_detected();
    test_rewrite_with_same_metadata_uploads_nothing();
    test_rewrite_during_part_call();
    test_rewrite_during_simple_upload();
    test_mutation_before_finalize();
    test_cancel_through_handle();
    test_cancelled_before_start();
    test_timeout();
    test_shared_budget();
    test_download_retries_and_failures();
    test_configuration_errors();
    return 0;
}
