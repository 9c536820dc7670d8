#include "mpt/cancellation.hpp"
#include "mpt/checksum.hpp"
#include "mpt/errors.hpp"
#include "mpt/local_object_store.hpp"
#include "mpt/range_reader.hpp"

#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using mpt_test::TempDir;

std::shared_ptr<const std::vector<char>> shared(std::vector<char> data) {
    return std::make_shared<const std::vector<char>>(std::move(data));
}

void test_put_stat_and_ranges() {
    TempDir dir("mpt_store_put_test");
    mpt::LocalObjectStore store(dir.path());
    const mpt::ObjectLocation object{"bucket", "dir/object.bin"};
    auto data = shared(mpt_test::pattern(3 * 1024 * 1024 + 11));

    auto reader = mpt::RangeReader::over_buffer(data, 0, data->size());
    auto id = store.put_object(object, reader, {});
    assert(reader.exhausted());
    assert(id.checksum == mpt::Checksum::crc32(*data));
    assert(reader.digest() == *id.checksum);
    assert(id.etag == mpt::Checksum::to_hex(*id.checksum));
    assert(store.object_path(object) == dir.path() / "bucket" / "dir" / "object.bin");
    assert(mpt_test::read_file(store.object_path(object)) == *data);

    auto info = store.stat_object(object);
    assert(info.size == data->size());
    assert(info.checksum == id.checksum);

    auto range = store.download_range(object, 1000, 2000, {});
    assert(range.bytes == std::vector<char>(data->begin() + 1000, data->begin() + 3000));
    assert(range.checksum == mpt::Checksum::crc32(range.bytes));

    assert(mpt_test::throws_kind([&] { store.download_range(object, data->size() - 10, 20, {}); },
                                 mpt::ErrorKind::kPartTransportError));
    assert(mpt_test::throws_kind([&] { store.stat_object({"bucket", "missing"}); },
                                 mpt::ErrorKind::kSourceUnreadable));
}

void test_put_from_file_and_buffer_agree() {
    TempDir dir("mpt_store_file_put_test");
    mpt::LocalObjectStore store(dir / "store");
    auto bytes = mpt_test::pattern(2 * 1024 * 1024 + 5, 8);
    auto path = dir / "source.bin";
    mpt_test::write_file(path, bytes);
    auto data = shared(bytes);

    auto from_file = mpt::RangeReader::over_file(path, 100, bytes.size() - 200);
    auto file_id = store.put_object({"bucket", "from-file"}, from_file, {});
    auto from_buffer = mpt::RangeReader::over_buffer(data, 100, bytes.size() - 200);
    auto buffer_id = store.put_object({"bucket", "from-buffer"}, from_buffer, {});

    assert(file_id.checksum == buffer_id.checksum);
    assert(from_file.digest() == from_buffer.digest());
    const std::vector<char> expected(bytes.begin() + 100, bytes.end() - 100);
    assert(mpt_test::read_file(store.object_path({"bucket", "from-file"})) == expected);
    assert(mpt_test::read_file(store.object_path({"bucket", "from-buffer"})) == expected);
}

void test_multipart_session() {
    TempDir dir("mpt_store_session_test");
    mpt::LocalObjectStore store(dir.path());
    const mpt::ObjectLocation object{"bucket", "multi.bin"};
    auto data = shared(mpt_test::pattern(3000, 5));

    auto session = store.start_session(object);
    assert(store.open_sessions() == 1);
    std::vector<mpt::CompletedPart> parts;
    // Upload out of order; completion stitches by part number.
    for (std::uint32_t part : {3u, 1u, 2u}) {
        auto reader = mpt::RangeReader::over_buffer(data, (part - 1) * 1000ull, 1000);
        auto id = store.upload_part(session, part, reader, {});
        assert(id.checksum == reader.digest());
        parts.push_back(mpt::CompletedPart{part, id.etag});
    }
    std::vector<mpt::CompletedPart> ordered{parts[1], parts[2], parts[0]};

    std::vector<mpt::CompletedPart> unordered{parts[0], parts[1], parts[2]};
    assert(mpt_test::throws_kind([&] { store.complete_session(session, unordered); },
                                 mpt::ErrorKind::kSessionError));
    std::vector<mpt::CompletedPart> wrong_etag = ordered;
    wrong_etag[1].etag = "bogus";
    assert(mpt_test::throws_kind([&] { store.complete_session(session, wrong_etag); },
                                 mpt::ErrorKind::kSessionError));
    assert(mpt_test::throws_kind([&] { store.complete_session(session, {}); }, mpt::ErrorKind::kSessionError));

    auto etag = store.complete_session(session, ordered);
    assert(etag == mpt::Checksum::crc32_hex(*data) + "-3");
    assert(store.open_sessions() == 0);
    assert(mpt_test::read_file(store.object_path(object)) == *data);
    assert(!std::filesystem::exists(dir.path() / ".sessions" / session));
    assert(mpt_test::throws_kind([&] { store.abort_session(session); }, mpt::ErrorKind::kSessionError));
}

void test_abort_discards_parts() {
    TempDir dir("mpt_store_abort_test");
    mpt::LocalObjectStore store(dir.path());
    const mpt::ObjectLocation object{"bucket", "aborted.bin"};
    auto data = shared(mpt_test::pattern(100));

    auto session = store.start_session(object);
    auto reader = mpt::RangeReader::over_buffer(data, 0, 100);
    store.upload_part(session, 1, reader, {});
    assert(std::filesystem::exists(dir.path() / ".sessions" / session / "1.part"));

    store.abort_session(session);
    assert(store.open_sessions() == 0);
    assert(!std::filesystem::exists(dir.path() / ".sessions" / session));
    assert(!std::filesystem::exists(store.object_path(object)));

    auto again = mpt::RangeReader::over_buffer(data, 0, 100);
    assert(mpt_test::throws_kind([&] { store.upload_part(session, 2, again, {}); },
                                 mpt::ErrorKind::kSessionError));
}

void test_cancelled_put_leaves_nothing() {
    TempDir dir("mpt_store_cancel_test");
    mpt::LocalObjectStore store(dir.path());
    const mpt::ObjectLocation object{"bucket", "cancelled.bin"};
    auto data = shared(mpt_test::pattern(4096));
    mpt::CancellationSource cancel;
    cancel.cancel();
    auto reader = mpt::RangeReader::over_buffer(data, 0, data->size());
    assert(mpt_test::throws_kind([&] { store.put_object(object, reader, cancel.token()); },
                                 mpt::ErrorKind::kCancelled));
    assert(!std::filesystem::exists(store.object_path(object)));
    auto temp = store.object_path(object);
    temp += ".tmp";
    assert(!std::filesystem::exists(temp));
}

void test_rejects_escaping_locations() {
    TempDir dir("mpt_store_paths_test");
    mpt::LocalObjectStore store(dir.path());
    assert(mpt_test::throws<std::invalid_argument>([&] { store.object_path({"bucket", "../x"}); }));
    assert(mpt_test::throws<std::invalid_argument>([&] { store.object_path({".sessions", "x"}); }));
    assert(mpt_test::throws<std::invalid_argument>([&] { store.object_path({"", "x"}); }));
    assert(mpt_test::throws<std::invalid_argument>([&] { store.object_path({"bucket", ""}); }));
    assert(mpt_test::throws<std::invalid_argument>([&] { store.object_path({"/abs", "x"}); }));
}

} // namespace

int main() {
    test_put_stat_and_ranges();
    test_put_from_file_and_buffer_agree();
    test_multipart_session();
    test_abort_discards_parts();
    test_cancelled_put_leaves_nothing();
    test_rejects_escaping_locations();
    return 0;
}
