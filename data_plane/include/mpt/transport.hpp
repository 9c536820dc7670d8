#pragma once

#include "mpt/cancellation.hpp"
#include "mpt/range_reader.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mpt {

struct ObjectLocation {
    std::string bucket;
    std::string key;
};

// Opaque token returned for a transferred part (an ETag for S3-like stores),
// optionally with the digest the remote side computed over the part bytes.
struct PartIdentifier {
    std::string etag;
    std::optional<std::uint32_t> checksum;
};

struct CompletedPart {
    std::uint32_t part_number;
    std::string etag;
};

struct RangeData {
    std::vector<char> bytes;
    std::optional<std::uint32_t> checksum;
};

struct ObjectInfo {
    std::uint64_t size{0};
    std::optional<std::uint32_t> checksum;
    std::string etag;
};

// Remote side of a transfer. Implementations own connection handling,
// signing and per-call retries. Part calls report transient failures as
// TransferError(kPartTransportError); session calls report failures as
// TransferError(kSessionError). Calls taking a CancellationToken should stop
// early with TransferError(kCancelled) once it fires. All calls may be made
// concurrently from several part workers.
class ObjectTransport {
  public:
    virtual ~ObjectTransport() = default;

    virtual std::string start_session(const ObjectLocation &destination) = 0;

    virtual PartIdentifier upload_part(const std::string &session_id, std::uint32_t part_number,
                                       RangeReader &reader, const CancellationToken &cancel) = 0;

    // `parts` is ordered by ascending part number. Returns the final object identifier.
    virtual std::string complete_session(const std::string &session_id,
                                         const std::vector<CompletedPart> &parts) = 0;

    virtual void abort_session(const std::string &session_id) = 0;

    // Single-call upload used for simple plans.
    virtual PartIdentifier put_object(const ObjectLocation &destination, RangeReader &reader,
                                      const CancellationToken &cancel) = 0;

    virtual ObjectInfo stat_object(const ObjectLocation &object) = 0;

    virtual RangeData download_range(const ObjectLocation &object, std::uint64_t offset,
                                     std::uint64_t length, const CancellationToken &cancel) = 0;
};

} // namespace mpt
