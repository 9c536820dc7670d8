#pragma once

#include "mpt/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace mpt {

// Object store kept in a local directory. Objects live at
// <root>/<bucket>/<key>; multipart sessions stage their parts under
// <root>/.sessions/<session id>/ until completed or aborted.
class LocalObjectStore : public ObjectTransport {
  public:
    explicit LocalObjectStore(std::filesystem::path root);

    std::string start_session(const ObjectLocation &destination) override;

    PartIdentifier upload_part(const std::string &session_id, std::uint32_t part_number,
                               RangeReader &reader, const CancellationToken &cancel) override;

    std::string complete_session(const std::string &session_id,
                                 const std::vector<CompletedPart> &parts) override;

    void abort_session(const std::string &session_id) override;

    PartIdentifier put_object(const ObjectLocation &destination, RangeReader &reader,
                              const CancellationToken &cancel) override;

    ObjectInfo stat_object(const ObjectLocation &object) override;

    RangeData download_range(const ObjectLocation &object, std::uint64_t offset, std::uint64_t length,
                             const CancellationToken &cancel) override;

    std::filesystem::path object_path(const ObjectLocation &object) const;

    std::size_t open_sessions() const;

  private:
    struct Session {
        ObjectLocation destination;
        std::filesystem::path directory;
        std::map<std::uint32_t, std::string> etags;
    };

    Session &find_session(const std::string &session_id);

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
    std::uint64_t next_session_{1};
};

} // namespace mpt
