#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mpt {

// CRC-32 (IEEE 802.3, reflected) used as the content digest of sources and parts.
class Checksum {
  public:
    static std::uint32_t crc32(const std::vector<char> &data);

    static std::uint32_t crc32(const char *data, std::size_t size);

    static std::string crc32_hex(const std::vector<char> &data);

    static std::string to_hex(std::uint32_t value);

    class Crc32Accumulator {
      public:
        Crc32Accumulator();

        void update(const char *data, std::size_t size);

        void reset();

        std::uint32_t value() const;

        std::string hex() const;

      private:
        std::uint32_t crc_;
    };
};

} // namespace mpt
