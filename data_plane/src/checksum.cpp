#include "mpt/checksum.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace mpt {

namespace {

constexpr std::uint32_t polynomial = 0xEDB88320u;
constexpr std::uint32_t initial_crc = 0xFFFFFFFFu;

constexpr std::array<std::uint32_t, 256> make_crc32_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t value = i;
        for (std::uint32_t j = 0; j < 8; ++j) {
            if (value & 1u) {
                value = (value >> 1) ^ polynomial;
            } else {
                value >>= 1;
            }
        }
        table[i] = value;
    }
    return table;
}

const std::array<std::uint32_t, 256> &crc32_table() {
    static const auto table = make_crc32_table();
    return table;
}

std::uint32_t crc32_update(std::uint32_t crc, const char *data, std::size_t size) {
    const auto &table = crc32_table();
    for (std::size_t i = 0; i < size; ++i) {
        unsigned char byte = static_cast<unsigned char>(data[i]);
        crc = (crc >> 8) ^ table[(crc ^ byte) & 0xFFu];
    }
    return crc;
}

} // namespace

std::uint32_t Checksum::crc32(const std::vector<char> &data) {
    return crc32(data.data(), data.size());
}

std::uint32_t Checksum::crc32(const char *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return 0;
    }
    return crc32_update(initial_crc, data, size) ^ initial_crc;
}

std::string Checksum::crc32_hex(const std::vector<char> &data) {
    return to_hex(crc32(data));
}

std::string Checksum::to_hex(std::uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(8) << value;
    return oss.str();
}

Checksum::Crc32Accumulator::Crc32Accumulator() : crc_(initial_crc) {}

void Checksum::Crc32Accumulator::update(const char *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    crc_ = crc32_update(crc_, data, size);
}

void Checksum::Crc32Accumulator::reset() { crc_ = initial_crc; }

std::uint32_t Checksum::Crc32Accumulator::value() const {
    return crc_ ^ initial_crc;
}

std::string Checksum::Crc32Accumulator::hex() const {
    return to_hex(value());
}

} // namespace mpt
