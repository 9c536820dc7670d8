#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace mpt {

enum class ErrorKind {
    kSourceUnreadable,
    kSizeUnsupported,
    kSourceMutated,
    kPartTransportError,
    kPartChecksumMismatch,
    kSessionError,
    kCancelled,
    kConfiguration,
};

const char *to_string(ErrorKind kind) noexcept;

// Part-level kinds that the scheduler retries locally before escalating.
bool is_retryable(ErrorKind kind) noexcept;

// Single terminal error surfaced for a whole transfer. When a part triggered
// it, part_number() names that part and cause() carries the underlying reason.
class TransferError : public std::runtime_error {
  public:
    TransferError(ErrorKind kind, const std::string &message,
                  std::optional<std::uint32_t> part_number = std::nullopt,
                  std::string cause = {});

    ErrorKind kind() const noexcept { return kind_; }

    std::optional<std::uint32_t> part_number() const noexcept { return part_number_; }

    const std::string &cause() const noexcept { return cause_; }

    bool retryable() const noexcept { return is_retryable(kind_); }

    // Same error attributed to a part, keeping the original cause.
    TransferError for_part(std::uint32_t part_number, const std::string &message) const;

  private:
    ErrorKind kind_;
    std::optional<std::uint32_t> part_number_;
    std::string cause_;
};

} // namespace mpt
