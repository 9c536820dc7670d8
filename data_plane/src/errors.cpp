#include "mpt/errors.hpp"

#include <sstream>

namespace mpt {

namespace {

std::string format_message(ErrorKind kind, const std::string &message,
                           const std::optional<std::uint32_t> &part_number, const std::string &cause) {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << message;
    if (part_number) {
        oss << " (part " << *part_number << ')';
    }
    if (!cause.empty() && cause != message) {
        oss << ": " << cause;
    }
    return oss.str();
}

} // namespace

const char *to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::kSourceUnreadable:
        return "SourceUnreadable";
    case ErrorKind::kSizeUnsupported:
        return "SizeUnsupported";
    case ErrorKind::kSourceMutated:
        return "SourceMutated";
    case ErrorKind::kPartTransportError:
        return "PartTransportError";
    case ErrorKind::kPartChecksumMismatch:
        return "PartChecksumMismatch";
    case ErrorKind::kSessionError:
        return "SessionError";
    case ErrorKind::kCancelled:
        return "Cancelled";
    case ErrorKind::kConfiguration:
        return "Configuration";
    }
    return "Unknown";
}

bool is_retryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::kPartTransportError || kind == ErrorKind::kPartChecksumMismatch;
}

TransferError::TransferError(ErrorKind kind, const std::string &message,
                             std::optional<std::uint32_t> part_number, std::string cause)
    : std::runtime_error(format_message(kind, message, part_number, cause)), kind_(kind),
      part_number_(part_number), cause_(cause.empty() ? message : std::move(cause)) {}

TransferError TransferError::for_part(std::uint32_t part_number, const std::string &message) const {
    return TransferError(kind_, message, part_number, cause_);
}

} // namespace mpt
