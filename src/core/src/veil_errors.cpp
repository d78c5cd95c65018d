#include "veil_errors.hpp"

namespace veil {

const char* error_kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::PayloadTooLarge:           return "PayloadTooLarge";
        case ErrorKind::UnsupportedCarrierFormat:  return "UnsupportedCarrierFormat";
        case ErrorKind::UnsupportedSubformat:      return "UnsupportedSubformat";
        case ErrorKind::NoHiddenData:              return "NoHiddenData";
        case ErrorKind::NoContainerFound:          return "NoContainerFound";
        case ErrorKind::TruncatedContainer:        return "TruncatedContainer";
        case ErrorKind::MalformedMetadata:         return "MalformedMetadata";
        case ErrorKind::WrongPasswordOrCorruption: return "WrongPasswordOrCorruption";
        case ErrorKind::CarrierTooSmall:           return "CarrierTooSmall";
    }
    return "Unknown";
}

StegoError::StegoError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + detail)
    , kind_(kind)
{}

} // namespace veil
