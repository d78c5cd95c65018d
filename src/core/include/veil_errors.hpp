#pragma once

/**
 * @file veil_errors.hpp
 * @brief Error taxonomy shared by every layer of the stego core
 *
 * Every failure that reaches a caller is a StegoError carrying one ErrorKind.
 * NoContainerFound and TruncatedContainer are raised by the container codec
 * and are folded into NoHiddenData before extract() returns.
 */

#include <stdexcept>
#include <string>

namespace veil {

enum class ErrorKind {
    PayloadTooLarge,
    UnsupportedCarrierFormat,
    UnsupportedSubformat,
    NoHiddenData,
    NoContainerFound,
    TruncatedContainer,
    MalformedMetadata,
    WrongPasswordOrCorruption,
    CarrierTooSmall
};

const char* error_kind_to_string(ErrorKind kind) noexcept;

class StegoError : public std::runtime_error {
public:
    StegoError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace veil
