/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the engine, the request handler and the C API
 */

#pragma once

#include <export.hpp>
#include <stdexcept>
#include <string>

namespace Chromaseq {

/**
 * @brief Classification of every failure the engine can report.
 *
 * A search that runs out of candidates is not listed here: inversion reports
 * it as data (InversionResult::found == false).
 */
enum class ErrorKind {
    MalformedColor,     // Hex string of the wrong length or with non-hex digits
    UnknownMethod,      // Unrecognized method, mode or expansion tag
    InvalidParameter,   // Parameter outside its domain (base < 2, dim < 1, ...)
    NonConvergentRoot,  // Newton iteration hit its cap; internal fault
    Internal            // Any other failure caught at a service boundary
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedColor:    return "MalformedColor";
        case ErrorKind::UnknownMethod:     return "UnknownMethod";
        case ErrorKind::InvalidParameter:  return "InvalidParameter";
        case ErrorKind::NonConvergentRoot: return "NonConvergentRoot";
        case ErrorKind::Internal:          return "Internal";
    }
    return "Unknown";
}

/**
 * @brief Exception carrying an ErrorKind alongside the message.
 */
class CHROMASEQ_API ChromaseqError : public std::runtime_error {
public:
    ChromaseqError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace Chromaseq
