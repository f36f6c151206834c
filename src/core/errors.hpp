#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace core {

enum class ErrorCode : std::uint8_t {
    TypeMismatch,      // A and B have different declared types at one position
    DepthExceeded,     // traversal went deeper than the configured limit
    InvalidValue,      // one side of a position is absent
    UnsupportedValue,  // dynamic node with no comparable concrete kind
    ProtocolViolation  // comparator returned an outcome outside its contract
};

const char* error_code_name(ErrorCode code) noexcept;

// Raised for every structural anomaly found while comparing. A thrown
// DiffError aborts the whole comparison; records gathered before it are not
// a complete result.
class DiffError : public std::runtime_error {
public:
    DiffError(ErrorCode code, std::string path, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }
    const std::string& path() const noexcept { return path_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCode code_;
    std::string path_;
    std::string detail_;
};

} // namespace core
