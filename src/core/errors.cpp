#include "core/errors.hpp"

#include <utility>

namespace core {
namespace {

std::string build_message(ErrorCode code, const std::string& path, const std::string& detail) {
    std::string msg = error_code_name(code);
    msg += " at ";
    msg += path.empty() ? "<root>" : path;
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

} // namespace

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::TypeMismatch: return "type mismatch";
    case ErrorCode::DepthExceeded: return "depth over limit";
    case ErrorCode::InvalidValue: return "invalid value";
    case ErrorCode::UnsupportedValue: return "unsupported value";
    case ErrorCode::ProtocolViolation: return "comparator protocol violation";
    }
    return "unknown error";
}

DiffError::DiffError(ErrorCode code, std::string path, const std::string& detail)
    : std::runtime_error(build_message(code, path, detail)),
      code_(code),
      path_(std::move(path)),
      detail_(detail) {}

} // namespace core
