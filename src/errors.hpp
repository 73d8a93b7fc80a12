#pragma once

#include <stdexcept>
#include <string>

namespace sdc {

enum class ErrorCode {
    InvalidRequest,
    Unauthorized,
    NotFound,
    NotInRoom,
    AlreadyInDifferentRoom,
    EncodeStartFailure,
    EncodeRuntimeFailure,
    Timeout,
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::NotInRoom: return "NotInRoom";
        case ErrorCode::AlreadyInDifferentRoom: return "AlreadyInDifferentRoom";
        case ErrorCode::EncodeStartFailure: return "EncodeStartFailure";
        case ErrorCode::EncodeRuntimeFailure: return "EncodeRuntimeFailure";
        case ErrorCode::Timeout: return "Timeout";
    }
    return "Unknown";
}

// Thrown by the registry, router and ABR manager for protocol and
// infrastructure failures that the caller has to see.
class CoreError : public std::runtime_error {
public:
    CoreError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {
    }

    ErrorCode code() const { return code_; }
    const char* code_name() const { return error_code_name(code_); }

private:
    ErrorCode code_;
};

} // namespace sdc
