#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rendezvous {

enum class ErrorCode {
    // Authentication
    UNAUTHORIZED,
    INVALID_TOKEN,
    TOKEN_EXPIRED,

    // Validation
    VALIDATION_ERROR,
    INVALID_MESSAGE_TYPE,
    INVALID_PAYLOAD,
    INVALID_ROOM_ID,

    // Capacity
    ROOM_FULL,
    FILE_TOO_LARGE,
    TRANSFER_LIMIT_REACHED,

    // Integrity
    CHECKSUM_MISMATCH,

    // Coordination store
    STORE_UNAVAILABLE,

    // Lookup / authorization / lifecycle
    TRANSFER_NOT_FOUND,
    PERMISSION_DENIED,
    INVALID_STATE,

    INTERNAL_ERROR
};

// Wire string, e.g. "room_full"
const char* errorCodeName(ErrorCode code);
int httpStatusFor(ErrorCode code);

class RendezvousError : public std::runtime_error {
public:
    RendezvousError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    const char* codeName() const { return errorCodeName(code_); }
    int httpStatus() const { return httpStatusFor(code_); }

private:
    ErrorCode code_;
};

class AuthError : public RendezvousError {
public:
    explicit AuthError(const std::string& message, ErrorCode code = ErrorCode::INVALID_TOKEN)
        : RendezvousError(code, message) {}
};

class ValidationError : public RendezvousError {
public:
    explicit ValidationError(const std::string& message, ErrorCode code = ErrorCode::VALIDATION_ERROR)
        : RendezvousError(code, message) {}
};

class CapacityError : public RendezvousError {
public:
    CapacityError(ErrorCode code, const std::string& message)
        : RendezvousError(code, message) {}
};

class IntegrityError : public RendezvousError {
public:
    explicit IntegrityError(const std::string& message)
        : RendezvousError(ErrorCode::CHECKSUM_MISMATCH, message) {}
};

class CoordinationStoreError : public RendezvousError {
public:
    explicit CoordinationStoreError(const std::string& message)
        : RendezvousError(ErrorCode::STORE_UNAVAILABLE, message) {}
};

class NotFoundError : public RendezvousError {
public:
    explicit NotFoundError(const std::string& message)
        : RendezvousError(ErrorCode::TRANSFER_NOT_FOUND, message) {}
};

class PermissionError : public RendezvousError {
public:
    explicit PermissionError(const std::string& message)
        : RendezvousError(ErrorCode::PERMISSION_DENIED, message) {}
};

class StateError : public RendezvousError {
public:
    explicit StateError(const std::string& message)
        : RendezvousError(ErrorCode::INVALID_STATE, message) {}
};

} // namespace rendezvous

#endif // ERRORS_HPP
