#include "../../include/common/errors.hpp"

namespace rendezvous {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNAUTHORIZED: return "unauthorized";
        case ErrorCode::INVALID_TOKEN: return "invalid_token";
        case ErrorCode::TOKEN_EXPIRED: return "token_expired";
        case ErrorCode::VALIDATION_ERROR: return "validation_error";
        case ErrorCode::INVALID_MESSAGE_TYPE: return "invalid_message_type";
        case ErrorCode::INVALID_PAYLOAD: return "invalid_payload";
        case ErrorCode::INVALID_ROOM_ID: return "invalid_room_id";
        case ErrorCode::ROOM_FULL: return "room_full";
        case ErrorCode::FILE_TOO_LARGE: return "file_too_large";
        case ErrorCode::TRANSFER_LIMIT_REACHED: return "transfer_limit_reached";
        case ErrorCode::CHECKSUM_MISMATCH: return "checksum_mismatch";
        case ErrorCode::STORE_UNAVAILABLE: return "store_unavailable";
        case ErrorCode::TRANSFER_NOT_FOUND: return "transfer_not_found";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::INVALID_STATE: return "invalid_state";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
    }
    return "internal_error";
}

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNAUTHORIZED:
        case ErrorCode::INVALID_TOKEN:
        case ErrorCode::TOKEN_EXPIRED:
            return 401;
        case ErrorCode::VALIDATION_ERROR:
        case ErrorCode::INVALID_MESSAGE_TYPE:
        case ErrorCode::INVALID_PAYLOAD:
        case ErrorCode::INVALID_ROOM_ID:
            return 400;
        case ErrorCode::ROOM_FULL:
        case ErrorCode::TRANSFER_LIMIT_REACHED:
        case ErrorCode::INVALID_STATE:
            return 409;
        case ErrorCode::FILE_TOO_LARGE:
            return 413;
        case ErrorCode::CHECKSUM_MISMATCH:
            return 422;
        case ErrorCode::STORE_UNAVAILABLE:
            return 503;
        case ErrorCode::TRANSFER_NOT_FOUND:
            return 404;
        case ErrorCode::PERMISSION_DENIED:
            return 403;
        case ErrorCode::INTERNAL_ERROR:
            return 500;
    }
    return 500;
}

} // namespace rendezvous
