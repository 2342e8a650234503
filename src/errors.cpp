#include "blobgate/core/errors.hpp"

namespace blobgate {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::RangeNotSatisfiable: return "RangeNotSatisfiable";
        case ErrorCode::BadRequest: return "BadRequest";
        case ErrorCode::TransientIO: return "TransientIO";
        case ErrorCode::IntegrityMismatch: return "IntegrityMismatch";
        case ErrorCode::StorageIO: return "StorageIO";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return 200;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::RangeNotSatisfiable: return 416;
        case ErrorCode::BadRequest: return 400;
        case ErrorCode::TransientIO: return 503;
        case ErrorCode::IntegrityMismatch: return 500;
        case ErrorCode::StorageIO: return 500;
        case ErrorCode::Cancelled: return 499;
    }
    return 500;
}

ErrorCode error_code_from_status(int status) {
    if (status >= 200 && status < 300) return ErrorCode::None;
    switch (status) {
        case 400: return ErrorCode::BadRequest;
        case 404: return ErrorCode::NotFound;
        case 416: return ErrorCode::RangeNotSatisfiable;
        case 429: return ErrorCode::TransientIO;
        default: break;
    }
    if (status >= 500 && status < 600) return ErrorCode::TransientIO;
    return ErrorCode::BadRequest;
}

}  // namespace blobgate
