#pragma once

#include <string>

namespace blobgate {

// Failure classes shared by the store, the facade and the transfer client.
enum class ErrorCode {
    None,
    NotFound,             // Object or bucket absent
    RangeNotSatisfiable,  // Byte window outside the object
    BadRequest,           // Malformed range, bad name, nested collection
    TransientIO,          // Network failure, rate limiting, 5xx (retryable)
    IntegrityMismatch,    // Fingerprint/size mismatch after a transfer
    StorageIO,            // Local disk or manifest failure
    Cancelled             // Transfer cancelled by the caller
};

const char* error_code_name(ErrorCode code);

// HTTP status the facade answers with for a given failure class.
int http_status_for(ErrorCode code);

// Classify an HTTP status seen by the client side.
ErrorCode error_code_from_status(int status);

}  // namespace blobgate
