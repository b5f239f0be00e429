#include "errors.hpp"

std::string ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connectivity: return "ConnectivityError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::RangeNotSatisfiable: return "RangeNotSatisfiableError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::SchemaValidation: return "SchemaValidationError";
        case ErrorKind::Timeout: return "TimeoutError";
        case ErrorKind::Cancelled: return "CancelledError";
        case ErrorKind::Overload: return "OverloadError";
        case ErrorKind::UnsupportedContent: return "UnsupportedContentError";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}

bool ErrorKindIsRetryable(ErrorKind kind) {
    return kind == ErrorKind::Connectivity || kind == ErrorKind::Overload;
}
