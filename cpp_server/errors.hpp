#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Failure taxonomy shared by the storage adapter, transfer engine and dispatcher.
// The wire name of each kind is what callers branch on.
enum class ErrorKind {
    Connectivity,
    NotFound,
    RangeNotSatisfiable,
    Integrity,
    SchemaValidation,
    Timeout,
    Cancelled,
    Overload,
    UnsupportedContent,
    Internal
};

std::string ErrorKindName(ErrorKind kind);

// Connectivity and Overload are transient; everything else needs a different request.
bool ErrorKindIsRetryable(ErrorKind kind);

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }
    std::string KindName() const { return ErrorKindName(kind_); }
    bool IsRetryable() const { return ErrorKindIsRetryable(kind_); }

private:
    ErrorKind kind_;
};

class ConnectivityError : public BridgeError {
public:
    explicit ConnectivityError(const std::string& message)
        : BridgeError(ErrorKind::Connectivity, message) {}
};

class NotFoundError : public BridgeError {
public:
    explicit NotFoundError(const std::string& message)
        : BridgeError(ErrorKind::NotFound, message) {}
};

class RangeNotSatisfiableError : public BridgeError {
public:
    explicit RangeNotSatisfiableError(const std::string& message)
        : BridgeError(ErrorKind::RangeNotSatisfiable, message) {}
};

class IntegrityError : public BridgeError {
public:
    explicit IntegrityError(const std::string& message)
        : BridgeError(ErrorKind::Integrity, message) {}
};

class SchemaValidationError : public BridgeError {
public:
    explicit SchemaValidationError(const std::string& message)
        : BridgeError(ErrorKind::SchemaValidation, message) {}
};

class TimeoutError : public BridgeError {
public:
    explicit TimeoutError(const std::string& message)
        : BridgeError(ErrorKind::Timeout, message) {}
};

class CancelledError : public BridgeError {
public:
    explicit CancelledError(const std::string& message)
        : BridgeError(ErrorKind::Cancelled, message) {}
};

class OverloadError : public BridgeError {
public:
    explicit OverloadError(const std::string& message)
        : BridgeError(ErrorKind::Overload, message) {}
};

class UnsupportedContentError : public BridgeError {
public:
    explicit UnsupportedContentError(const std::string& message)
        : BridgeError(ErrorKind::UnsupportedContent, message) {}
};

class InternalError : public BridgeError {
public:
    explicit InternalError(const std::string& message)
        : BridgeError(ErrorKind::Internal, message) {}
};

#endif // ERRORS_HPP
