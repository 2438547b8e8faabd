// common/errors.hpp
#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Validation,
    Decode,
    NotFound,
    Permission,
    Storage,
    Unavailable,
    Config
};

class MeterStoreError : public std::runtime_error {
public:
    MeterStoreError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    bool retryable() const noexcept { return kind_ == ErrorKind::Unavailable; }

private:
    ErrorKind kind_;
};

// Malformed payload, unknown field, bad identifier. Never retried.
class ValidationError : public MeterStoreError {
public:
    explicit ValidationError(const std::string& msg)
        : MeterStoreError(ErrorKind::Validation, msg) {}

protected:
    ValidationError(ErrorKind kind, const std::string& msg)
        : MeterStoreError(kind, msg) {}
};

// Register words that cannot be interpreted as the requested type.
// Reported to callers as a validation failure.
class DecodeError : public ValidationError {
public:
    explicit DecodeError(const std::string& msg)
        : ValidationError(ErrorKind::Decode, msg) {}
};

class NotFoundError : public MeterStoreError {
public:
    explicit NotFoundError(const std::string& msg)
        : MeterStoreError(ErrorKind::NotFound, msg) {}
};

class PermissionError : public MeterStoreError {
public:
    explicit PermissionError(const std::string& msg)
        : MeterStoreError(ErrorKind::Permission, msg) {}
};

class StorageError : public MeterStoreError {
public:
    StorageError(const std::string& msg, std::string sqlstate = "")
        : MeterStoreError(ErrorKind::Storage, msg), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const noexcept { return sqlstate_; }

protected:
    StorageError(ErrorKind kind, const std::string& msg, std::string sqlstate)
        : MeterStoreError(kind, msg), sqlstate_(std::move(sqlstate)) {}

private:
    std::string sqlstate_;
};

// Pool exhaustion or lost connection: the caller may retry.
class UnavailableError : public StorageError {
public:
    explicit UnavailableError(const std::string& msg)
        : StorageError(ErrorKind::Unavailable, msg, "") {}
};

class ConfigError : public MeterStoreError {
public:
    explicit ConfigError(const std::string& msg)
        : MeterStoreError(ErrorKind::Config, msg) {}
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Decode: return "decode";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Permission: return "permission";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::Unavailable: return "unavailable";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}
