#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mediafetch {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    // transport
    NetworkError,
    Timeout,
    RateLimited,
    ServerError,
    Unauthorized,
    NotFound,
    HttpError,
    TlsVerificationFailed,
    // structural
    ManifestInvalid,
    ResolutionFailed,
    DecryptionFailure,
    ChunkSizeMismatch,
    ChecksumMismatch,
    // resource
    IoError,
    StorageFull,
    PermissionDenied,
    // ledger
    CorruptedData,
    ValidationError,
    OperationCancelled,
    InvalidState,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::RateLimited: return "Rate limited";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::HttpError: return "HTTP error";
        case ErrorCode::TlsVerificationFailed: return "TLS verification failed";
        case ErrorCode::ManifestInvalid: return "Invalid manifest";
        case ErrorCode::ResolutionFailed: return "Manifest resolution failed";
        case ErrorCode::DecryptionFailure: return "Decryption failure";
        case ErrorCode::ChunkSizeMismatch: return "Chunk size mismatch";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::StorageFull: return "Storage full";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Broad failure classes used when reporting a job outcome.
enum class ErrorCategory { None, Transient, Structural, Resource, Cancelled };

constexpr ErrorCategory categorize(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return ErrorCategory::None;
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::RateLimited:
        case ErrorCode::ServerError:
            return ErrorCategory::Transient;
        case ErrorCode::IoError:
        case ErrorCode::StorageFull:
        case ErrorCode::PermissionDenied:
            return ErrorCategory::Resource;
        case ErrorCode::OperationCancelled:
            return ErrorCategory::Cancelled;
        default:
            return ErrorCategory::Structural;
    }
}

constexpr bool isTransient(ErrorCode code) {
    return categorize(code) == ErrorCategory::Transient;
}

constexpr const char* categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::Transient: return "transient";
        case ErrorCategory::Structural: return "structural";
        case ErrorCategory::Resource: return "resource";
        case ErrorCategory::Cancelled: return "cancelled";
    }
    return "none";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace mediafetch
