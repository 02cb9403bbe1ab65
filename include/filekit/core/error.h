// FILEKIT - Error Types
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Two ways of reporting failure are used throughout the library:
// - FsError is thrown for structural or programmer errors (bad paths,
//   bad options, missing traversal roots) and for OS failures that leave
//   nothing sensible to return.
// - Status is returned for outcomes the caller is expected to inspect,
//   including the two recoverable kinds (encoding, permission) that come
//   with an explicit retry entry point.

#ifndef FILEKIT_CORE_ERROR_H
#define FILEKIT_CORE_ERROR_H

#include <stdexcept>
#include <string>

namespace filekit {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    OK = 0,

    // Path structure
    INVALID_COMPOSITION,
    WILDCARD_NOT_ALLOWED,
    NOT_A_DIRECTORY_PATH,

    // Traversal / configuration
    DIRECTORY_NOT_FOUND,
    INVALID_OPTION,

    // Content I/O
    ENCODING_ERROR,
    PERMISSION_ERROR,
    ALREADY_EXISTS,
    IO_ERROR,
};

/// Convert error code to string
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// FsError
// ============================================================================

/// Exception carrying an ErrorCode
class FsError : public std::runtime_error {
public:
    FsError(ErrorCode code, const std::string& msg)
        : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " + msg)
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// ============================================================================
// Status
// ============================================================================

/**
 * Outcome of an operation that reports rather than throws.
 *
 * A recoverable status means the caller may use the matching retry entry
 * point exactly once; a status returned from a retry entry point is never
 * recoverable.
 */
class Status {
public:
    Status() : code_(ErrorCode::OK), recoverable_(false) {}
    Status(ErrorCode code, const std::string& msg = "", bool recoverable = false)
        : code_(code), message_(msg), recoverable_(recoverable) {}

    static Status Ok() { return Status(); }
    static Status EncodingError(const std::string& msg, bool recoverable) {
        return Status(ErrorCode::ENCODING_ERROR, msg, recoverable);
    }
    static Status PermissionError(const std::string& msg, bool recoverable) {
        return Status(ErrorCode::PERMISSION_ERROR, msg, recoverable);
    }
    static Status AlreadyExists(const std::string& msg = "") {
        return Status(ErrorCode::ALREADY_EXISTS, msg);
    }
    static Status IOError(const std::string& msg = "") {
        return Status(ErrorCode::IO_ERROR, msg);
    }

    bool ok() const { return code_ == ErrorCode::OK; }
    bool IsEncodingError() const { return code_ == ErrorCode::ENCODING_ERROR; }
    bool IsPermissionError() const { return code_ == ErrorCode::PERMISSION_ERROR; }
    bool IsAlreadyExists() const { return code_ == ErrorCode::ALREADY_EXISTS; }
    bool IsIOError() const { return code_ == ErrorCode::IO_ERROR; }
    bool IsRecoverable() const { return recoverable_; }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    /// Mark as terminal (used by retry entry points)
    Status& Terminal() {
        recoverable_ = false;
        return *this;
    }

    std::string ToString() const;

private:
    ErrorCode code_;
    std::string message_;
    bool recoverable_;
};

} // namespace filekit

#endif // FILEKIT_CORE_ERROR_H
