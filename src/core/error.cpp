// FILEKIT - Error Types Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/core/error.h"

namespace filekit {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                    return "OK";
        case ErrorCode::INVALID_COMPOSITION:   return "InvalidComposition";
        case ErrorCode::WILDCARD_NOT_ALLOWED:  return "WildcardNotAllowed";
        case ErrorCode::NOT_A_DIRECTORY_PATH:  return "NotADirectoryPath";
        case ErrorCode::DIRECTORY_NOT_FOUND:   return "DirectoryNotFound";
        case ErrorCode::INVALID_OPTION:        return "InvalidOption";
        case ErrorCode::ENCODING_ERROR:        return "EncodingError";
        case ErrorCode::PERMISSION_ERROR:      return "PermissionError";
        case ErrorCode::ALREADY_EXISTS:        return "AlreadyExists";
        case ErrorCode::IO_ERROR:              return "IOError";
        default:                               return "Unknown";
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result = ErrorCodeToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    if (recoverable_) {
        result += " (recoverable)";
    }
    return result;
}

} // namespace filekit
