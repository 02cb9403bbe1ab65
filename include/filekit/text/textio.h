// FILEKIT - Encoding-Aware Text I/O
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Reads and writes whole files as UTF-8 text.
//
// Both directions try the declared encoding, then UTF-8 once. When both
// fail the result carries a recoverable EncodingError and the caller may
// retry once with an explicit encoding through ReadTextWithEncoding or
// WriteTextWithEncoding. A write to an existing file without the owner
// write flag yields a recoverable PermissionError; ForceWritableAndWrite
// is its retry. Statuses returned by the retry entry points are terminal.

#ifndef FILEKIT_TEXT_TEXTIO_H
#define FILEKIT_TEXT_TEXTIO_H

#include "filekit/core/error.h"
#include "filekit/fs/os.h"
#include "filekit/path/path.h"
#include "filekit/text/encoding.h"

#include <string>
#include <vector>

namespace filekit {
namespace text {

using path::Path;
using fs::IfExists;

/// One decode or encode attempt made during a call
struct EncodingAttempt {
    std::string encoding;
    bool fallback{false};       // automatic UTF-8 retry
    bool success{false};
};

struct TextResult {
    Status status;
    std::string text;
    std::vector<EncodingAttempt> attempts;

    bool ok() const { return status.ok(); }
};

struct WriteResult {
    Status status;
    std::vector<EncodingAttempt> attempts;

    bool ok() const { return status.ok(); }
};

struct WriteOptions {
    std::string encoding{UTF8};
    IfExists ifExists{IfExists::Supersede};
};

// ============================================================================
// Reading
// ============================================================================

/**
 * Read a file as text.
 *
 * An empty `encoding` asks `detector` for one. The text holds exactly the
 * bytes read from the file, decoded; nothing is padded.
 *
 * Status: ok, EncodingError (recoverable) or IOError.
 */
TextResult ReadText(const Path& path, const std::string& encoding,
                    const IEncodingDetector& detector);

TextResult ReadText(const Path& path, const std::string& encoding = "");

/// Retry after an EncodingError: one attempt with `encoding`, no fallback
TextResult ReadTextWithEncoding(const Path& path, const std::string& encoding);

// ============================================================================
// Writing
// ============================================================================

/**
 * Write text to a file, creating missing parent directories.
 *
 * Status: ok, PermissionError (recoverable), EncodingError (recoverable),
 * AlreadyExists (IfExists::Error) or IOError.
 *
 * @throws FsError(WILDCARD_NOT_ALLOWED) for a wildcard path
 * @throws FsError(INVALID_COMPOSITION) for a directory-form path
 */
WriteResult WriteText(const Path& path, const std::string& text,
                      const WriteOptions& options = WriteOptions());

/// Retry after a PermissionError: set the owner write flag, write once more
WriteResult ForceWritableAndWrite(const Path& path, const std::string& text,
                                  const WriteOptions& options = WriteOptions());

/// Retry after an EncodingError: one attempt with `encoding`, no fallback
WriteResult WriteTextWithEncoding(const Path& path, const std::string& text,
                                  const std::string& encoding,
                                  IfExists ifExists = IfExists::Supersede);

} // namespace text
} // namespace filekit

#endif // FILEKIT_TEXT_TEXTIO_H
