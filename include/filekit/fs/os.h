// FILEKIT - OS Filesystem Primitives
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Thin wrappers over POSIX calls that the higher layers build on:
// - File status and permission bits
// - Directory creation and removal
// - Raw byte reads and writes
// - Enumeration of the entries matched by a directory wildcard
// - Content checksums

#ifndef FILEKIT_FS_OS_H
#define FILEKIT_FS_OS_H

#include "filekit/core/error.h"
#include "filekit/path/path.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace filekit {
namespace fs {

using path::Path;

// ============================================================================
// File/Directory Status
// ============================================================================

enum class FileType {
    None,           // Not found or error
    Regular,
    Directory,
    Symlink,
    Block,
    Character,
    Fifo,
    Socket,
    Unknown
};

const char* FileTypeToString(FileType type);

/// Owner/group/others read-write-execute flags
struct Permissions {
    bool ownerRead{false};
    bool ownerWrite{false};
    bool ownerExecute{false};
    bool groupRead{false};
    bool groupWrite{false};
    bool groupExecute{false};
    bool othersRead{false};
    bool othersWrite{false};
    bool othersExecute{false};

    /// Numeric mode (e.g. 0644)
    uint16_t Mode() const;

    static Permissions FromMode(uint16_t mode);
    static Permissions DefaultFile();
    static Permissions DefaultDirectory();
};

struct FileStatus {
    FileType type{FileType::None};
    Permissions permissions;
    uint64_t size{0};
    std::chrono::system_clock::time_point modifiedTime;

    bool Exists() const { return type != FileType::None; }
    bool IsFile() const { return type == FileType::Regular; }
    bool IsDirectory() const { return type == FileType::Directory; }
    bool IsSymlink() const { return type == FileType::Symlink; }
    bool IsFifo() const { return type == FileType::Fifo; }
};

/// Status following symlinks
FileStatus Status(const Path& path);

/// Status of the link itself
FileStatus SymlinkStatus(const Path& path);

bool Exists(const Path& path);
bool IsFile(const Path& path);
bool IsDirectory(const Path& path);
bool IsSymlink(const Path& path);
bool IsFifo(const Path& path);
uint64_t FileSize(const Path& path);

// ============================================================================
// Permission Oracle
// ============================================================================

/// Permission bits, nullopt if the path does not exist
std::optional<Permissions> GetPermissions(const Path& path);

bool SetPermissions(const Path& path, const Permissions& permissions);

/// True if the owner write flag is set. Checks the mode bits rather than
/// access(2), so the answer does not depend on the effective user.
bool IsWritableByOwner(const Path& path);

/// Set the owner write flag, keeping the other bits
bool MakeWritable(const Path& path);

// ============================================================================
// Directory Operations
// ============================================================================

bool CreateDirectory(const Path& path, uint16_t mode = 0755);

/// Create a directory and any missing parents; true if it exists afterwards
bool CreateDirectories(const Path& path);

bool RemoveFile(const Path& path);
bool RemoveDirectory(const Path& path);

/// Remove a file, or a directory with everything below it.
/// Symlinks are removed, never followed.
bool RemoveAll(const Path& path);

bool CopyFile(const Path& from, const Path& to, bool overwrite = false);

// ============================================================================
// Path Queries
// ============================================================================

Path CurrentPath();

/// Directory for temporary files ($TMPDIR, else /tmp)
Path TempDirectoryPath();

/// Resolve symlinks and relative components through the OS.
/// Directories come back in directory form. nullopt if resolution fails.
std::optional<Path> RealPath(const Path& path);

// ============================================================================
// Raw Byte I/O
// ============================================================================

/// What a write does when the destination already exists
enum class IfExists {
    Supersede,      // Truncate and overwrite
    Append,         // Write after existing content
    Error           // Fail with ALREADY_EXISTS
};

/// Read a whole file. The result holds exactly the bytes that were read,
/// which may differ from the size reported by stat() for files that
/// change underneath us or that have no size (FIFOs, /proc).
std::optional<std::vector<uint8_t>> ReadFileBytes(const Path& path);

filekit::Status WriteFileBytes(const Path& path, const uint8_t* data, size_t size,
                               IfExists ifExists = IfExists::Supersede,
                               uint16_t mode = 0644);

filekit::Status WriteFileBytes(const Path& path, const std::vector<uint8_t>& content,
                               IfExists ifExists = IfExists::Supersede);

// ============================================================================
// Enumeration
// ============================================================================

/// One entry produced by EnumerateDirectory
struct OsEntry {
    Path path;
    FileType type{FileType::Unknown};
    bool resolved{false};       // path is the symlink-free real path
};

/**
 * Entries matched by a wildcard produced by path::DirectoryWildcard.
 *
 * With resolveSymlinks the entries are realpath()s with the type of their
 * target; an entry that cannot be resolved (dangling link) keeps its
 * unresolved path with type Symlink. Without it, entries are reported as
 * lstat() sees them. "." and ".." are never reported.
 *
 * @throws FsError(INVALID_COMPOSITION) if `wildcard` is not a wildcard
 * @throws FsError(IO_ERROR) if the directory cannot be read
 */
std::vector<OsEntry> EnumerateDirectory(const Path& wildcard, bool resolveSymlinks);

// ============================================================================
// Checksums
// ============================================================================

/// SHA-256 of the file content as lowercase hex; empty on failure
std::string FileChecksum(const Path& path);

/// SHA-256 of a byte range as lowercase hex
std::string Sha256Hex(const uint8_t* data, size_t size);

} // namespace fs
} // namespace filekit

#endif // FILEKIT_FS_OS_H
