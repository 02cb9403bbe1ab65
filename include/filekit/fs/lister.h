// FILEKIT - Directory Listing
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#ifndef FILEKIT_FS_LISTER_H
#define FILEKIT_FS_LISTER_H

#include "filekit/path/path.h"

#include <string>
#include <vector>

namespace filekit {
namespace fs {

using path::Path;

/// Discriminator of a listed entry
enum class EntryKind {
    File,
    Directory,
    Symlink         // Not followed, or dangling
};

const char* EntryKindToString(EntryKind kind);

/// One immediate entry of a directory
struct DirectoryEntry {
    Path path;
    EntryKind kind{EntryKind::File};

    bool IsDirectory() const { return kind == EntryKind::Directory; }

    bool operator==(const DirectoryEntry& other) const {
        return path == other.path && kind == other.kind;
    }
};

/**
 * List the immediate entries of a directory.
 *
 * With followSymlinks every entry is resolved to its real path, so entries
 * may lie outside `dir`, and two entries resolving to the same target are
 * reported once. A dangling link is reported unresolved as Symlink.
 * Without it entries are reported as seen, symlinks as Symlink.
 * Directories are always in directory form. The result is sorted by
 * rendered path.
 *
 * A file-form `dir` names the directory `dir/`.
 *
 * @throws FsError(WILDCARD_NOT_ALLOWED) if `dir` is a wildcard
 * @throws FsError(IO_ERROR) if the directory is missing or unreadable
 */
std::vector<DirectoryEntry> ListDirectory(const Path& dir, bool followSymlinks = true);

} // namespace fs
} // namespace filekit

#endif // FILEKIT_FS_LISTER_H
