// FILEKIT - Recursive Directory Traversal
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Walks a directory tree and applies a visitor to the entries found.
// Files are always candidates for a visit; directories are visited only
// when a DirectoryVisit order is requested:
//
//   None          directories are traversed but never visited
//   DepthFirst    children first, then the directory itself
//   BreadthFirst  the directory first; a directory rejected by the test
//                 is skipped together with everything below it

#ifndef FILEKIT_FS_WALKER_H
#define FILEKIT_FS_WALKER_H

#include "filekit/fs/lister.h"

#include <functional>
#include <string>

namespace filekit {
namespace fs {

enum class DirectoryVisit {
    None,
    DepthFirst,
    BreadthFirst
};

/// What WalkDirectory does when the root does not exist
enum class IfMissing {
    Error,          // Throw DIRECTORY_NOT_FOUND
    Ignore          // Return without visiting anything
};

const char* DirectoryVisitToString(DirectoryVisit visit);
const char* IfMissingToString(IfMissing ifMissing);

/// Accepts "none", "depth-first", "breadth-first" (any case, '-' or '_'),
/// and the boolean spellings: true/yes/t select DepthFirst, false/no None.
/// @throws FsError(INVALID_OPTION) for anything else
DirectoryVisit ParseDirectoryVisit(const std::string& str);

/// Accepts "error" and "ignore" (any case)
/// @throws FsError(INVALID_OPTION) for anything else
IfMissing ParseIfMissing(const std::string& str);

using WalkVisitor = std::function<void(const DirectoryEntry&)>;
using WalkTest = std::function<bool(const DirectoryEntry&)>;

struct WalkOptions {
    /// Directories are visited after their contents unless told otherwise
    DirectoryVisit directories{DirectoryVisit::DepthFirst};

    /// Filter applied before each visit; empty accepts everything
    WalkTest test;

    IfMissing ifMissing{IfMissing::Error};

    bool followSymlinks{true};
};

/**
 * Traverse `dir` recursively, calling `visit` for every accepted entry.
 *
 * When following symlinks a directory whose real path was already entered
 * during this call is not entered again.
 *
 * @throws FsError(WILDCARD_NOT_ALLOWED) if `dir` is a wildcard
 * @throws FsError(DIRECTORY_NOT_FOUND) if `dir` is absent and
 *         options.ifMissing is Error
 * @throws FsError(INVALID_OPTION) for an out-of-range option value
 * @throws FsError(IO_ERROR) if a directory cannot be listed
 */
void WalkDirectory(const Path& dir, const WalkVisitor& visit,
                   const WalkOptions& options = WalkOptions());

} // namespace fs
} // namespace filekit

#endif // FILEKIT_FS_WALKER_H
