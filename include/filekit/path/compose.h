// FILEKIT - Path Composition
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Left-to-right merging of several paths into one, and construction of
// the wildcard path used to drive directory enumeration.

#ifndef FILEKIT_PATH_COMPOSE_H
#define FILEKIT_PATH_COMPOSE_H

#include "filekit/path/path.h"

#include <vector>

namespace filekit {
namespace path {

/**
 * Merge paths into a canonical directory path.
 *
 * The first path seeds kind and components. Each later absolute path
 * replaces everything accumulated so far; each later relative path is
 * appended. File parts are discarded. An empty list yields Path().
 *
 * @throws FsError(INVALID_COMPOSITION) if any input is a wildcard
 */
Path MergeAsDirectory(const std::vector<Path>& paths);

/**
 * Merge paths into a canonical file path.
 *
 * Directories are folded exactly as in MergeAsDirectory (the last path's
 * own directory part included), then the last path's name, type and
 * version are attached. An empty list yields Path().
 *
 * @throws FsError(INVALID_COMPOSITION) if any input is a wildcard
 */
Path MergeAsFile(const std::vector<Path>& paths);

/**
 * Wildcard matching every entry of a directory.
 *
 * @throws FsError(NOT_A_DIRECTORY_PATH) if dir already is a wildcard
 */
Path DirectoryWildcard(const Path& dir);

/// Path of `path` relative to directory `root`, or `path` unchanged
/// when it does not lie under `root`
Path Relativize(const Path& root, const Path& path);

} // namespace path
} // namespace filekit

#endif // FILEKIT_PATH_COMPOSE_H
