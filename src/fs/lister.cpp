// FILEKIT - Directory Listing Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/fs/lister.h"

#include "filekit/core/error.h"
#include "filekit/fs/os.h"
#include "filekit/path/compose.h"
#include "filekit/util/logging.h"

#include <algorithm>
#include <set>

namespace filekit {
namespace fs {

namespace {

EntryKind KindOf(const OsEntry& entry) {
    switch (entry.type) {
        case FileType::Directory: return EntryKind::Directory;
        case FileType::Symlink:   return EntryKind::Symlink;
        default:                  return EntryKind::File;
    }
}

} // namespace

const char* EntryKindToString(EntryKind kind) {
    switch (kind) {
        case EntryKind::File:      return "file";
        case EntryKind::Directory: return "directory";
        case EntryKind::Symlink:   return "symlink";
        default:                   return "unknown";
    }
}

std::vector<DirectoryEntry> ListDirectory(const Path& dir, bool followSymlinks) {
    if (dir.IsWildcard()) {
        throw FsError(ErrorCode::WILDCARD_NOT_ALLOWED,
                      "cannot list a wildcard path " + dir.String());
    }

    Path wildcard = path::DirectoryWildcard(dir.AsDirectory());
    std::vector<OsEntry> found = EnumerateDirectory(wildcard, followSymlinks);

    std::vector<DirectoryEntry> entries;
    entries.reserve(found.size());
    std::set<std::string> seen;
    for (const auto& entry : found) {
        if (followSymlinks && entry.resolved && !seen.insert(entry.path.String()).second) {
            LOG_TRACE(util::LogCategory::LIST)
                << "duplicate target " << entry.path.String() << " skipped";
            continue;
        }
        entries.push_back(DirectoryEntry{entry.path, KindOf(entry)});
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) {
                  return a.path < b.path;
              });

    LOG_DEBUG(util::LogCategory::LIST)
        << "listed " << entries.size() << " entries in " << dir.AsDirectory().String();
    return entries;
}

} // namespace fs
} // namespace filekit
