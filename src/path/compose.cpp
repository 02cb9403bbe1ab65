// FILEKIT - Path Composition Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/path/compose.h"

#include "filekit/core/error.h"
#include "filekit/util/logging.h"

#include <algorithm>

namespace filekit {
namespace path {

namespace {

void RejectWildcards(const std::vector<Path>& paths) {
    for (const auto& p : paths) {
        if (p.IsWildcard()) {
            throw FsError(ErrorCode::INVALID_COMPOSITION,
                          "wildcard path cannot be merged: " + p.String());
        }
    }
}

/// Fold the directory parts of paths[0..count)
Path FoldDirectories(const std::vector<Path>& paths, size_t count) {
    PathKind kind = paths.front().Kind();
    std::vector<std::string> components = paths.front().Components();

    for (size_t i = 1; i < count; ++i) {
        const Path& next = paths[i];
        if (next.IsAbsolute()) {
            kind = PathKind::Absolute;
            components = next.Components();
        } else {
            components.insert(components.end(),
                              next.Components().begin(), next.Components().end());
        }
    }
    return Path::Directory(kind, std::move(components));
}

} // namespace

Path MergeAsDirectory(const std::vector<Path>& paths) {
    if (paths.empty()) {
        return Path();
    }
    RejectWildcards(paths);
    return Canonicalize(FoldDirectories(paths, paths.size()));
}

Path MergeAsFile(const std::vector<Path>& paths) {
    if (paths.empty()) {
        return Path();
    }
    RejectWildcards(paths);

    Path dir = Canonicalize(FoldDirectories(paths, paths.size()));
    const Path& last = paths.back();
    if (last.IsDirectoryForm()) {
        LOG_DEBUG(util::LogCategory::PATH)
            << "MergeAsFile: last path " << last.String() << " has no file part";
        return dir;
    }
    return Path::File(dir.Kind(), dir.Components(),
                      last.Name(), last.Type(), last.Version());
}

Path DirectoryWildcard(const Path& dir) {
    if (dir.IsWildcard()) {
        throw FsError(ErrorCode::NOT_A_DIRECTORY_PATH,
                      "already a wildcard: " + dir.String());
    }
    Path result = dir.AsDirectory();
    result.name_ = WILDCARD_TOKEN;
    result.type_ = WILDCARD_TOKEN;
    result.version_.clear();
    result.wildcard_ = true;
    return result;
}

Path Relativize(const Path& root, const Path& path) {
    Path base = Canonicalize(root.AsDirectory());
    Path target = Canonicalize(path);

    if (base.Kind() != target.Kind()) {
        return path;
    }
    const auto& prefix = base.Components();
    const auto& full = target.Components();
    if (prefix.size() > full.size() ||
        !std::equal(prefix.begin(), prefix.end(), full.begin())) {
        return path;
    }
    std::vector<std::string> rest(full.begin() + prefix.size(), full.end());
    return target.WithKind(PathKind::Relative).WithComponents(std::move(rest));
}

} // namespace path
} // namespace filekit
