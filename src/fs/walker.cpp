// FILEKIT - Recursive Directory Traversal Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/fs/walker.h"

#include "filekit/core/error.h"
#include "filekit/fs/os.h"
#include "filekit/util/logging.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace filekit {
namespace fs {

namespace {

std::string NormalizeOption(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        if (c == '_') c = '-';
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    size_t start = out.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = out.find_last_not_of(" \t");
    return out.substr(start, end - start + 1);
}

/// Per-call traversal state
class Walker {
public:
    Walker(const WalkVisitor& visit, const WalkOptions& options)
        : visit_(visit), options_(options) {}

    void Walk(const DirectoryEntry& entry);

    size_t Visited() const { return visited_; }

private:
    bool Accept(const DirectoryEntry& entry) const {
        return !options_.test || options_.test(entry);
    }

    void Visit(const DirectoryEntry& entry) {
        ++visited_;
        visit_(entry);
    }

    void WalkChildren(const DirectoryEntry& dir) {
        for (const auto& child : ListDirectory(dir.path, options_.followSymlinks)) {
            Walk(child);
        }
    }

    /// False if the directory was already entered through another link
    bool Enter(const Path& dir);

    const WalkVisitor& visit_;
    const WalkOptions& options_;
    std::set<std::string> entered_;
    size_t visited_{0};
};

bool Walker::Enter(const Path& dir) {
    if (!options_.followSymlinks) {
        return true;
    }
    auto real = RealPath(dir);
    std::string key = real ? real->String() : dir.String();
    if (!entered_.insert(key).second) {
        LOG_DEBUG(util::LogCategory::WALK) << "not re-entering " << key;
        return false;
    }
    return true;
}

void Walker::Walk(const DirectoryEntry& entry) {
    if (!entry.IsDirectory()) {
        if (Accept(entry)) {
            Visit(entry);
        }
        return;
    }

    if (!Enter(entry.path)) {
        return;
    }

    switch (options_.directories) {
        case DirectoryVisit::None:
            WalkChildren(entry);
            break;

        case DirectoryVisit::BreadthFirst:
            if (!Accept(entry)) {
                LOG_TRACE(util::LogCategory::WALK) << "pruned " << entry.path.String();
                return;
            }
            Visit(entry);
            WalkChildren(entry);
            break;

        case DirectoryVisit::DepthFirst:
            WalkChildren(entry);
            if (Accept(entry)) {
                Visit(entry);
            }
            break;
    }
}

void CheckOptions(const WalkOptions& options) {
    switch (options.directories) {
        case DirectoryVisit::None:
        case DirectoryVisit::DepthFirst:
        case DirectoryVisit::BreadthFirst:
            break;
        default:
            throw FsError(ErrorCode::INVALID_OPTION,
                          "directories: " +
                          std::to_string(static_cast<int>(options.directories)));
    }
    switch (options.ifMissing) {
        case IfMissing::Error:
        case IfMissing::Ignore:
            break;
        default:
            throw FsError(ErrorCode::INVALID_OPTION,
                          "if_missing: " +
                          std::to_string(static_cast<int>(options.ifMissing)));
    }
}

} // namespace

// ============================================================================
// Option Conversion
// ============================================================================

const char* DirectoryVisitToString(DirectoryVisit visit) {
    switch (visit) {
        case DirectoryVisit::None:         return "none";
        case DirectoryVisit::DepthFirst:   return "depth-first";
        case DirectoryVisit::BreadthFirst: return "breadth-first";
        default:                           return "unknown";
    }
}

const char* IfMissingToString(IfMissing ifMissing) {
    switch (ifMissing) {
        case IfMissing::Error:  return "error";
        case IfMissing::Ignore: return "ignore";
        default:                return "unknown";
    }
}

DirectoryVisit ParseDirectoryVisit(const std::string& str) {
    std::string value = NormalizeOption(str);
    if (value == "none" || value == "false" || value == "no") {
        return DirectoryVisit::None;
    }
    if (value == "depth-first" || value == "true" || value == "yes" || value == "t") {
        return DirectoryVisit::DepthFirst;
    }
    if (value == "breadth-first") {
        return DirectoryVisit::BreadthFirst;
    }
    throw FsError(ErrorCode::INVALID_OPTION, "unknown directory visit order: " + str);
}

IfMissing ParseIfMissing(const std::string& str) {
    std::string value = NormalizeOption(str);
    if (value == "error") return IfMissing::Error;
    if (value == "ignore") return IfMissing::Ignore;
    throw FsError(ErrorCode::INVALID_OPTION, "unknown if_missing policy: " + str);
}

// ============================================================================
// Traversal
// ============================================================================

void WalkDirectory(const Path& dir, const WalkVisitor& visit, const WalkOptions& options) {
    if (dir.IsWildcard()) {
        throw FsError(ErrorCode::WILDCARD_NOT_ALLOWED,
                      "cannot walk a wildcard path " + dir.String());
    }
    CheckOptions(options);

    Path root = dir.AsDirectory();
    if (!IsDirectory(root)) {
        if (options.ifMissing == IfMissing::Ignore) {
            LOG_DEBUG(util::LogCategory::WALK) << "missing root ignored: " << root.String();
            return;
        }
        throw FsError(ErrorCode::DIRECTORY_NOT_FOUND, root.String());
    }

    FILEKIT_LOG_TIMER(util::LogCategory::WALK, "walk " + root.String());

    Walker walker(visit, options);
    walker.Walk(DirectoryEntry{root, EntryKind::Directory});

    LOG_DEBUG(util::LogCategory::WALK)
        << "walked " << root.String() << " (" << DirectoryVisitToString(options.directories)
        << "), " << walker.Visited() << " visits";
}

} // namespace fs
} // namespace filekit
