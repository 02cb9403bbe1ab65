// FILEKIT - Path Model
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Structured, immutable pathname representation:
// - Absolute/relative kind, kept even when component lists match
// - Directory components plus an optional file part (name, type, version)
// - Canonicalization that folds "." and cancellable ".." components
//
// Paths are values; every modifier returns a new Path.

#ifndef FILEKIT_PATH_PATH_H
#define FILEKIT_PATH_PATH_H

#include <string>
#include <vector>

namespace filekit {
namespace path {

/// Path separator used for parsing and rendering
constexpr char PATH_SEPARATOR = '/';

/// Separator between file name and type
constexpr char TYPE_SEPARATOR = '.';

/// Match-all token used in wildcard paths
constexpr const char* WILDCARD_TOKEN = "*";

enum class PathKind {
    Absolute,
    Relative
};

class Path;

/// Defined in compose.h; the only producer of wildcard paths
Path DirectoryWildcard(const Path& dir);

// ============================================================================
// Path
// ============================================================================

class Path {
public:
    /// Empty relative directory path
    Path() = default;

    /// Parse a native path string.
    /// A trailing separator, or a final "." / ".." component, yields a
    /// directory-form path; otherwise the last component is the file part.
    static Path Parse(const std::string& str);

    /// Build a directory-form path from components
    static Path Directory(PathKind kind, std::vector<std::string> components);

    /// Build a file-form path from components and a file part
    static Path File(PathKind kind, std::vector<std::string> components,
                     std::string name, std::string type = "",
                     std::string version = "");

    // Accessors
    PathKind Kind() const { return kind_; }
    bool IsAbsolute() const { return kind_ == PathKind::Absolute; }
    bool IsRelative() const { return kind_ == PathKind::Relative; }
    bool IsDirectoryForm() const { return name_.empty(); }
    bool IsFileForm() const { return !name_.empty(); }
    bool IsWildcard() const { return wildcard_; }

    /// Relative, no components and no file part
    bool Empty() const;

    const std::vector<std::string>& Components() const { return components_; }
    const std::string& Name() const { return name_; }
    const std::string& Type() const { return type_; }
    const std::string& Version() const { return version_; }

    /// File part rendered as "name[.type]"; empty for directory form
    std::string Filename() const;

    // Derived paths
    Path WithComponents(std::vector<std::string> components) const;
    Path WithKind(PathKind kind) const;
    Path WithVersion(const std::string& version) const;

    /// Same directory, no file part
    Path DirectoryPart() const;

    /// "a/b" (file form) -> "a/b/"; directory paths are returned as is
    Path AsDirectory() const;

    /// "a/b/" -> "a/b" (file form); file paths and empty paths are returned as is
    Path AsFile() const;

    /// Containing directory
    Path Parent() const;

    /// File inside this directory, filename split into name and type
    Path Child(const std::string& filename) const;

    /// Subdirectory of this directory
    Path ChildDirectory(const std::string& name) const;

    // Rendering
    std::string String() const;

    /// String() for OS calls: never empty ("." for the empty path) and
    /// without the trailing separator of directory form
    std::string NativeString() const;

    bool operator==(const Path& other) const;
    bool operator!=(const Path& other) const { return !(*this == other); }
    bool operator<(const Path& other) const;

private:
    friend Path DirectoryWildcard(const Path& dir);

    PathKind kind_{PathKind::Relative};
    std::vector<std::string> components_;
    std::string name_;
    std::string type_;
    std::string version_;
    bool wildcard_{false};

    /// Split "name.type"; a leading or trailing dot does not start a type
    static void SplitFilename(const std::string& filename,
                              std::string& name, std::string& type);

    static void CheckComponent(const std::string& component);
};

// ============================================================================
// Canonicalization
// ============================================================================

/**
 * Reduce a path to normal form.
 *
 * "." components are dropped; ".." cancels the preceding component unless
 * there is none or it is itself ".."; in that case the ".." is kept. Kind
 * and file part are preserved. Idempotent.
 *
 * @throws FsError(WILDCARD_NOT_ALLOWED) for wildcard paths
 */
Path Canonicalize(const Path& path);

/// Equal after canonicalization
bool CanonicallyEqual(const Path& a, const Path& b);

} // namespace path
} // namespace filekit

#endif // FILEKIT_PATH_PATH_H
