// FILEKIT - Path Model Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/path/path.h"

#include "filekit/core/error.h"

#include <sstream>
#include <tuple>

namespace filekit {
namespace path {

namespace {

bool IsDotComponent(const std::string& component) {
    return component == "." || component == "..";
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

void Path::CheckComponent(const std::string& component) {
    if (component.empty()) {
        throw FsError(ErrorCode::INVALID_COMPOSITION, "empty path component");
    }
    if (component.find(PATH_SEPARATOR) != std::string::npos) {
        throw FsError(ErrorCode::INVALID_COMPOSITION,
                      "path component contains a separator: " + component);
    }
}

void Path::SplitFilename(const std::string& filename,
                         std::string& name, std::string& type) {
    size_t pos = filename.find_last_of(TYPE_SEPARATOR);
    if (pos == std::string::npos || pos == 0 || pos + 1 == filename.size()) {
        name = filename;
        type.clear();
        return;
    }
    name = filename.substr(0, pos);
    type = filename.substr(pos + 1);
}

Path Path::Parse(const std::string& str) {
    Path result;
    if (str.empty()) {
        return result;
    }

    result.kind_ = (str[0] == PATH_SEPARATOR) ? PathKind::Absolute : PathKind::Relative;

    std::vector<std::string> segments;
    std::istringstream iss(str);
    std::string segment;
    while (std::getline(iss, segment, PATH_SEPARATOR)) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }

    bool directoryForm = str.back() == PATH_SEPARATOR ||
                         segments.empty() ||
                         IsDotComponent(segments.back());
    if (!directoryForm) {
        SplitFilename(segments.back(), result.name_, result.type_);
        segments.pop_back();
    }
    result.components_ = std::move(segments);
    return result;
}

Path Path::Directory(PathKind kind, std::vector<std::string> components) {
    for (const auto& c : components) {
        CheckComponent(c);
    }
    Path result;
    result.kind_ = kind;
    result.components_ = std::move(components);
    return result;
}

Path Path::File(PathKind kind, std::vector<std::string> components,
                std::string name, std::string type, std::string version) {
    Path result = Directory(kind, std::move(components));
    CheckComponent(name);
    if (!type.empty()) {
        CheckComponent(type);
    }
    result.name_ = std::move(name);
    result.type_ = std::move(type);
    result.version_ = std::move(version);
    return result;
}

// ============================================================================
// Accessors
// ============================================================================

bool Path::Empty() const {
    return kind_ == PathKind::Relative && components_.empty() && name_.empty();
}

std::string Path::Filename() const {
    if (name_.empty()) return "";
    if (type_.empty()) return name_;
    return name_ + TYPE_SEPARATOR + type_;
}

// ============================================================================
// Derived Paths
// ============================================================================

Path Path::WithComponents(std::vector<std::string> components) const {
    for (const auto& c : components) {
        CheckComponent(c);
    }
    Path result(*this);
    result.components_ = std::move(components);
    return result;
}

Path Path::WithKind(PathKind kind) const {
    Path result(*this);
    result.kind_ = kind;
    return result;
}

Path Path::WithVersion(const std::string& version) const {
    Path result(*this);
    result.version_ = version;
    return result;
}

Path Path::DirectoryPart() const {
    return Directory(kind_, components_);
}

Path Path::AsDirectory() const {
    if (IsDirectoryForm() && !wildcard_) {
        return *this;
    }
    Path result = DirectoryPart();
    if (!wildcard_) {
        result.components_.push_back(Filename());
    }
    return result;
}

Path Path::AsFile() const {
    if (IsFileForm() || components_.empty() || IsDotComponent(components_.back())) {
        return *this;
    }
    Path result(*this);
    std::string last = result.components_.back();
    result.components_.pop_back();
    SplitFilename(last, result.name_, result.type_);
    return result;
}

Path Path::Parent() const {
    if (IsFileForm() || wildcard_) {
        return DirectoryPart();
    }
    if (components_.empty()) {
        return *this;
    }
    Path result = DirectoryPart();
    result.components_.pop_back();
    return result;
}

Path Path::Child(const std::string& filename) const {
    CheckComponent(filename);
    if (IsDotComponent(filename)) {
        return ChildDirectory(filename);
    }
    Path result = DirectoryPart();
    SplitFilename(filename, result.name_, result.type_);
    return result;
}

Path Path::ChildDirectory(const std::string& name) const {
    CheckComponent(name);
    Path result = DirectoryPart();
    result.components_.push_back(name);
    return result;
}

// ============================================================================
// Rendering / Comparison
// ============================================================================

std::string Path::String() const {
    std::string out;
    if (kind_ == PathKind::Absolute) {
        out += PATH_SEPARATOR;
    }
    for (const auto& c : components_) {
        out += c;
        out += PATH_SEPARATOR;
    }
    out += Filename();
    return out;
}

std::string Path::NativeString() const {
    if (wildcard_) {
        return DirectoryPart().NativeString();
    }
    std::string out = String();
    if (out.empty()) {
        return ".";
    }
    // "dir/" would make lstat() follow a symlink named dir
    if (out.size() > 1 && out.back() == PATH_SEPARATOR) {
        out.pop_back();
    }
    return out;
}

bool Path::operator==(const Path& other) const {
    return kind_ == other.kind_ &&
           components_ == other.components_ &&
           name_ == other.name_ &&
           type_ == other.type_ &&
           version_ == other.version_ &&
           wildcard_ == other.wildcard_;
}

bool Path::operator<(const Path& other) const {
    std::string lhs = String();
    std::string rhs = other.String();
    return std::tie(lhs, version_, wildcard_) <
           std::tie(rhs, other.version_, other.wildcard_);
}

// ============================================================================
// Canonicalization
// ============================================================================

Path Canonicalize(const Path& path) {
    if (path.IsWildcard()) {
        throw FsError(ErrorCode::WILDCARD_NOT_ALLOWED,
                      "cannot canonicalize wildcard path " + path.String());
    }

    std::vector<std::string> stack;
    stack.reserve(path.Components().size());
    for (const auto& component : path.Components()) {
        if (component == ".") {
            continue;
        }
        if (component == ".." && !stack.empty() && stack.back() != "..") {
            stack.pop_back();
            continue;
        }
        stack.push_back(component);
    }
    return path.WithComponents(std::move(stack));
}

bool CanonicallyEqual(const Path& a, const Path& b) {
    return Canonicalize(a) == Canonicalize(b);
}

} // namespace path
} // namespace filekit
