// FILEKIT - OS Filesystem Primitives Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/fs/os.h"

#include "filekit/path/compose.h"
#include "filekit/util/logging.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/evp.h>

namespace filekit {
namespace fs {

namespace {

FileType TypeFromMode(mode_t mode) {
    if (S_ISREG(mode)) return FileType::Regular;
    if (S_ISDIR(mode)) return FileType::Directory;
    if (S_ISLNK(mode)) return FileType::Symlink;
    if (S_ISBLK(mode)) return FileType::Block;
    if (S_ISCHR(mode)) return FileType::Character;
    if (S_ISFIFO(mode)) return FileType::Fifo;
    if (S_ISSOCK(mode)) return FileType::Socket;
    return FileType::Unknown;
}

FileStatus StatusFromStat(const struct stat& st) {
    FileStatus status;
    status.type = TypeFromMode(st.st_mode);
    status.permissions = Permissions::FromMode(st.st_mode & 0777);
    status.size = static_cast<uint64_t>(st.st_size);
    status.modifiedTime = std::chrono::system_clock::from_time_t(st.st_mtime);
    return status;
}

std::string ErrnoMessage(const std::string& what, const Path& path) {
    return what + " " + path.NativeString() + ": " + std::strerror(errno);
}

std::string ToHex(const unsigned char* data, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

struct DirCloser {
    void operator()(DIR* dir) const { closedir(dir); }
};

struct MdCtxFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

// ============================================================================
// FileType / Permissions
// ============================================================================

const char* FileTypeToString(FileType type) {
    switch (type) {
        case FileType::None:      return "none";
        case FileType::Regular:   return "file";
        case FileType::Directory: return "directory";
        case FileType::Symlink:   return "symlink";
        case FileType::Block:     return "block";
        case FileType::Character: return "character";
        case FileType::Fifo:      return "fifo";
        case FileType::Socket:    return "socket";
        default:                  return "unknown";
    }
}

uint16_t Permissions::Mode() const {
    uint16_t mode = 0;
    if (ownerRead) mode |= 0400;
    if (ownerWrite) mode |= 0200;
    if (ownerExecute) mode |= 0100;
    if (groupRead) mode |= 0040;
    if (groupWrite) mode |= 0020;
    if (groupExecute) mode |= 0010;
    if (othersRead) mode |= 0004;
    if (othersWrite) mode |= 0002;
    if (othersExecute) mode |= 0001;
    return mode;
}

Permissions Permissions::FromMode(uint16_t mode) {
    Permissions p;
    p.ownerRead = (mode & 0400) != 0;
    p.ownerWrite = (mode & 0200) != 0;
    p.ownerExecute = (mode & 0100) != 0;
    p.groupRead = (mode & 0040) != 0;
    p.groupWrite = (mode & 0020) != 0;
    p.groupExecute = (mode & 0010) != 0;
    p.othersRead = (mode & 0004) != 0;
    p.othersWrite = (mode & 0002) != 0;
    p.othersExecute = (mode & 0001) != 0;
    return p;
}

Permissions Permissions::DefaultFile() {
    return FromMode(0644);
}

Permissions Permissions::DefaultDirectory() {
    return FromMode(0755);
}

// ============================================================================
// File Status Functions
// ============================================================================

FileStatus Status(const Path& path) {
    struct stat st;
    if (stat(path.NativeString().c_str(), &st) != 0) {
        return FileStatus();
    }
    return StatusFromStat(st);
}

FileStatus SymlinkStatus(const Path& path) {
    struct stat st;
    if (lstat(path.NativeString().c_str(), &st) != 0) {
        return FileStatus();
    }
    return StatusFromStat(st);
}

bool Exists(const Path& path) {
    return Status(path).Exists();
}

bool IsFile(const Path& path) {
    return Status(path).IsFile();
}

bool IsDirectory(const Path& path) {
    return Status(path).IsDirectory();
}

bool IsSymlink(const Path& path) {
    return SymlinkStatus(path).IsSymlink();
}

bool IsFifo(const Path& path) {
    return Status(path).IsFifo();
}

uint64_t FileSize(const Path& path) {
    return Status(path).size;
}

// ============================================================================
// Permission Oracle
// ============================================================================

std::optional<Permissions> GetPermissions(const Path& path) {
    FileStatus status = Status(path);
    if (!status.Exists()) {
        return std::nullopt;
    }
    return status.permissions;
}

bool SetPermissions(const Path& path, const Permissions& permissions) {
    return chmod(path.NativeString().c_str(), permissions.Mode()) == 0;
}

bool IsWritableByOwner(const Path& path) {
    auto permissions = GetPermissions(path);
    return permissions && permissions->ownerWrite;
}

bool MakeWritable(const Path& path) {
    auto permissions = GetPermissions(path);
    if (!permissions) {
        return false;
    }
    permissions->ownerWrite = true;
    return SetPermissions(path, *permissions);
}

// ============================================================================
// Directory Operations
// ============================================================================

bool CreateDirectory(const Path& path, uint16_t mode) {
    return mkdir(path.NativeString().c_str(), mode) == 0;
}

bool CreateDirectories(const Path& path) {
    Path dir = path.AsDirectory();
    if (Exists(dir)) {
        return IsDirectory(dir);
    }

    Path parent = dir.Parent();
    if (parent != dir && !Exists(parent)) {
        if (!CreateDirectories(parent)) {
            return false;
        }
    }

    // Another process may have created it in the meantime
    return CreateDirectory(dir) || IsDirectory(dir);
}

bool RemoveFile(const Path& path) {
    return unlink(path.NativeString().c_str()) == 0;
}

bool RemoveDirectory(const Path& path) {
    return rmdir(path.NativeString().c_str()) == 0;
}

bool RemoveAll(const Path& path) {
    FileStatus status = SymlinkStatus(path);
    if (!status.Exists()) {
        return true;
    }
    if (!status.IsDirectory()) {
        return RemoveFile(path.IsFileForm() ? path : path.AsFile());
    }

    Path dir = path.AsDirectory();
    std::vector<OsEntry> entries;
    try {
        entries = EnumerateDirectory(path::DirectoryWildcard(dir), false);
    } catch (const FsError& e) {
        LOG_WARN(util::LogCategory::TEMP) << "RemoveAll: " << e.what();
        return false;
    }
    for (const auto& entry : entries) {
        if (!RemoveAll(entry.path)) {
            return false;
        }
    }
    return RemoveDirectory(dir);
}

bool CopyFile(const Path& from, const Path& to, bool overwrite) {
    if (!overwrite && Exists(to)) {
        return false;
    }

    std::ifstream src(from.NativeString(), std::ios::binary);
    if (!src) return false;

    std::ofstream dst(to.NativeString(), std::ios::binary | std::ios::trunc);
    if (!dst) return false;

    dst << src.rdbuf();
    return dst.good();
}

// ============================================================================
// Path Queries
// ============================================================================

Path CurrentPath() {
    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) == nullptr) return Path();
    return Path::Parse(buf).AsDirectory();
}

Path TempDirectoryPath() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir && *tmpdir) {
        return Path::Parse(tmpdir).AsDirectory();
    }
    return Path::Parse("/tmp/");
}

std::optional<Path> RealPath(const Path& path) {
    char buf[PATH_MAX];
    if (realpath(path.NativeString().c_str(), buf) == nullptr) {
        return std::nullopt;
    }
    Path resolved = Path::Parse(buf);
    if (IsDirectory(resolved)) {
        resolved = resolved.AsDirectory();
    }
    return resolved;
}

// ============================================================================
// Raw Byte I/O
// ============================================================================

std::optional<std::vector<uint8_t>> ReadFileBytes(const Path& path) {
    if (IsDirectory(path)) {
        return std::nullopt;
    }
    std::ifstream file(path.NativeString(), std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::vector<uint8_t> data;
    char buffer[64 * 1024];
    while (file) {
        file.read(buffer, sizeof(buffer));
        std::streamsize got = file.gcount();
        if (got > 0) {
            data.insert(data.end(), buffer, buffer + got);
        }
    }
    if (file.bad()) {
        return std::nullopt;
    }
    return data;
}

filekit::Status WriteFileBytes(const Path& path, const uint8_t* data, size_t size,
                               IfExists ifExists, uint16_t mode) {
    int flags = O_WRONLY | O_CREAT;
    switch (ifExists) {
        case IfExists::Supersede: flags |= O_TRUNC; break;
        case IfExists::Append:    flags |= O_APPEND; break;
        case IfExists::Error:     flags |= O_EXCL; break;
        default:
            throw FsError(ErrorCode::INVALID_OPTION, "unknown IfExists policy");
    }

    int fd = open(path.NativeString().c_str(), flags, mode);
    if (fd < 0) {
        if (errno == EEXIST) {
            return filekit::Status::AlreadyExists(path.NativeString());
        }
        if (errno == EACCES || errno == EPERM) {
            return filekit::Status::PermissionError(ErrnoMessage("open", path), false);
        }
        return filekit::Status::IOError(ErrnoMessage("open", path));
    }

    size_t written = 0;
    while (written < size) {
        ssize_t result = write(fd, data + written, size - written);
        if (result < 0) {
            if (errno == EINTR) continue;
            filekit::Status status = filekit::Status::IOError(ErrnoMessage("write", path));
            close(fd);
            return status;
        }
        written += static_cast<size_t>(result);
    }

    if (close(fd) != 0) {
        return filekit::Status::IOError(ErrnoMessage("close", path));
    }
    return filekit::Status::Ok();
}

filekit::Status WriteFileBytes(const Path& path, const std::vector<uint8_t>& content,
                               IfExists ifExists) {
    return WriteFileBytes(path, content.data(), content.size(), ifExists);
}

// ============================================================================
// Enumeration
// ============================================================================

std::vector<OsEntry> EnumerateDirectory(const Path& wildcard, bool resolveSymlinks) {
    if (!wildcard.IsWildcard()) {
        throw FsError(ErrorCode::INVALID_COMPOSITION,
                      "enumeration needs a directory wildcard, got " + wildcard.String());
    }

    Path base = wildcard.DirectoryPart();
    std::unique_ptr<DIR, DirCloser> dir(opendir(base.NativeString().c_str()));
    if (!dir) {
        throw FsError(ErrorCode::IO_ERROR, ErrnoMessage("opendir", base));
    }

    std::vector<OsEntry> entries;
    struct dirent* ent;
    while ((ent = readdir(dir.get())) != nullptr) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;

        Path asFile = base.Child(name);
        FileStatus linkStatus = SymlinkStatus(asFile);
        if (!linkStatus.Exists()) {
            // Removed between readdir() and lstat()
            LOG_TRACE(util::LogCategory::LIST) << "vanished: " << asFile.String();
            continue;
        }

        OsEntry entry;
        if (resolveSymlinks) {
            auto real = RealPath(asFile);
            if (real) {
                entry.path = *real;
                entry.type = Status(*real).type;
                entry.resolved = true;
                entries.push_back(std::move(entry));
                continue;
            }
        }

        entry.type = linkStatus.type;
        entry.path = linkStatus.IsDirectory() ? base.ChildDirectory(name) : asFile;
        entries.push_back(std::move(entry));
    }

    return entries;
}

// ============================================================================
// Checksums
// ============================================================================

std::string Sha256Hex(const uint8_t* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(data, size, digest, &digestLen, EVP_sha256(), nullptr) != 1) {
        return "";
    }
    return ToHex(digest, digestLen);
}

std::string FileChecksum(const Path& path) {
    std::ifstream file(path.NativeString(), std::ios::binary);
    if (!file) {
        return "";
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return "";
    }

    char buffer[64 * 1024];
    while (file) {
        file.read(buffer, sizeof(buffer));
        std::streamsize got = file.gcount();
        if (got > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(got)) != 1) {
            return "";
        }
    }
    if (file.bad()) {
        return "";
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        return "";
    }
    return ToHex(digest, digestLen);
}

} // namespace fs
} // namespace filekit
