// FILEKIT - Temporary Resources Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/temp/temp.h"

#include "filekit/fs/os.h"
#include "filekit/text/textio.h"
#include "filekit/util/logging.h"

#include <cerrno>
#include <cstring>
#include <functional>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/rand.h>

namespace filekit {
namespace temp {

namespace {

/// Creates the resource at `candidate`; returns errno, 0 on success
using CreateFn = std::function<int(const Path& candidate)>;

const ITempNameGenerator& GeneratorFor(const TempOptions& options) {
    static const RandomTempNameGenerator random;
    return options.generator ? *options.generator : random;
}

Path CreateUnique(const TempOptions& options, const char* what, const CreateFn& create) {
    const Path& base = options.directory.Empty() ? DefaultTempDirectory()
                                                 : options.directory;
    const ITempNameGenerator& generator = GeneratorFor(options);

    for (int attempt = 0; attempt < MAX_TEMP_ATTEMPTS; ++attempt) {
        Path candidate = generator.Generate(base, options.prefix, options.type);
        int err = create(candidate);
        if (err == 0) {
            LOG_DEBUG(util::LogCategory::TEMP) << "created " << what << " " << candidate.String();
            return candidate;
        }
        if (err != EEXIST) {
            throw FsError(ErrorCode::IO_ERROR,
                          std::string("cannot create temp ") + what + " " +
                          candidate.NativeString() + ": " + std::strerror(err));
        }
        LOG_TRACE(util::LogCategory::TEMP) << "name collision: " << candidate.String();
    }

    throw FsError(ErrorCode::IO_ERROR,
                  std::string("no unique temp ") + what + " name in " + base.String() +
                  " after " + std::to_string(MAX_TEMP_ATTEMPTS) + " attempts");
}

} // namespace

// ============================================================================
// Name Generation
// ============================================================================

Path RandomTempNameGenerator::Generate(const Path& baseDir, const std::string& prefix,
                                       const std::string& suffix) const {
    unsigned char random[8];
    if (RAND_bytes(random, sizeof(random)) != 1) {
        throw FsError(ErrorCode::IO_ERROR, "RAND_bytes failed");
    }

    std::ostringstream name;
    name << prefix << std::hex << std::setfill('0');
    for (unsigned char b : random) {
        name << std::setw(2) << static_cast<int>(b);
    }
    if (!suffix.empty()) {
        name << '.' << suffix;
    }
    return baseDir.AsDirectory().Child(name.str());
}

const Path& DefaultTempDirectory() {
    static const Path directory = fs::TempDirectoryPath();
    return directory;
}

// ============================================================================
// TempResource
// ============================================================================

TempResource::~TempResource() {
    Cleanup();
}

TempResource::TempResource(TempResource&& other) noexcept
    : path_(std::move(other.path_)), owned_(other.owned_) {
    other.owned_ = false;
}

TempResource& TempResource::operator=(TempResource&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        owned_ = other.owned_;
        other.owned_ = false;
    }
    return *this;
}

void TempResource::Adopt(Path path) {
    path_ = std::move(path);
    owned_ = true;
}

Path TempResource::Release() {
    owned_ = false;
    return path_;
}

void TempResource::Cleanup() noexcept {
    if (!owned_) {
        return;
    }
    owned_ = false;
    try {
        if (!fs::RemoveAll(path_)) {
            LOG_WARN(util::LogCategory::TEMP) << "failed to remove " << path_.String()
                                              << ": " << std::strerror(errno);
        }
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::TEMP) << "failed to remove " << path_.String()
                                          << ": " << e.what();
    }
}

// ============================================================================
// Guards
// ============================================================================

TempFile::TempFile(const TempOptions& options) {
    Adopt(CreateUnique(options, "file", [](const Path& candidate) {
        int fd = open(candidate.NativeString().c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
        if (fd < 0) {
            return errno;
        }
        close(fd);
        return 0;
    }));
}

TempDirectory::TempDirectory(const TempOptions& options) {
    Adopt(CreateUnique(options, "directory", [](const Path& candidate) {
        return mkdir(candidate.NativeString().c_str(), 0700) == 0 ? 0 : errno;
    }).AsDirectory());
}

TempFifo::TempFifo(const TempOptions& options) {
    Adopt(CreateUnique(options, "fifo", [](const Path& candidate) {
        return mkfifo(candidate.NativeString().c_str(), 0600) == 0 ? 0 : errno;
    }));
}

// ============================================================================
// Pre-filled Temp Files
// ============================================================================

TempFile MakeTempFileWithText(const std::string& content, const TempOptions& options,
                              const std::string& encoding) {
    TempFile file(options);
    text::WriteOptions writeOptions;
    writeOptions.encoding = encoding;
    text::WriteResult result = text::WriteText(file.GetPath(), content, writeOptions);
    if (!result.ok()) {
        throw FsError(result.status.code(), result.status.message());
    }
    return file;
}

TempFile MakeTempFileWithBytes(const std::vector<uint8_t>& bytes, const TempOptions& options) {
    TempFile file(options);
    Status status = fs::WriteFileBytes(file.GetPath(), bytes);
    if (!status.ok()) {
        throw FsError(ErrorCode::IO_ERROR, status.message());
    }
    return file;
}

} // namespace temp
} // namespace filekit
