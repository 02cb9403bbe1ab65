// FILEKIT - Temporary Files, Directories and FIFOs
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Scoped temporary resources. Each guard creates its resource in the
// constructor and removes it in the destructor unless Release() handed
// it to the caller. The With* helpers run a callable against a fresh
// resource and clean up on every exit path.

#ifndef FILEKIT_TEMP_TEMP_H
#define FILEKIT_TEMP_TEMP_H

#include "filekit/core/error.h"
#include "filekit/path/path.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace filekit {
namespace temp {

using path::Path;

/// Name collisions tolerated before creation gives up
constexpr int MAX_TEMP_ATTEMPTS = 100;

/// Default prefix of generated names
constexpr const char* DEFAULT_TEMP_PREFIX = "filekit-";

// ============================================================================
// Name Generation
// ============================================================================

/// Produces candidate names; uniqueness is settled by exclusive creation
class ITempNameGenerator {
public:
    virtual ~ITempNameGenerator() = default;

    /// File-form path `prefix<unique>[.suffix]` inside `baseDir`
    virtual Path Generate(const Path& baseDir, const std::string& prefix,
                          const std::string& suffix) const = 0;
};

/// 8 bytes from the OpenSSL CSPRNG, hex encoded
class RandomTempNameGenerator : public ITempNameGenerator {
public:
    /// @throws FsError(IO_ERROR) if the random generator fails
    Path Generate(const Path& baseDir, const std::string& prefix,
                  const std::string& suffix) const override;
};

/// Process-wide temp directory ($TMPDIR, else /tmp), computed on first use
const Path& DefaultTempDirectory();

struct TempOptions {
    /// Empty means DefaultTempDirectory()
    Path directory;
    std::string prefix{DEFAULT_TEMP_PREFIX};
    /// File type (extension) of temp files, without the dot
    std::string type;
    /// Null means RandomTempNameGenerator
    std::shared_ptr<const ITempNameGenerator> generator;
};

// ============================================================================
// Resource Guards
// ============================================================================

/// Common ownership handling of the guards below
class TempResource {
public:
    TempResource(const TempResource&) = delete;
    TempResource& operator=(const TempResource&) = delete;

    const Path& GetPath() const { return path_; }
    bool Owned() const { return owned_; }

    /// Stop managing the resource; it survives the guard
    Path Release();

protected:
    TempResource() = default;
    ~TempResource();

    TempResource(TempResource&& other) noexcept;
    TempResource& operator=(TempResource&& other) noexcept;

    void Adopt(Path path);

private:
    void Cleanup() noexcept;

    Path path_;
    bool owned_{false};
};

/// Empty regular file, created exclusively with mode 0600
class TempFile : public TempResource {
public:
    /// @throws FsError(IO_ERROR) if no file could be created
    explicit TempFile(const TempOptions& options = TempOptions());

    TempFile(TempFile&&) = default;
    TempFile& operator=(TempFile&&) = default;
};

/// Directory with mode 0700, removed recursively
class TempDirectory : public TempResource {
public:
    /// @throws FsError(IO_ERROR) if no directory could be created
    explicit TempDirectory(const TempOptions& options = TempOptions());

    TempDirectory(TempDirectory&&) = default;
    TempDirectory& operator=(TempDirectory&&) = default;
};

/// Named pipe with mode 0600
class TempFifo : public TempResource {
public:
    /// @throws FsError(IO_ERROR) if no FIFO could be created
    explicit TempFifo(const TempOptions& options = TempOptions());

    TempFifo(TempFifo&&) = default;
    TempFifo& operator=(TempFifo&&) = default;
};

// ============================================================================
// Pre-filled Temp Files
// ============================================================================

/// Temp file holding `content` encoded in `encoding`
/// @throws FsError with the write's error code if the content cannot be written
TempFile MakeTempFileWithText(const std::string& content,
                              const TempOptions& options = TempOptions(),
                              const std::string& encoding = "UTF-8");

/// Temp file holding `bytes`
/// @throws FsError(IO_ERROR) if the content cannot be written
TempFile MakeTempFileWithBytes(const std::vector<uint8_t>& bytes,
                               const TempOptions& options = TempOptions());

// ============================================================================
// Scoped Helpers
// ============================================================================

/// Run fn(path) with a fresh temp file and return its result
template<typename Fn>
auto WithTempFile(Fn&& fn, const TempOptions& options = TempOptions())
    -> decltype(fn(std::declval<const Path&>())) {
    TempFile file(options);
    return std::forward<Fn>(fn)(file.GetPath());
}

/// Run fn(path) with a fresh temp directory and return its result
template<typename Fn>
auto WithTempDirectory(Fn&& fn, const TempOptions& options = TempOptions())
    -> decltype(fn(std::declval<const Path&>())) {
    TempDirectory dir(options);
    return std::forward<Fn>(fn)(dir.GetPath());
}

/// Run fn(path) with a fresh FIFO and return its result
template<typename Fn>
auto WithTempFifo(Fn&& fn, const TempOptions& options = TempOptions())
    -> decltype(fn(std::declval<const Path&>())) {
    TempFifo fifo(options);
    return std::forward<Fn>(fn)(fifo.GetPath());
}

} // namespace temp
} // namespace filekit

#endif // FILEKIT_TEMP_TEMP_H
