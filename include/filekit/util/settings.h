// FILEKIT - Settings
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Typed view of the configuration keys understood by the library.
//
//   [log]  level, file
//   [text] encoding
//   [temp] directory, prefix
//   [walk] directories, if_missing, follow_symlinks

#ifndef FILEKIT_UTIL_SETTINGS_H
#define FILEKIT_UTIL_SETTINGS_H

#include "filekit/fs/walker.h"
#include "filekit/path/path.h"
#include "filekit/temp/temp.h"
#include "filekit/util/config.h"
#include "filekit/util/logging.h"

#include <string>

namespace filekit {
namespace util {

struct Settings {
    LogLevel logLevel{LogLevel::Info};
    std::string logFile;

    /// Empty means detect per file
    std::string textEncoding;

    /// Empty means the default temp directory
    path::Path tempDirectory;
    std::string tempPrefix{temp::DEFAULT_TEMP_PREFIX};

    fs::DirectoryVisit walkDirectories{fs::DirectoryVisit::DepthFirst};
    fs::IfMissing walkIfMissing{fs::IfMissing::Error};
    bool walkFollowSymlinks{true};

    temp::TempOptions TempOptions() const;

    /// Walk options without a test
    fs::WalkOptions WalkOptions() const;
};

/**
 * Read settings from `config`; absent keys keep their defaults.
 *
 * @throws FsError(INVALID_OPTION) for an unknown log level, encoding,
 *         visit order or if_missing policy, or a non-boolean follow_symlinks
 */
Settings LoadSettings(const ConfigManager& config);

/// Set the logger level and attach a FileSink for `logFile`, replacing
/// the sink a previous call attached.
/// Returns false if the log file cannot be opened.
bool ApplyLogSettings(const Settings& settings);

} // namespace util
} // namespace filekit

#endif // FILEKIT_UTIL_SETTINGS_H
