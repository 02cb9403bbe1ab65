// FILEKIT - Settings Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/util/settings.h"

#include "filekit/core/error.h"
#include "filekit/text/encoding.h"

#include <algorithm>
#include <cctype>
#include <memory>

namespace filekit {
namespace util {

namespace {

LogLevel ParseLogLevel(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    static const char* const known[] = {
        "TRACE", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "FATAL", "OFF", "NONE"
    };
    if (std::find(std::begin(known), std::end(known), upper) == std::end(known)) {
        throw FsError(ErrorCode::INVALID_OPTION, "unknown log level: " + str);
    }
    return LogLevelFromString(upper);
}

/// The file sink installed by the last ApplyLogSettings call
std::shared_ptr<ILogSink>& SettingsSink() {
    static std::shared_ptr<ILogSink> sink;
    return sink;
}

} // namespace

temp::TempOptions Settings::TempOptions() const {
    temp::TempOptions options;
    options.directory = tempDirectory;
    options.prefix = tempPrefix;
    return options;
}

fs::WalkOptions Settings::WalkOptions() const {
    fs::WalkOptions options;
    options.directories = walkDirectories;
    options.ifMissing = walkIfMissing;
    options.followSymlinks = walkFollowSymlinks;
    return options;
}

Settings LoadSettings(const ConfigManager& config) {
    using namespace ConfigKeys;
    Settings settings;

    if (auto level = config.TryGetString(LOG_LEVEL, SECTION_LOG)) {
        settings.logLevel = ParseLogLevel(*level);
    }
    settings.logFile = config.GetPath(LOG_FILE, "", SECTION_LOG);

    settings.textEncoding = text::NormalizeEncodingName(
        config.GetString(TEXT_ENCODING, "", SECTION_TEXT));
    if (!settings.textEncoding.empty() &&
        !text::Converter(settings.textEncoding, text::UTF8).IsValid()) {
        throw FsError(ErrorCode::INVALID_OPTION,
                      "unknown text encoding: " + settings.textEncoding);
    }

    std::string tempDir = config.GetPath(TEMP_DIRECTORY, "", SECTION_TEMP);
    if (!tempDir.empty()) {
        settings.tempDirectory = path::Path::Parse(tempDir).AsDirectory();
    }
    settings.tempPrefix = config.GetString(TEMP_PREFIX, settings.tempPrefix, SECTION_TEMP);

    if (auto visit = config.TryGetString(WALK_DIRECTORIES, SECTION_WALK)) {
        settings.walkDirectories = fs::ParseDirectoryVisit(*visit);
    }
    if (auto ifMissing = config.TryGetString(WALK_IF_MISSING, SECTION_WALK)) {
        settings.walkIfMissing = fs::ParseIfMissing(*ifMissing);
    }
    if (config.HasKey(WALK_FOLLOW_SYMLINKS, SECTION_WALK)) {
        auto follow = config.TryGetBool(WALK_FOLLOW_SYMLINKS, SECTION_WALK);
        if (!follow) {
            throw FsError(ErrorCode::INVALID_OPTION,
                          "follow_symlinks is not a boolean: " +
                          config.GetString(WALK_FOLLOW_SYMLINKS, "", SECTION_WALK));
        }
        settings.walkFollowSymlinks = *follow;
    }

    LOG_DEBUG(LogCategory::CONFIG)
        << "settings: level=" << LogLevelToString(settings.logLevel)
        << " encoding=" << (settings.textEncoding.empty() ? "<detect>" : settings.textEncoding)
        << " walk=" << fs::DirectoryVisitToString(settings.walkDirectories)
        << "/" << fs::IfMissingToString(settings.walkIfMissing);
    return settings;
}

bool ApplyLogSettings(const Settings& settings) {
    Logger& logger = Logger::Instance();
    logger.Initialize();
    logger.SetLevel(settings.logLevel);

    std::shared_ptr<ILogSink>& previous = SettingsSink();
    if (previous) {
        logger.RemoveSink(previous);
        previous.reset();
    }

    if (settings.logFile.empty()) {
        return true;
    }

    FileSink::Config config;
    config.path = settings.logFile;
    config.level = settings.logLevel;
    auto sink = std::make_shared<FileSink>(config);
    if (!sink->IsOpen()) {
        LOG_WARN(LogCategory::CONFIG) << "cannot open log file " << settings.logFile;
        return false;
    }
    logger.AddSink(sink);
    previous = sink;
    return true;
}

} // namespace util
} // namespace filekit
