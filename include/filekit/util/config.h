// FILEKIT - Configuration File Parser
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// INI-style configuration read by LoadSettings.
//
// Format:
// - Lines starting with # or ; are comments
// - [section] headers; keys before the first header are global
// - key=value, the value optionally quoted ("..." honours \n \t \r \\ \")
// - ${VAR} and $VAR are replaced from the environment
// - A trailing backslash continues the line
// - A bare key is a flag set to true; "nokey" sets key to false
// - include <file> reads another file, relative to the including one
//
// A key defined twice keeps the last value.

#ifndef FILEKIT_UTIL_CONFIG_H
#define FILEKIT_UTIL_CONFIG_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace filekit {
namespace util {

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

/// Nesting limit for include directives
constexpr int MAX_INCLUDE_DEPTH = 10;

/// A value and where it was defined
struct ConfigValue {
    std::string value;
    std::string source;
    int line{0};
};

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        ConfigParseResult result;
        result.success = true;
        return result;
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        ConfigParseResult result;
        result.errorMessage = msg;
        result.errorFile = file;
        result.errorLine = line;
        return result;
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

class ConfigManager {
public:
    /**
     * Parse a configuration file into this manager. The file goes through
     * text::ReadText, so its encoding is detected.
     *
     * Values parsed before a failure are kept.
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// nullptr if the key is not set
    const ConfigValue* Find(const std::string& key, const std::string& section = "") const;

    bool HasKey(const std::string& key, const std::string& section = "") const {
        return Find(key, section) != nullptr;
    }

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// true/yes/on/1 and false/no/off/0, any case; nullopt for other values
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// String value with "~" and environment variables expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    static std::string ExpandEnvVars(const std::string& value);

    /// "~" and "~/..." become $HOME (or the passwd entry)
    static std::string ExpandTilde(const std::string& path);

private:
    ConfigParseResult ParseFileAt(const std::string& filePath, int depth);
    ConfigParseResult ParseContent(const std::string& content, const std::string& source,
                                   int depth);

    /// section -> key -> value
    std::map<std::string, std::map<std::string, ConfigValue>> sections_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* SECTION_LOG = "log";
    constexpr const char* LOG_LEVEL = "level";
    constexpr const char* LOG_FILE = "file";

    constexpr const char* SECTION_TEXT = "text";
    constexpr const char* TEXT_ENCODING = "encoding";

    constexpr const char* SECTION_TEMP = "temp";
    constexpr const char* TEMP_DIRECTORY = "directory";
    constexpr const char* TEMP_PREFIX = "prefix";

    constexpr const char* SECTION_WALK = "walk";
    constexpr const char* WALK_DIRECTORIES = "directories";
    constexpr const char* WALK_IF_MISSING = "if_missing";
    constexpr const char* WALK_FOLLOW_SYMLINKS = "follow_symlinks";
}

} // namespace util
} // namespace filekit

#endif // FILEKIT_UTIL_CONFIG_H
