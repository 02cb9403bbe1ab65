// FILEKIT - Configuration File Parser Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/util/config.h"

#include "filekit/fs/os.h"
#include "filekit/path/compose.h"
#include "filekit/text/textio.h"
#include "filekit/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace filekit {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string Lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsKeyChar(char c) {
    return IsNameChar(c) || c == '-' || c == '.';
}

/// Strip matching quotes; double quotes also take backslash escapes
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.size()) {
            out += inner[i];
            continue;
        }
        switch (inner[i + 1]) {
            case 'n':  out += '\n'; break;
            case 't':  out += '\t'; break;
            case 'r':  out += '\r'; break;
            case '\\': out += '\\'; break;
            case '"':  out += '"'; break;
            default:   out += '\\'; continue;
        }
        ++i;
    }
    return out;
}

std::optional<bool> ParseBool(const std::string& str) {
    std::string lower = Lower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$' || i + 1 == value.size()) {
            result += value[i++];
            continue;
        }

        size_t nameStart;
        size_t nameEnd;
        size_t next;
        if (value[i + 1] == '{') {
            nameStart = i + 2;
            nameEnd = value.find('}', nameStart);
            if (nameEnd == std::string::npos) {
                result += value[i++];
                continue;
            }
            next = nameEnd + 1;
        } else {
            nameStart = i + 1;
            nameEnd = nameStart;
            while (nameEnd < value.size() && IsNameChar(value[nameEnd])) {
                ++nameEnd;
            }
            if (nameEnd == nameStart) {
                result += value[i++];
                continue;
            }
            next = nameEnd;
        }

        std::string name = value.substr(nameStart, nameEnd - nameStart);
        if (const char* env = std::getenv(name.c_str())) {
            result += env;
        }
        i = next;
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    return ParseFileAt(filePath, 0);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    return ParseContent(content, sourceName, 0);
}

ConfigParseResult ConfigManager::ParseFileAt(const std::string& filePath, int depth) {
    std::string expanded = ExpandEnvVars(ExpandTilde(filePath));
    path::Path file = path::Path::Parse(expanded);

    if (!fs::IsFile(file)) {
        return ConfigParseResult::Error("Cannot open file: " + expanded);
    }
    if (fs::FileSize(file) > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expanded);
    }

    text::TextResult content = text::ReadText(file);
    if (!content.ok()) {
        return ConfigParseResult::Error(content.status.ToString(), expanded);
    }

    ConfigParseResult result = ParseContent(content.text, expanded, depth);
    if (result.success) {
        LOG_INFO(LogCategory::CONFIG) << "loaded " << expanded;
    }
    return result;
}

ConfigParseResult ConfigManager::ParseContent(const std::string& content,
                                              const std::string& source, int depth) {
    std::istringstream stream(content);
    std::string section;
    std::string pending;
    std::string raw;
    int lineNum = 0;
    int startLine = 0;

    auto fail = [&](const std::string& msg) {
        return ConfigParseResult::Error(msg, source, startLine);
    };

    bool more = true;
    while (more) {
        more = static_cast<bool>(std::getline(stream, raw));
        if (more) {
            ++lineNum;
            if (raw.size() > MAX_LINE_LENGTH) {
                return ConfigParseResult::Error(
                    "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                    source, lineNum);
            }
            if (!raw.empty() && raw.back() == '\r') {
                raw.pop_back();
            }
            if (pending.empty()) {
                startLine = lineNum;
            }
            if (!raw.empty() && raw.back() == '\\') {
                pending += raw.substr(0, raw.size() - 1);
                continue;
            }
            pending += raw;
        } else if (pending.empty()) {
            break;
        }

        std::string line = Trim(pending);
        pending.clear();

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) {
                return fail("Missing closing bracket in section header");
            }
            section = Trim(line.substr(1, close - 1));
            continue;
        }

        if (line.compare(0, 8, "include ") == 0) {
            if (depth >= MAX_INCLUDE_DEPTH) {
                return fail("Maximum include depth exceeded");
            }
            path::Path target = path::Path::Parse(
                ExpandEnvVars(ExpandTilde(Unquote(Trim(line.substr(8))))));
            if (source.empty() || source[0] != '<') {
                if (target.IsRelative()) {
                    target = path::MergeAsFile({path::Path::Parse(source).DirectoryPart(), target});
                }
            }
            LOG_DEBUG(LogCategory::CONFIG) << source << ":" << startLine
                                           << ": include " << target.String();
            ConfigParseResult included = ParseFileAt(target.NativeString(), depth + 1);
            if (!included.success) {
                return included;
            }
            continue;
        }

        std::string key;
        std::string value;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            key = line;
            value = "true";
            if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(key[2]))) {
                key = key.substr(2);
                value = "false";
            }
        } else {
            key = Trim(line.substr(0, eq));
            value = ExpandEnvVars(Unquote(Trim(line.substr(eq + 1))));
        }

        if (key.empty()) {
            return fail("Empty key");
        }
        auto bad = std::find_if(key.begin(), key.end(), [](char c) { return !IsKeyChar(c); });
        if (bad != key.end()) {
            return fail("Invalid character in key: " + std::string(1, *bad));
        }

        sections_[section][key] = ConfigValue{value, source, startLine};
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

const ConfigValue* ConfigManager::Find(const std::string& key,
                                       const std::string& section) const {
    auto sectionIt = sections_.find(section);
    if (sectionIt == sections_.end()) {
        return nullptr;
    }
    auto it = sectionIt->second.find(key);
    return it == sectionIt->second.end() ? nullptr : &it->second;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    const ConfigValue* found = Find(key, section);
    if (!found) {
        return std::nullopt;
    }
    return found->value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    const ConfigValue* found = Find(key, section);
    if (!found) {
        return std::nullopt;
    }
    return ParseBool(found->value);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

} // namespace util
} // namespace filekit
