// FILEKIT - Encoding-Aware Text I/O Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/text/textio.h"

#include "filekit/util/logging.h"

#include <utility>

namespace filekit {
namespace text {

namespace {

/// Encodings to try: the declared one, then UTF-8 unless already UTF-8
std::vector<std::pair<std::string, bool>> Candidates(const std::string& encoding,
                                                     bool allowFallback) {
    std::vector<std::pair<std::string, bool>> candidates;
    candidates.emplace_back(ToIconvName(encoding), false);
    if (allowFallback && !IsUtf8(encoding)) {
        candidates.emplace_back(UTF8, true);
    }
    return candidates;
}

std::string AttemptList(const std::vector<EncodingAttempt>& attempts) {
    std::string out;
    for (const auto& attempt : attempts) {
        if (!out.empty()) out += ", ";
        out += attempt.encoding;
    }
    return out;
}

TextResult ReadError(const Path& path) {
    TextResult result;
    result.status = Status::IOError("cannot read " + path.NativeString());
    return result;
}

TextResult DecodeBytes(const Path& path, const std::vector<uint8_t>& bytes,
                       const std::string& encoding, bool allowFallback) {
    TextResult result;
    for (const auto& candidate : Candidates(encoding, allowFallback)) {
        if (candidate.second) {
            LOG_WARN(util::LogCategory::TEXTIO)
                << path.String() << ": not valid " << result.attempts.back().encoding
                << ", retrying as UTF-8";
        }
        auto text = Decode(bytes, candidate.first);
        result.attempts.push_back({candidate.first, candidate.second, text.has_value()});
        if (text) {
            result.text = std::move(*text);
            return result;
        }
    }

    result.status = Status::EncodingError(
        "cannot decode " + path.String() + " as " + AttemptList(result.attempts),
        allowFallback);
    LOG_INFO(util::LogCategory::TEXTIO) << result.status.ToString();
    return result;
}

WriteResult Write(const Path& path, const std::string& text, const std::string& encoding,
                  IfExists ifExists, bool allowFallback) {
    if (path.IsWildcard()) {
        throw FsError(ErrorCode::WILDCARD_NOT_ALLOWED,
                      "cannot write to wildcard path " + path.String());
    }
    if (path.IsDirectoryForm()) {
        throw FsError(ErrorCode::INVALID_COMPOSITION,
                      "cannot write text to directory path " + path.String());
    }

    WriteResult result;

    if (fs::Exists(path) && !fs::IsWritableByOwner(path)) {
        result.status = Status::PermissionError(path.String() + " is not writable", true);
        LOG_INFO(util::LogCategory::TEXTIO) << result.status.ToString();
        return result;
    }

    Path parent = path.DirectoryPart();
    if (!fs::CreateDirectories(parent)) {
        result.status = Status::IOError("cannot create directory " + parent.NativeString());
        return result;
    }

    std::optional<std::vector<uint8_t>> bytes;
    for (const auto& candidate : Candidates(encoding, allowFallback)) {
        if (candidate.second) {
            LOG_WARN(util::LogCategory::TEXTIO)
                << path.String() << ": text not representable in "
                << result.attempts.back().encoding << ", writing UTF-8";
        }
        bytes = Encode(text, candidate.first);
        result.attempts.push_back({candidate.first, candidate.second, bytes.has_value()});
        if (bytes) break;
    }

    if (!bytes) {
        result.status = Status::EncodingError(
            "cannot encode text for " + path.String() + " as " +
            AttemptList(result.attempts), allowFallback);
        LOG_INFO(util::LogCategory::TEXTIO) << result.status.ToString();
        return result;
    }

    result.status = fs::WriteFileBytes(path, *bytes, ifExists);
    return result;
}

} // namespace

// ============================================================================
// Reading
// ============================================================================

TextResult ReadText(const Path& path, const std::string& encoding,
                    const IEncodingDetector& detector) {
    auto bytes = fs::ReadFileBytes(path);
    if (!bytes) {
        return ReadError(path);
    }
    if (!encoding.empty()) {
        return DecodeBytes(path, *bytes, encoding, true);
    }

    std::string detected = detector.Detect(*bytes);
    LOG_DEBUG(util::LogCategory::TEXTIO) << path.String() << ": detected " << detected;
    if (IsUtf8(detected) && StartsWithUtf8Bom(*bytes)) {
        // The mark chose the encoding and is not part of the text
        bytes->erase(bytes->begin(), bytes->begin() + 3);
    }
    return DecodeBytes(path, *bytes, detected, true);
}

TextResult ReadText(const Path& path, const std::string& encoding) {
    return ReadText(path, encoding, DefaultEncodingDetector());
}

TextResult ReadTextWithEncoding(const Path& path, const std::string& encoding) {
    auto bytes = fs::ReadFileBytes(path);
    if (!bytes) {
        return ReadError(path);
    }
    return DecodeBytes(path, *bytes, encoding, false);
}

// ============================================================================
// Writing
// ============================================================================

WriteResult WriteText(const Path& path, const std::string& text,
                      const WriteOptions& options) {
    return Write(path, text, options.encoding, options.ifExists, true);
}

WriteResult ForceWritableAndWrite(const Path& path, const std::string& text,
                                  const WriteOptions& options) {
    if (fs::Exists(path) && !fs::IsWritableByOwner(path)) {
        if (!fs::MakeWritable(path)) {
            WriteResult result;
            result.status = Status::PermissionError(
                "cannot make " + path.String() + " writable", false);
            return result;
        }
        LOG_INFO(util::LogCategory::TEXTIO) << "made " << path.String() << " writable";
    }

    WriteResult result = WriteText(path, text, options);
    if (result.status.IsPermissionError()) {
        result.status.Terminal();
    }
    return result;
}

WriteResult WriteTextWithEncoding(const Path& path, const std::string& text,
                                  const std::string& encoding, IfExists ifExists) {
    WriteResult result = Write(path, text, encoding, ifExists, false);
    result.status.Terminal();
    return result;
}

} // namespace text
} // namespace filekit
