// FILEKIT - Character Encodings Implementation
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include "filekit/text/encoding.h"

#include "filekit/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <map>
#include <utility>

namespace filekit {
namespace text {

namespace {

/// Alias key: lower case, separators removed
std::string AliasKey(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

const std::map<std::string, std::string>& Aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"utf8", "UTF-8"},
        {"utf16", "UTF-16"},
        {"utf16le", "UTF-16LE"},
        {"utf16be", "UTF-16BE"},
        {"utf32", "UTF-32"},
        {"utf32le", "UTF-32LE"},
        {"utf32be", "UTF-32BE"},
        {"latin1", "ISO-8859-1"},
        {"l1", "ISO-8859-1"},
        {"iso88591", "ISO-8859-1"},
        {"latin9", "ISO-8859-15"},
        {"iso885915", "ISO-8859-15"},
        {"ascii", "US-ASCII"},
        {"usascii", "US-ASCII"},
        {"cp1252", "WINDOWS-1252"},
        {"windows1252", "WINDOWS-1252"},
    };
    return aliases;
}

bool StartsWith(const std::vector<uint8_t>& bytes, std::initializer_list<uint8_t> prefix) {
    return bytes.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), bytes.begin());
}

} // namespace

// ============================================================================
// Encoding Names
// ============================================================================

std::string NormalizeEncodingName(const std::string& name) {
    size_t start = name.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = name.find_last_not_of(" \t");
    std::string trimmed = name.substr(start, end - start + 1);

    auto it = Aliases().find(AliasKey(trimmed));
    if (it != Aliases().end()) {
        return it->second;
    }
    std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimmed;
}

std::string ToIconvName(const std::string& name) {
    std::string normalized = NormalizeEncodingName(name);
    return normalized.empty() ? std::string(UTF8) : normalized;
}

bool IsUtf8(const std::string& name) {
    return ToIconvName(name) == UTF8;
}

bool IsValidUtf8(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint8_t c = data[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > size) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

bool IsValidUtf8(const std::string& str) {
    return IsValidUtf8(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

// ============================================================================
// Converter
// ============================================================================

Converter::Converter(const std::string& from, const std::string& to)
    : from_(ToIconvName(from)), to_(ToIconvName(to)) {
    cd_ = iconv_open(to_.c_str(), from_.c_str());
    if (!IsValid()) {
        LOG_WARN(util::LogCategory::TEXTIO)
            << "iconv_open(" << to_ << ", " << from_ << "): " << std::strerror(errno);
    }
}

Converter::~Converter() {
    Close();
}

Converter::Converter(Converter&& other) noexcept
    : cd_(other.cd_), from_(std::move(other.from_)), to_(std::move(other.to_)) {
    other.cd_ = reinterpret_cast<iconv_t>(-1);
}

Converter& Converter::operator=(Converter&& other) noexcept {
    if (this != &other) {
        Close();
        cd_ = other.cd_;
        from_ = std::move(other.from_);
        to_ = std::move(other.to_);
        other.cd_ = reinterpret_cast<iconv_t>(-1);
    }
    return *this;
}

void Converter::Close() {
    if (IsValid()) {
        iconv_close(cd_);
        cd_ = reinterpret_cast<iconv_t>(-1);
    }
}

std::optional<std::string> Converter::Convert(const char* data, size_t size) {
    if (!IsValid()) {
        return std::nullopt;
    }

    // Back to the initial shift state
    iconv(cd_, nullptr, nullptr, nullptr, nullptr);

    std::vector<char> buffer(size * 4 + 16);
    std::string result;
    char* in = const_cast<char*>(data);
    size_t inLeft = size;

    while (inLeft > 0) {
        char* out = buffer.data();
        size_t outLeft = buffer.size();
        size_t rc = iconv(cd_, &in, &inLeft, &out, &outLeft);
        result.append(buffer.data(), static_cast<size_t>(out - buffer.data()));
        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) {
                continue;
            }
            // EILSEQ: invalid or unrepresentable, EINVAL: truncated sequence
            LOG_DEBUG(util::LogCategory::TEXTIO)
                << from_ << " -> " << to_ << " failed at byte "
                << (size - inLeft) << ": " << std::strerror(errno);
            return std::nullopt;
        }
    }

    char* out = buffer.data();
    size_t outLeft = buffer.size();
    if (iconv(cd_, nullptr, nullptr, &out, &outLeft) == static_cast<size_t>(-1)) {
        return std::nullopt;
    }
    result.append(buffer.data(), static_cast<size_t>(out - buffer.data()));
    return result;
}

// ============================================================================
// Decode / Encode
// ============================================================================

std::optional<std::string> Decode(const std::vector<uint8_t>& bytes,
                                  const std::string& encoding) {
    std::string text;
    if (IsUtf8(encoding)) {
        if (!IsValidUtf8(bytes.data(), bytes.size())) {
            return std::nullopt;
        }
        text.assign(bytes.begin(), bytes.end());
    } else {
        Converter converter(encoding, UTF8);
        auto converted = converter.Convert(reinterpret_cast<const char*>(bytes.data()),
                                           bytes.size());
        if (!converted) {
            return std::nullopt;
        }
        text = std::move(*converted);
    }
    return text;
}

std::optional<std::vector<uint8_t>> Encode(const std::string& text,
                                           const std::string& encoding) {
    if (IsUtf8(encoding)) {
        if (!IsValidUtf8(text)) {
            return std::nullopt;
        }
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    Converter converter(UTF8, encoding);
    auto converted = converter.Convert(text);
    if (!converted) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(converted->begin(), converted->end());
}

// ============================================================================
// Encoding Detection
// ============================================================================

bool StartsWithUtf8Bom(const std::vector<uint8_t>& bytes) {
    return StartsWith(bytes, {0xEF, 0xBB, 0xBF});
}

std::string BomEncodingDetector::Detect(const std::vector<uint8_t>& bytes) const {
    // UTF-32LE's mark starts with UTF-16LE's, so test it first
    if (StartsWith(bytes, {0xFF, 0xFE, 0x00, 0x00}) ||
        StartsWith(bytes, {0x00, 0x00, 0xFE, 0xFF})) {
        return "UTF-32";
    }
    if (StartsWith(bytes, {0xFF, 0xFE}) || StartsWith(bytes, {0xFE, 0xFF})) {
        return "UTF-16";
    }
    if (StartsWithUtf8Bom(bytes)) {
        return UTF8;
    }
    if (IsValidUtf8(bytes.data(), bytes.size())) {
        return UTF8;
    }
    return LATIN1;
}

const IEncodingDetector& DefaultEncodingDetector() {
    static const BomEncodingDetector detector;
    return detector;
}

} // namespace text
} // namespace filekit
