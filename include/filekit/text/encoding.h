// FILEKIT - Character Encodings
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Conversion between byte encodings and the UTF-8 text used in memory,
// backed by iconv(3). Conversions are strict: invalid or unrepresentable
// sequences fail the conversion instead of being replaced.

#ifndef FILEKIT_TEXT_ENCODING_H
#define FILEKIT_TEXT_ENCODING_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <iconv.h>

namespace filekit {
namespace text {

/// Encoding of text held in memory
constexpr const char* UTF8 = "UTF-8";

/// Last-resort encoding; every byte sequence decodes under it
constexpr const char* LATIN1 = "ISO-8859-1";

// ============================================================================
// Encoding Names
// ============================================================================

/**
 * Map a user-facing encoding name to its canonical spelling.
 * Case and '-'/'_' placement are ignored for the known aliases
 * ("utf8", "latin-1", "ascii", ...); other names are upper-cased.
 * An empty name stays empty.
 */
std::string NormalizeEncodingName(const std::string& name);

/// Token handed to iconv_open(); an empty name means UTF-8
std::string ToIconvName(const std::string& name);

/// True if `name` denotes UTF-8
bool IsUtf8(const std::string& name);

/// Strict UTF-8 validation (no overlongs, surrogates or values past U+10FFFF)
bool IsValidUtf8(const uint8_t* data, size_t size);
bool IsValidUtf8(const std::string& str);

// ============================================================================
// Converter
// ============================================================================

/// Owns one iconv conversion descriptor
class Converter {
public:
    Converter(const std::string& from, const std::string& to);
    ~Converter();

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;
    Converter(Converter&& other) noexcept;
    Converter& operator=(Converter&& other) noexcept;

    /// False if iconv does not know one of the encodings
    bool IsValid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }

    const std::string& From() const { return from_; }
    const std::string& To() const { return to_; }

    /// Convert a complete buffer; nullopt on invalid or truncated input
    std::optional<std::string> Convert(const char* data, size_t size);
    std::optional<std::string> Convert(const std::string& input) {
        return Convert(input.data(), input.size());
    }

private:
    void Close();

    iconv_t cd_;
    std::string from_;
    std::string to_;
};

/// Decode bytes in `encoding` to UTF-8. A leading U+FEFF is content and
/// is kept. nullopt if the bytes are not valid in `encoding` or the
/// encoding is unknown.
std::optional<std::string> Decode(const std::vector<uint8_t>& bytes,
                                  const std::string& encoding);

/// Encode UTF-8 text in `encoding`; nullopt if a character has no
/// representation there or the encoding is unknown.
std::optional<std::vector<uint8_t>> Encode(const std::string& text,
                                           const std::string& encoding);

// ============================================================================
// Encoding Detection
// ============================================================================

/// True if `bytes` begin with EF BB BF
bool StartsWithUtf8Bom(const std::vector<uint8_t>& bytes);

/// Recommends an encoding for a file's content
class IEncodingDetector {
public:
    virtual ~IEncodingDetector() = default;

    virtual std::string Detect(const std::vector<uint8_t>& bytes) const = 0;
};

/**
 * Byte order mark sniffing.
 *
 * UTF-32 and UTF-16 marks yield "UTF-32" / "UTF-16" so that iconv consumes
 * the mark and picks the byte order from it. A UTF-8 mark, or content that
 * validates as UTF-8, yields UTF-8; ReadText then drops the UTF-8 mark.
 * Anything else yields ISO-8859-1.
 */
class BomEncodingDetector : public IEncodingDetector {
public:
    std::string Detect(const std::vector<uint8_t>& bytes) const override;
};

/// Shared stateless BomEncodingDetector
const IEncodingDetector& DefaultEncodingDetector();

} // namespace text
} // namespace filekit

#endif // FILEKIT_TEXT_ENCODING_H
