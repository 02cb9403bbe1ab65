// FILEKIT - Encoding Tests
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include <gtest/gtest.h>

#include <filekit/text/encoding.h>

#include <string>
#include <utility>
#include <vector>

namespace filekit {
namespace text {
namespace {

std::vector<uint8_t> Bytes(const std::string& str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

// ============================================================================
// Names
// ============================================================================

TEST(EncodingNameTest, KnownAliases) {
    EXPECT_EQ(NormalizeEncodingName("utf8"), "UTF-8");
    EXPECT_EQ(NormalizeEncodingName("UTF_8"), "UTF-8");
    EXPECT_EQ(NormalizeEncodingName("Latin-1"), "ISO-8859-1");
    EXPECT_EQ(NormalizeEncodingName("latin1"), "ISO-8859-1");
    EXPECT_EQ(NormalizeEncodingName("ascii"), "US-ASCII");
    EXPECT_EQ(NormalizeEncodingName(" utf-16le "), "UTF-16LE");
}

TEST(EncodingNameTest, UnknownNamesAreUpperCased) {
    EXPECT_EQ(NormalizeEncodingName("koi8-r"), "KOI8-R");
    EXPECT_EQ(NormalizeEncodingName(""), "");
}

TEST(EncodingNameTest, IconvNames) {
    EXPECT_EQ(ToIconvName(""), "UTF-8");
    EXPECT_EQ(ToIconvName("l1"), "ISO-8859-1");
    EXPECT_TRUE(IsUtf8("utf-8"));
    EXPECT_TRUE(IsUtf8("Utf8"));
    EXPECT_FALSE(IsUtf8("latin1"));
}

// ============================================================================
// Validation
// ============================================================================

TEST(Utf8ValidationTest, AcceptsWellFormed) {
    EXPECT_TRUE(IsValidUtf8(""));
    EXPECT_TRUE(IsValidUtf8("plain ascii"));
    EXPECT_TRUE(IsValidUtf8("h\xC3\xA9llo"));                 // é
    EXPECT_TRUE(IsValidUtf8("\xE2\x82\xAC"));                 // €
    EXPECT_TRUE(IsValidUtf8("\xF0\x9F\x8E\x89"));             // U+1F389
}

TEST(Utf8ValidationTest, RejectsMalformed) {
    EXPECT_FALSE(IsValidUtf8("\xC3\x28"));          // Bad continuation
    EXPECT_FALSE(IsValidUtf8("\xC0\xAF"));          // Overlong
    EXPECT_FALSE(IsValidUtf8("\xED\xA0\x80"));      // Surrogate
    EXPECT_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));  // Past U+10FFFF
    EXPECT_FALSE(IsValidUtf8("abc\xE2\x82"));       // Truncated
    EXPECT_FALSE(IsValidUtf8("\xFF"));
}

// ============================================================================
// Converter
// ============================================================================

TEST(ConverterTest, Latin1ToUtf8) {
    Converter converter("latin1", "utf8");
    ASSERT_TRUE(converter.IsValid());
    EXPECT_EQ(converter.From(), "ISO-8859-1");
    EXPECT_EQ(converter.To(), "UTF-8");

    auto out = converter.Convert(std::string("caf\xE9"));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "caf\xC3\xA9");

    // Reusable
    auto again = converter.Convert(std::string("\xE9t\xE9"));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, "\xC3\xA9t\xC3\xA9");
}

TEST(ConverterTest, LargeInput) {
    Converter converter("ISO-8859-1", "UTF-8");
    std::string input(100000, '\xE9');
    auto out = converter.Convert(input);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->size(), 200000u);
}

TEST(ConverterTest, UnknownEncoding) {
    Converter converter("no-such-encoding", "UTF-8");
    EXPECT_FALSE(converter.IsValid());
    EXPECT_FALSE(converter.Convert(std::string("abc")).has_value());
}

TEST(ConverterTest, UnrepresentableCharacterFails) {
    Converter converter("UTF-8", "US-ASCII");
    ASSERT_TRUE(converter.IsValid());
    EXPECT_FALSE(converter.Convert(std::string("caf\xC3\xA9")).has_value());
    EXPECT_EQ(converter.Convert(std::string("cafe")).value_or(""), "cafe");
}

TEST(ConverterTest, Move) {
    Converter a("latin1", "utf8");
    Converter b(std::move(a));
    EXPECT_TRUE(b.IsValid());
    EXPECT_FALSE(a.IsValid());

    Converter c("utf8", "ascii");
    c = std::move(b);
    EXPECT_EQ(c.From(), "ISO-8859-1");
    EXPECT_TRUE(c.Convert(std::string("\xE9")).has_value());
}

// ============================================================================
// Decode / Encode
// ============================================================================

TEST(DecodeTest, Utf8IsValidatedNotConverted) {
    EXPECT_EQ(Decode(Bytes("h\xC3\xA9"), "UTF-8").value_or("?"), "h\xC3\xA9");
    EXPECT_FALSE(Decode(Bytes("a\xFF" "b"), "UTF-8").has_value());
}

TEST(DecodeTest, KeepsLeadingZeroWidthNoBreakSpace) {
    EXPECT_EQ(Decode(Bytes("\xEF\xBB\xBFhi"), "UTF-8").value_or("?"), "\xEF\xBB\xBFhi");
    EXPECT_TRUE(StartsWithUtf8Bom(Bytes("\xEF\xBB\xBFhi")));
    EXPECT_FALSE(StartsWithUtf8Bom(Bytes("\xEF\xBB")));
}

TEST(DecodeTest, Utf16WithByteOrderMark) {
    std::vector<uint8_t> le = {0xFF, 0xFE, 'h', 0x00, 'i', 0x00};
    EXPECT_EQ(Decode(le, "UTF-16").value_or("?"), "hi");
    std::vector<uint8_t> be = {0xFE, 0xFF, 0x00, 'h', 0x00, 'i'};
    EXPECT_EQ(Decode(be, "UTF-16").value_or("?"), "hi");
}

TEST(DecodeTest, TruncatedMultiByteInputFails) {
    std::vector<uint8_t> odd = {'h', 0x00, 'i'};
    EXPECT_FALSE(Decode(odd, "UTF-16LE").has_value());
}

TEST(EncodeTest, Latin1) {
    auto bytes = Encode("caf\xC3\xA9", "latin-1");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (std::vector<uint8_t>{'c', 'a', 'f', 0xE9}));
}

TEST(EncodeTest, NeverSubstitutes) {
    EXPECT_FALSE(Encode("\xE2\x82\xAC", "ISO-8859-1").has_value());  // €
    EXPECT_FALSE(Encode("\xFF", "UTF-8").has_value());
}

// ============================================================================
// Detection
// ============================================================================

TEST(DetectorTest, ByteOrderMarks) {
    BomEncodingDetector detector;
    EXPECT_EQ(detector.Detect({0xEF, 0xBB, 0xBF, 'a'}), "UTF-8");
    EXPECT_EQ(detector.Detect({0xFF, 0xFE, 'a', 0x00}), "UTF-16");
    EXPECT_EQ(detector.Detect({0xFE, 0xFF, 0x00, 'a'}), "UTF-16");
    EXPECT_EQ(detector.Detect({0xFF, 0xFE, 0x00, 0x00}), "UTF-32");
    EXPECT_EQ(detector.Detect({0x00, 0x00, 0xFE, 0xFF}), "UTF-32");
}

TEST(DetectorTest, ContentBased) {
    const IEncodingDetector& detector = DefaultEncodingDetector();
    EXPECT_EQ(detector.Detect({}), "UTF-8");
    EXPECT_EQ(detector.Detect(Bytes("plain")), "UTF-8");
    EXPECT_EQ(detector.Detect(Bytes("h\xC3\xA9llo")), "UTF-8");
    EXPECT_EQ(detector.Detect(Bytes("caf\xE9")), "ISO-8859-1");
}

} // namespace
} // namespace text
} // namespace filekit
