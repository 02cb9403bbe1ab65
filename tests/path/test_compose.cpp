// FILEKIT - Path Composition Tests
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include <gtest/gtest.h>

#include <filekit/core/error.h>
#include <filekit/path/compose.h>

#include <string>
#include <vector>

namespace filekit {
namespace path {
namespace {

template<typename Fn>
ErrorCode ErrorCodeOf(Fn&& fn) {
    try {
        fn();
    } catch (const FsError& e) {
        return e.code();
    }
    return ErrorCode::OK;
}

Path P(const char* str) {
    return Path::Parse(str);
}

// ============================================================================
// MergeAsDirectory
// ============================================================================

TEST(MergeAsDirectoryTest, EmptyInput) {
    EXPECT_EQ(MergeAsDirectory({}), Path());
}

TEST(MergeAsDirectoryTest, RelativeElementsAppend) {
    Path merged = MergeAsDirectory({P("/srv/"), P("www/"), P("site/")});
    EXPECT_EQ(merged.String(), "/srv/www/site/");
    EXPECT_TRUE(merged.IsDirectoryForm());
}

TEST(MergeAsDirectoryTest, FileFieldsAreDiscarded) {
    Path merged = MergeAsDirectory({P("a/notes.txt"), P("b/c.log")});
    EXPECT_EQ(merged.String(), "a/b/");
    EXPECT_TRUE(merged.IsDirectoryForm());
}

TEST(MergeAsDirectoryTest, ResultIsCanonical) {
    EXPECT_EQ(MergeAsDirectory({P("a/b/"), P("../c/./")}).String(), "a/c/");
    EXPECT_EQ(MergeAsDirectory({P("a/"), P("../../x/")}).String(), "../x/");
}

TEST(MergeAsDirectoryTest, AbsoluteOverride) {
    const char* relatives[] = {"", "x/", "x/y/z/", "../../q/", "./a/../b/"};
    Path absolute = P("/opt/./tools/../bin/");
    for (const char* rel : relatives) {
        EXPECT_EQ(MergeAsDirectory({P(rel), absolute}), Canonicalize(absolute)) << rel;
    }
}

TEST(MergeAsDirectoryTest, LaterAbsoluteReplacesEarlierOnes) {
    Path merged = MergeAsDirectory({P("/a/"), P("b/"), P("/c/"), P("d/")});
    EXPECT_EQ(merged.String(), "/c/d/");
}

TEST(MergeAsDirectoryTest, AssociativeWithoutAbsoluteOverride) {
    const std::vector<std::vector<const char*>> triples = {
        {"a/", "b/", "c/"},
        {"/root/", "x/../y/", "z/"},
        {"a/b/", "../../", "../c/"},
        {"./", "./p/", "q/./r/"},
        {"/", "..", "etc/"},
    };
    for (const auto& t : triples) {
        Path p1 = P(t[0]), p2 = P(t[1]), p3 = P(t[2]);
        EXPECT_EQ(MergeAsDirectory({p1, p2, p3}),
                  MergeAsDirectory({MergeAsDirectory({p1, p2}), p3}))
            << t[0] << " " << t[1] << " " << t[2];
    }
}

TEST(MergeAsDirectoryTest, RejectsWildcard) {
    Path wildcard = DirectoryWildcard(P("a/"));
    EXPECT_EQ(ErrorCodeOf([&] { MergeAsDirectory({P("b/"), wildcard}); }),
              ErrorCode::INVALID_COMPOSITION);
}

// ============================================================================
// MergeAsFile
// ============================================================================

TEST(MergeAsFileTest, EmptyInput) {
    EXPECT_EQ(MergeAsFile({}), Path());
}

TEST(MergeAsFileTest, AttachesLastFileFields) {
    Path merged = MergeAsFile({P("/var/"), P("log/"), P("syslog.1").WithVersion("3")});
    EXPECT_TRUE(merged.IsFileForm());
    EXPECT_EQ(merged.String(), "/var/log/syslog.1");
    EXPECT_EQ(merged.Name(), "syslog");
    EXPECT_EQ(merged.Type(), "1");
    EXPECT_EQ(merged.Version(), "3");
}

TEST(MergeAsFileTest, LastElementDirectoryIsFolded) {
    EXPECT_EQ(MergeAsFile({P("/base/"), P("sub/file.txt")}).String(), "/base/sub/file.txt");
    EXPECT_EQ(MergeAsFile({P("/base/"), P("/etc/hosts")}).String(), "/etc/hosts");
    EXPECT_EQ(MergeAsFile({P("a/b/"), P("../c.txt")}).String(), "a/c.txt");
}

TEST(MergeAsFileTest, DirectoryFormLastElement) {
    Path merged = MergeAsFile({P("a/"), P("b/")});
    EXPECT_TRUE(merged.IsDirectoryForm());
    EXPECT_EQ(merged.String(), "a/b/");
}

TEST(MergeAsFileTest, RejectsWildcard) {
    Path wildcard = DirectoryWildcard(P("a/"));
    EXPECT_EQ(ErrorCodeOf([&] { MergeAsFile({wildcard, P("x.txt")}); }),
              ErrorCode::INVALID_COMPOSITION);
}

// ============================================================================
// DirectoryWildcard
// ============================================================================

TEST(DirectoryWildcardTest, FromDirectory) {
    Path wildcard = DirectoryWildcard(P("/home/user/"));
    EXPECT_TRUE(wildcard.IsWildcard());
    EXPECT_EQ(wildcard.Name(), WILDCARD_TOKEN);
    EXPECT_EQ(wildcard.Type(), WILDCARD_TOKEN);
    EXPECT_EQ(wildcard.String(), "/home/user/*.*");
    EXPECT_EQ(wildcard.NativeString(), "/home/user");
    EXPECT_EQ(wildcard.DirectoryPart(), P("/home/user/"));
}

TEST(DirectoryWildcardTest, FileFormNamesDirectory) {
    EXPECT_EQ(DirectoryWildcard(P("a/b")).String(), "a/b/*.*");
    EXPECT_EQ(DirectoryWildcard(Path()).NativeString(), ".");
}

TEST(DirectoryWildcardTest, RejectsWildcard) {
    Path wildcard = DirectoryWildcard(P("a/"));
    EXPECT_EQ(ErrorCodeOf([&] { DirectoryWildcard(wildcard); }),
              ErrorCode::NOT_A_DIRECTORY_PATH);
}

TEST(DirectoryWildcardTest, DiffersFromLiteralStarFile) {
    Path literal = P("a/*.*");
    Path wildcard = DirectoryWildcard(P("a/"));
    EXPECT_EQ(literal.String(), wildcard.String());
    EXPECT_NE(literal, wildcard);
    EXPECT_FALSE(literal.IsWildcard());
}

// ============================================================================
// Relativize
// ============================================================================

TEST(RelativizeTest, PathUnderRoot) {
    Path rel = Relativize(P("/srv/data/"), P("/srv/data/2024/report.pdf"));
    EXPECT_TRUE(rel.IsRelative());
    EXPECT_EQ(rel.String(), "2024/report.pdf");
}

TEST(RelativizeTest, RootItself) {
    EXPECT_EQ(Relativize(P("/srv/"), P("/srv/")), Path());
}

TEST(RelativizeTest, CanonicalizesBothSides) {
    EXPECT_EQ(Relativize(P("/a/./b/"), P("/a/x/../b/c.txt")).String(), "c.txt");
}

TEST(RelativizeTest, OutsideRootUnchanged) {
    Path outside = P("/etc/passwd");
    EXPECT_EQ(Relativize(P("/srv/"), outside), outside);
    Path relative = P("srv/x");
    EXPECT_EQ(Relativize(P("/srv/"), relative), relative);
}

} // namespace
} // namespace path
} // namespace filekit
