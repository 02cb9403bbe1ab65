// FILEKIT - OS Primitive Tests
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include <gtest/gtest.h>

#include <filekit/fs/os.h>
#include <filekit/path/compose.h>
#include <filekit/temp/temp.h>

#include <string>
#include <vector>

#include <unistd.h>

namespace filekit {
namespace fs {
namespace {

std::vector<uint8_t> Bytes(const std::string& str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

std::string Content(const Path& path) {
    auto bytes = ReadFileBytes(path);
    return bytes ? std::string(bytes->begin(), bytes->end()) : std::string("<unreadable>");
}

class OsTest : public ::testing::Test {
protected:
    const Path& Dir() const { return scratch_.GetPath(); }

    temp::TempDirectory scratch_;
};

// ============================================================================
// Status / Directories
// ============================================================================

TEST_F(OsTest, StatusOfScratchDirectory) {
    EXPECT_TRUE(Exists(Dir()));
    EXPECT_TRUE(IsDirectory(Dir()));
    EXPECT_FALSE(IsFile(Dir()));
    EXPECT_STREQ(FileTypeToString(Status(Dir()).type), "directory");
    EXPECT_FALSE(Status(Dir().Child("missing")).Exists());
}

TEST_F(OsTest, CreateDirectoriesCreatesParents) {
    Path deep = Dir().ChildDirectory("a").ChildDirectory("b").ChildDirectory("c");
    EXPECT_TRUE(CreateDirectories(deep));
    EXPECT_TRUE(IsDirectory(deep));
    EXPECT_TRUE(CreateDirectories(deep));  // Already there
}

TEST_F(OsTest, CreateDirectoriesFailsOverFile) {
    Path file = Dir().Child("plain.txt");
    ASSERT_TRUE(WriteFileBytes(file, Bytes("x")).ok());
    EXPECT_FALSE(CreateDirectories(file.AsDirectory().ChildDirectory("sub")));
}

TEST_F(OsTest, RemoveAllRemovesTree) {
    Path tree = Dir().ChildDirectory("tree");
    ASSERT_TRUE(CreateDirectories(tree.ChildDirectory("x").ChildDirectory("y")));
    ASSERT_TRUE(WriteFileBytes(tree.ChildDirectory("x").Child("f.txt"), Bytes("1")).ok());

    EXPECT_TRUE(RemoveAll(tree));
    EXPECT_FALSE(Exists(tree));
    EXPECT_TRUE(RemoveAll(tree));  // Nothing left to remove
}

TEST_F(OsTest, RemoveAllDoesNotFollowSymlinks) {
    Path outside = Dir().ChildDirectory("outside");
    ASSERT_TRUE(CreateDirectory(outside));
    Path kept = outside.Child("kept.txt");
    ASSERT_TRUE(WriteFileBytes(kept, Bytes("keep me")).ok());

    Path tree = Dir().ChildDirectory("tree");
    ASSERT_TRUE(CreateDirectory(tree));
    ASSERT_EQ(symlink(outside.NativeString().c_str(),
                      tree.Child("link").NativeString().c_str()), 0);

    EXPECT_TRUE(RemoveAll(tree));
    EXPECT_FALSE(Exists(tree));
    EXPECT_TRUE(IsFile(kept));
}

// ============================================================================
// Raw Byte I/O
// ============================================================================

TEST_F(OsTest, WriteAndReadBytes) {
    Path file = Dir().Child("data.bin");
    std::vector<uint8_t> data = {0x00, 0xFF, 0x10, 0x80, 0x00};
    ASSERT_TRUE(WriteFileBytes(file, data).ok());

    auto read = ReadFileBytes(file);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, data);
    EXPECT_EQ(FileSize(file), data.size());
}

TEST_F(OsTest, ReadMissingFile) {
    EXPECT_FALSE(ReadFileBytes(Dir().Child("missing.bin")).has_value());
}

TEST_F(OsTest, IfExistsPolicies) {
    Path file = Dir().Child("policy.txt");
    ASSERT_TRUE(WriteFileBytes(file, Bytes("first")).ok());

    ASSERT_TRUE(WriteFileBytes(file, Bytes("second")).ok());
    EXPECT_EQ(Content(file), "second");

    ASSERT_TRUE(WriteFileBytes(file, Bytes("+more"), IfExists::Append).ok());
    EXPECT_EQ(Content(file), "second+more");

    filekit::Status status = WriteFileBytes(file, Bytes("lost"), IfExists::Error);
    EXPECT_TRUE(status.IsAlreadyExists());
    EXPECT_EQ(Content(file), "second+more");
}

TEST_F(OsTest, IfExistsErrorCreatesNewFile) {
    Path file = Dir().Child("fresh.txt");
    EXPECT_TRUE(WriteFileBytes(file, Bytes("new"), IfExists::Error).ok());
    EXPECT_EQ(Content(file), "new");
}

TEST_F(OsTest, WriteIntoMissingDirectoryFails) {
    Path file = Dir().ChildDirectory("nope").Child("f.txt");
    EXPECT_TRUE(WriteFileBytes(file, Bytes("x")).IsIOError());
}

TEST_F(OsTest, CopyFile) {
    Path from = Dir().Child("from.txt");
    Path to = Dir().Child("to.txt");
    ASSERT_TRUE(WriteFileBytes(from, Bytes("payload")).ok());

    EXPECT_TRUE(CopyFile(from, to));
    EXPECT_EQ(Content(to), "payload");

    ASSERT_TRUE(WriteFileBytes(from, Bytes("changed")).ok());
    EXPECT_FALSE(CopyFile(from, to));
    EXPECT_EQ(Content(to), "payload");
    EXPECT_TRUE(CopyFile(from, to, true));
    EXPECT_EQ(Content(to), "changed");
}

// ============================================================================
// Permissions
// ============================================================================

TEST_F(OsTest, PermissionModeRoundTrip) {
    EXPECT_EQ(Permissions::FromMode(0754).Mode(), 0754);
    EXPECT_EQ(Permissions::DefaultFile().Mode(), 0644);
    EXPECT_EQ(Permissions::DefaultDirectory().Mode(), 0755);
    EXPECT_TRUE(Permissions::FromMode(0200).ownerWrite);
    EXPECT_FALSE(Permissions::FromMode(0577).ownerWrite);
}

TEST_F(OsTest, OwnerWriteFlag) {
    Path file = Dir().Child("ro.txt");
    ASSERT_TRUE(WriteFileBytes(file, Bytes("x")).ok());
    EXPECT_TRUE(IsWritableByOwner(file));

    ASSERT_TRUE(SetPermissions(file, Permissions::FromMode(0444)));
    EXPECT_FALSE(IsWritableByOwner(file));
    EXPECT_EQ(GetPermissions(file)->Mode(), 0444);

    EXPECT_TRUE(MakeWritable(file));
    EXPECT_TRUE(IsWritableByOwner(file));
    EXPECT_EQ(GetPermissions(file)->Mode(), 0644);
}

TEST_F(OsTest, PermissionsOfMissingPath) {
    Path missing = Dir().Child("missing");
    EXPECT_FALSE(GetPermissions(missing).has_value());
    EXPECT_FALSE(IsWritableByOwner(missing));
    EXPECT_FALSE(MakeWritable(missing));
}

// ============================================================================
// Path Queries
// ============================================================================

TEST_F(OsTest, CurrentPathIsAbsoluteDirectory) {
    Path current = CurrentPath();
    EXPECT_TRUE(current.IsAbsolute());
    EXPECT_TRUE(current.IsDirectoryForm());
}

TEST_F(OsTest, RealPathResolvesSymlinks) {
    Path target = Dir().Child("target.txt");
    ASSERT_TRUE(WriteFileBytes(target, Bytes("t")).ok());
    Path link = Dir().Child("link.txt");
    ASSERT_EQ(symlink(target.NativeString().c_str(), link.NativeString().c_str()), 0);

    auto realTarget = RealPath(target);
    auto realLink = RealPath(link);
    ASSERT_TRUE(realTarget.has_value());
    ASSERT_TRUE(realLink.has_value());
    EXPECT_EQ(*realLink, *realTarget);
    EXPECT_TRUE(IsSymlink(link));
    EXPECT_FALSE(IsSymlink(target));

    auto realDir = RealPath(Dir());
    ASSERT_TRUE(realDir.has_value());
    EXPECT_TRUE(realDir->IsDirectoryForm());
    EXPECT_TRUE(realDir->IsAbsolute());

    EXPECT_FALSE(RealPath(Dir().Child("missing")).has_value());
}

// ============================================================================
// Enumeration
// ============================================================================

TEST_F(OsTest, EnumerateNeedsWildcard) {
    EXPECT_THROW(EnumerateDirectory(Dir(), false), FsError);
    try {
        EnumerateDirectory(Dir(), false);
    } catch (const FsError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_COMPOSITION);
    }
}

TEST_F(OsTest, EnumerateMissingDirectory) {
    Path wildcard = path::DirectoryWildcard(Dir().ChildDirectory("missing"));
    try {
        EnumerateDirectory(wildcard, false);
        FAIL() << "expected FsError";
    } catch (const FsError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO_ERROR);
    }
}

TEST_F(OsTest, EnumerateAsSeen) {
    ASSERT_TRUE(CreateDirectory(Dir().ChildDirectory("sub")));
    ASSERT_TRUE(WriteFileBytes(Dir().Child("f.txt"), Bytes("f")).ok());
    ASSERT_EQ(symlink("nowhere", Dir().Child("dangling").NativeString().c_str()), 0);

    auto entries = EnumerateDirectory(path::DirectoryWildcard(Dir()), false);
    ASSERT_EQ(entries.size(), 3u);
    for (const auto& entry : entries) {
        EXPECT_FALSE(entry.resolved);
        if (entry.type == FileType::Directory) {
            EXPECT_EQ(entry.path, Dir().ChildDirectory("sub"));
        } else if (entry.type == FileType::Regular) {
            EXPECT_EQ(entry.path, Dir().Child("f.txt"));
        } else {
            EXPECT_EQ(entry.type, FileType::Symlink);
            EXPECT_EQ(entry.path, Dir().Child("dangling"));
        }
    }
}

// ============================================================================
// Checksums
// ============================================================================

TEST_F(OsTest, Sha256TestVectors) {
    EXPECT_EQ(Sha256Hex(nullptr, 0),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    const std::string abc = "abc";
    EXPECT_EQ(Sha256Hex(reinterpret_cast<const uint8_t*>(abc.data()), abc.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(OsTest, FileChecksum) {
    Path file = Dir().Child("abc.txt");
    ASSERT_TRUE(WriteFileBytes(file, Bytes("abc")).ok());
    EXPECT_EQ(FileChecksum(file),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(FileChecksum(Dir().Child("missing")), "");
}

} // namespace
} // namespace fs
} // namespace filekit
