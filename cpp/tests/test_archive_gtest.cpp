// ==============================================================================
// test_archive_gtest.cpp - Тесты распаковки gzip tarball (GoogleTest)
// ==============================================================================

#include "sgrep/archive.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>

namespace sgrep::archive::test {

using sgrep::test::gzip_compress;
using sgrep::test::TarBuilder;
using sgrep::test::TempDirTest;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace

class ArchiveTest : public TempDirTest {};

// ==============================================================================
// extract_tar
// ==============================================================================

TEST_F(ArchiveTest, Extract_GithubLayout_RootIsTopDirectory) {
    std::string tar = TarBuilder()
                          .global_header("52 comment=0123456789abcdef0123456789abcdef01234567\n")
                          .directory("returntocorp-sgrep-rules-abc123/")
                          .file("returntocorp-sgrep-rules-abc123/python/eqeq.yml", "rules: []\n")
                          .build();

    ExtractResult result = extract_tar(tar, test_dir_);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.root, test_dir_ / "returntocorp-sgrep-rules-abc123");
    EXPECT_EQ(result.members, 2u);
    EXPECT_EQ(read_file(result.root / "python" / "eqeq.yml"), "rules: []\n");
}

TEST_F(ArchiveTest, Extract_FirstMemberOrderDecidesRoot) {
    // zzz идёт первым в архиве, хотя по алфавиту aaa раньше
    std::string tar = TarBuilder()
                          .directory("zzz/")
                          .file("zzz/a.yml", "x: 1")
                          .directory("aaa/")
                          .file("aaa/b.yml", "x: 2")
                          .build();

    ExtractResult result = extract_tar(tar, test_dir_);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.root, test_dir_ / "zzz");
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "aaa" / "b.yml"));
}

TEST_F(ArchiveTest, Extract_ImplicitDirectoryFromNestedFile) {
    std::string tar = TarBuilder().file("top/rules/a.yml", "x: 1").build();

    ExtractResult result = extract_tar(tar, test_dir_);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.root, test_dir_ / "top");
}

TEST_F(ArchiveTest, Extract_TopLevelFileIsLayoutError) {
    std::string tar = TarBuilder().file("README.md", "hello").directory("rules/").build();

    ExtractResult result = extract_tar(tar, test_dir_);

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("is not a directory"), std::string::npos);
}

TEST_F(ArchiveTest, Extract_EmptyArchiveIsLayoutError) {
    ExtractResult result = extract_tar(TarBuilder().build(), test_dir_);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "archive contains no entries");
}

TEST_F(ArchiveTest, Extract_ParentTraversalThrows) {
    std::string tar = TarBuilder().file("top/../../escape.yml", "x: 1").build();
    EXPECT_THROW(extract_tar(tar, test_dir_), ArchiveError);
}

TEST_F(ArchiveTest, Extract_AbsolutePathThrows) {
    std::string tar = TarBuilder().file("/etc/escape.yml", "x: 1").build();
    EXPECT_THROW(extract_tar(tar, test_dir_), ArchiveError);
}

TEST_F(ArchiveTest, Extract_BadChecksumThrows) {
    std::string tar = TarBuilder().directory("top/").build();
    tar[0] = 'X';
    EXPECT_THROW(extract_tar(tar, test_dir_), ArchiveError);
}

TEST_F(ArchiveTest, Extract_TruncatedBodyThrows) {
    std::string tar = TarBuilder().file("top/a.yml", std::string(2000, 'x')).build();
    tar.resize(512 + 100);
    EXPECT_THROW(extract_tar(tar, test_dir_), ArchiveError);
}

TEST_F(ArchiveTest, ExtractTarGz_ConcatenatedMembers) {
    std::string tar = TarBuilder().directory("repo-1/").file("repo-1/a.yml", "x: 1").build();
    // Первый gzip член - половина потока, второй - остаток
    std::string tgz = gzip_compress(tar.substr(0, 512)) + gzip_compress(tar.substr(512));

    ExtractResult result = extract_tar_gz(tgz, test_dir_);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(read_file(result.root / "a.yml"), "x: 1");
}

TEST_F(ArchiveTest, ExtractTarGz_NotGzipThrows) {
    EXPECT_THROW(extract_tar_gz("definitely not gzip", test_dir_), ArchiveError);
}

TEST_F(ArchiveTest, ExtractTarGz_TruncatedThrows) {
    std::string tgz = gzip_compress(TarBuilder()
                                        .directory("top/")
                                        .file("top/a.yml", std::string(64 * 1024, 'x'))
                                        .build());
    tgz.resize(tgz.size() / 2);
    EXPECT_THROW(extract_tar_gz(tgz, test_dir_), ArchiveError);
}

TEST_F(ArchiveTest, ExtractTarGz_EndToEnd) {
    std::string tgz = gzip_compress(TarBuilder()
                                        .directory("repo-1/")
                                        .file("repo-1/a.yml", "rules: []")
                                        .build());

    ExtractResult result = extract_tar_gz(tgz, test_dir_);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(read_file(result.root / "a.yml"), "rules: []");
}

// ==============================================================================
// ScratchDirectory
// ==============================================================================

TEST(ScratchDirectoryTest, CreatedAndRemoved) {
    std::filesystem::path path;
    {
        ScratchDirectory scratch;
        path = scratch.path();
        EXPECT_TRUE(std::filesystem::is_directory(path));
        std::ofstream(path / "file.yml") << "x: 1";
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ScratchDirectoryTest, UniquePerInstance) {
    ScratchDirectory first;
    ScratchDirectory second;
    EXPECT_NE(first.path(), second.path());
}

}  // namespace sgrep::archive::test
