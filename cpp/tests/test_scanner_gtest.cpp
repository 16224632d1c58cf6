// ==============================================================================
// test_scanner_gtest.cpp - Тесты обхода директории с конфигами (GoogleTest)
// ==============================================================================

#include "sgrep/scanner.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sgrep::config::test {

using sgrep::test::TempDirTest;

class ScannerTest : public TempDirTest {
protected:
    output::OutputConfig out_cfg_;
    output::Writer writer_{out_cfg_};
};

// ==============================================================================
// Расширения
// ==============================================================================

TEST(ScannerExtensionTest, YmlAndYamlAccepted) {
    EXPECT_TRUE(is_yaml_extension("a.yml"));
    EXPECT_TRUE(is_yaml_extension("dir/b.yaml"));
}

TEST(ScannerExtensionTest, OtherExtensionsRejected) {
    EXPECT_FALSE(is_yaml_extension("a.json"));
    EXPECT_FALSE(is_yaml_extension("a.YML"));
    EXPECT_FALSE(is_yaml_extension("yml"));
    EXPECT_FALSE(is_yaml_extension("a.yml.bak"));
}

// ==============================================================================
// Правило исключения скрытых директорий
// ==============================================================================

TEST(ScannerHiddenTest, DotfileLeafKept) {
    EXPECT_FALSE(is_hidden_config_dir("rules/.sgrep.yml"));
    EXPECT_FALSE(is_hidden_config_dir(".hidden.yml"));
}

TEST(ScannerHiddenTest, HiddenDirectoryExcluded) {
    EXPECT_TRUE(is_hidden_config_dir("path/.github/foo.yml"));
    EXPECT_TRUE(is_hidden_config_dir(".git/config.yml"));
}

TEST(ScannerHiddenTest, MarkerDirectoryKept) {
    EXPECT_FALSE(is_hidden_config_dir("src/.sgrep/bad_pattern.yml"));
    EXPECT_FALSE(is_hidden_config_dir(".sgrep_rules/a.yml"));
}

TEST(ScannerHiddenTest, DotComponentsIgnored) {
    EXPECT_FALSE(is_hidden_config_dir("./rules/a.yml"));
    EXPECT_FALSE(is_hidden_config_dir("../rules/a.yml"));
}

// ==============================================================================
// find_config_files
// ==============================================================================

TEST_F(ScannerTest, Find_RecursiveSorted) {
    write_file("b.yml", "x: 1");
    write_file("a.yaml", "x: 1");
    write_file("sub/deep/c.yml", "x: 1");
    write_file("notes.txt", "not a config");

    auto files = find_config_files(test_dir_, writer_);

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], std::filesystem::path("a.yaml"));
    EXPECT_EQ(files[1], std::filesystem::path("b.yml"));
    EXPECT_EQ(files[2], std::filesystem::path("sub/deep/c.yml"));
}

TEST_F(ScannerTest, Find_EmptyDirectory) {
    EXPECT_TRUE(find_config_files(test_dir_, writer_).empty());
}

// ==============================================================================
// parse_config_folder
// ==============================================================================

TEST_F(ScannerTest, Folder_Relative_IdsRelativeToRoot) {
    write_file("a.yml", "rules: []");
    write_file("sub/b.yaml", "rules: []");

    ConfigSet configs = parse_config_folder(test_dir_, true, writer_);

    ASSERT_EQ(configs.size(), 2u);
    EXPECT_TRUE(configs.count("a.yml"));
    EXPECT_TRUE(configs.count("sub/b.yaml"));
}

TEST_F(ScannerTest, Folder_NotRelative_IdsUnderIdRoot) {
    write_file("rules/a.yml", "rules: []");

    ConfigSet configs = parse_config_folder(test_dir_ / "rules", false, writer_, std::filesystem::path("rules"));

    ASSERT_EQ(configs.size(), 1u);
    EXPECT_TRUE(configs.count("rules/a.yml"));
}

TEST_F(ScannerTest, Folder_NotRelative_DefaultIdRootIsRoot) {
    write_file("a.yml", "rules: []");

    ConfigSet configs = parse_config_folder(test_dir_, false, writer_);

    EXPECT_TRUE(configs.count(platform::path_to_utf8(test_dir_ / "a.yml")));
}

TEST_F(ScannerTest, Folder_ExclusionBoundary) {
    write_file(".github/workflow.yml", "x: 1");
    write_file(".sgrep/kept.yml", "x: 1");
    write_file(".hidden.yml", "x: 1");
    write_file("src/.cache/deep/skip.yml", "x: 1");

    ConfigSet configs = parse_config_folder(test_dir_, true, writer_);

    EXPECT_EQ(configs.size(), 2u);
    EXPECT_TRUE(configs.count(".sgrep/kept.yml"));
    EXPECT_TRUE(configs.count(".hidden.yml"));
    EXPECT_FALSE(configs.count(".github/workflow.yml"));
    EXPECT_FALSE(configs.count("src/.cache/deep/skip.yml"));
}

TEST_F(ScannerTest, Folder_ExclusionIgnoresHiddenAncestorsOfRoot) {
    // Скрытые компоненты выше корня обхода не участвуют в id
    write_file(".outer/rules/a.yml", "x: 1");

    ConfigSet configs = parse_config_folder(test_dir_ / ".outer" / "rules", true, writer_);

    EXPECT_EQ(configs.size(), 1u);
    EXPECT_TRUE(configs.count("a.yml"));
}

TEST_F(ScannerTest, Folder_ParseErrorIsolated) {
    const int good = 4;
    for (int i = 0; i < good; ++i) {
        write_file("good" + std::to_string(i) + ".yml", "rules: []");
    }
    write_file("bad.yml", "rules: [unclosed");

    testing::internal::CaptureStderr();
    ConfigSet configs = parse_config_folder(test_dir_, true, writer_);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(configs.size(), static_cast<std::size_t>(good + 1));
    EXPECT_EQ(count_absent(configs), 1u);
    EXPECT_FALSE(configs.at("bad.yml").has_value());
    EXPECT_NE(err.find("Invalid yaml file bad.yml"), std::string::npos);
}

TEST_F(ScannerTest, Folder_SymlinkedDirectoryNotFollowed) {
    write_file("real/a.yml", "x: 1");
    std::error_code ec;
    std::filesystem::create_directory_symlink(test_dir_ / "real", test_dir_ / "link", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    ConfigSet configs = parse_config_folder(test_dir_, true, writer_);

    EXPECT_EQ(configs.size(), 1u);
    EXPECT_TRUE(configs.count("real/a.yml"));
}

}  // namespace sgrep::config::test
