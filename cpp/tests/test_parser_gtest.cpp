// ==============================================================================
// test_parser_gtest.cpp - Тесты разбора одного документа (GoogleTest)
// ==============================================================================

#include "sgrep/parser.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <string>

namespace sgrep::config::test {

using sgrep::test::TempDirTest;

class ParserTest : public TempDirTest {
protected:
    output::OutputConfig out_cfg_;
    output::Writer writer_{out_cfg_};
};

// ==============================================================================
// parse_config_string
// ==============================================================================

TEST_F(ParserTest, String_ValidDocument_SingleEntry) {
    ConfigSet configs = parse_config_string("remote-url", "rules: []\n", writer_);

    ASSERT_EQ(configs.size(), 1u);
    const auto& doc = configs.at("remote-url");
    ASSERT_TRUE(doc.has_value());
    ASSERT_TRUE(doc->get("rules") != nullptr);
    EXPECT_TRUE(doc->get("rules")->is_array());
}

TEST_F(ParserTest, String_EmptyText_PresentNullDocument) {
    ConfigSet configs = parse_config_string("empty.yml", "", writer_);

    ASSERT_EQ(configs.size(), 1u);
    ASSERT_TRUE(configs.at("empty.yml").has_value());
    EXPECT_TRUE(configs.at("empty.yml")->is_null());
}

TEST_F(ParserTest, String_CommentOnly_PresentNullDocument) {
    ConfigSet configs = parse_config_string("c.yml", "# nothing here\n", writer_);
    ASSERT_TRUE(configs.at("c.yml").has_value());
    EXPECT_TRUE(configs.at("c.yml")->is_null());
}

TEST_F(ParserTest, String_SyntaxError_AbsentAndLogged) {
    testing::internal::CaptureStderr();
    ConfigSet configs = parse_config_string("b.yml", "rules: [unclosed\n", writer_);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(configs.size(), 1u);
    EXPECT_FALSE(configs.at("b.yml").has_value());
    EXPECT_NE(err.find("[x] Invalid yaml file b.yml:\n\t"), std::string::npos);
}

TEST_F(ParserTest, String_MultipleDocuments_AbsentAndLogged) {
    testing::internal::CaptureStderr();
    ConfigSet configs = parse_config_string("multi.yml", "a: 1\n---\nb: 2\n", writer_);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_FALSE(configs.at("multi.yml").has_value());
    EXPECT_NE(err.find("expected a single document in the stream"), std::string::npos);
}

TEST_F(ParserTest, String_ErrorDoesNotThrow) {
    EXPECT_NO_THROW(parse_config_string("x", "a: b: c: [", writer_));
}

// ==============================================================================
// parse_config_at_path
// ==============================================================================

TEST_F(ParserTest, Path_ExistingFile_IdIsPath) {
    auto path = write_file("sgrep.yml", "rules:\n  - id: a\n");

    ConfigSet configs = parse_config_at_path(path, writer_);

    ASSERT_EQ(configs.size(), 1u);
    auto it = configs.find(platform::path_to_utf8(path));
    ASSERT_NE(it, configs.end());
    ASSERT_TRUE(it->second.has_value());
    EXPECT_EQ(it->second->get("rules")->array_size(), 1u);
}

TEST_F(ParserTest, Path_ExplicitId) {
    auto path = write_file("nested/a.yml", "x: 1\n");

    ConfigSet configs = parse_config_at_path(path, "a.yml", writer_);

    ASSERT_EQ(configs.count("a.yml"), 1u);
    EXPECT_EQ(configs.at("a.yml")->get("x")->as_int(), 1);
}

TEST_F(ParserTest, Path_MissingFile_AbsentAndLogged) {
    auto path = test_dir_ / "gone.yml";

    testing::internal::CaptureStderr();
    ConfigSet configs = parse_config_at_path(path, "gone.yml", writer_);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(configs.size(), 1u);
    EXPECT_FALSE(configs.at("gone.yml").has_value());
    EXPECT_NE(err.find("YAML file at " + platform::path_to_utf8(path) + " not found"),
              std::string::npos);
}

}  // namespace sgrep::config::test
