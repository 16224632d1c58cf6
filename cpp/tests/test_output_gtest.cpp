// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================

#include "sgrep/config_set.hpp"
#include "sgrep/output.hpp"
#include "sgrep/platform.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>

namespace sgrep::output::test {

using sgrep::test::TempDirTest;

namespace {

/// Выполнить действие над Writer и вернуть захваченный stderr
template <typename Fn>
std::string capture_stderr(const OutputConfig& config, Fn&& fn) {
    Writer writer(config);
    testing::internal::CaptureStderr();
    fn(writer);
    writer.flush();
    return testing::internal::GetCapturedStderr();
}

}  // namespace

// ==============================================================================
// Префиксы сообщений
// ==============================================================================

TEST(OutputTest, FormatHelpers_Prefixes) {
    EXPECT_EQ(format_info("hello"), "[+] hello\n");
    EXPECT_EQ(format_error("hello"), "[x] hello\n");
}

TEST(OutputTest, Writer_Error_PrefixedOnStderr) {
    std::string err = capture_stderr(OutputConfig{}, [](Writer& w) { w.error("boom"); });
    EXPECT_EQ(err, "[x] boom\n");
}

// ==============================================================================
// quiet / verbose
// ==============================================================================

TEST(OutputTest, Writer_QuietMode_InfoAndWarnSuppressed) {
    OutputConfig config;
    config.quiet = true;
    std::string err = capture_stderr(config, [](Writer& w) {
        w.info("info");
        w.warn("warn");
    });
    EXPECT_TRUE(err.empty()) << err;
}

TEST(OutputTest, Writer_QuietMode_ErrorNotSuppressed) {
    OutputConfig config;
    config.quiet = true;
    std::string err = capture_stderr(config, [](Writer& w) { w.error("still here"); });
    EXPECT_NE(err.find("still here"), std::string::npos);
}

TEST(OutputTest, Writer_Verbose0_DebugSuppressed) {
    std::string err = capture_stderr(OutputConfig{}, [](Writer& w) { w.debug("hidden"); });
    EXPECT_TRUE(err.empty());
}

TEST(OutputTest, Writer_Verbose1_DebugButNotTrace) {
    OutputConfig config;
    config.verbose = 1;
    std::string err = capture_stderr(config, [](Writer& w) {
        w.debug("visible");
        w.trace("hidden");
    });
    EXPECT_NE(err.find("[*] visible"), std::string::npos);
    EXPECT_EQ(err.find("hidden"), std::string::npos);
}

TEST(OutputTest, Writer_Verbose2_TraceEnabled) {
    OutputConfig config;
    config.verbose = 2;
    std::string err = capture_stderr(config, [](Writer& w) { w.trace("deep"); });
    EXPECT_NE(err.find("[~] deep"), std::string::npos);
}

// ==============================================================================
// indent
// ==============================================================================

TEST(OutputTest, Indent_EachLineTabbed) {
    EXPECT_EQ(indent("line one\nline two"), "\tline one\n\tline two");
}

TEST(OutputTest, Indent_TrailingNewlineDropped) {
    EXPECT_EQ(indent("only\n"), "\tonly");
}

TEST(OutputTest, Indent_Empty) {
    EXPECT_EQ(indent(""), "");
}

// ==============================================================================
// JSON
// ==============================================================================

TEST(OutputTest, ConfigSetToJson_AbsentIsNull) {
    config::ConfigSet configs;
    configs.emplace("a.yml", Value::make_object());
    configs.emplace("b.yml", std::nullopt);

    rapidjson::Document doc = config::to_json(configs);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    EXPECT_EQ(std::string(buffer.GetString()), "{\"a.yml\":{},\"b.yml\":null}");
}

// ==============================================================================
// Вывод в файл
// ==============================================================================

class OutputFileTest : public TempDirTest {};

TEST_F(OutputFileTest, Writer_OutputFile_ReceivesStdout) {
    std::filesystem::path path = test_dir_ / "out.json";
    {
        OutputConfig config;
        config.output_path = path;
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());

        rapidjson::Document doc;
        doc.SetObject();
        doc.AddMember("k", 1, doc.GetAllocator());
        writer.write_json(doc);
    }

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "{\"k\":1}");
}

TEST_F(OutputFileTest, Writer_OutputFile_UnwritablePath) {
    OutputConfig config;
    config.output_path = test_dir_ / "missing" / "out.json";
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

TEST(OutputTest, Writer_HasOutputFile_FalseByDefault) {
    Writer writer(OutputConfig{});
    EXPECT_FALSE(writer.has_output_file());
}

}  // namespace sgrep::output::test
