#include <gtest/gtest.h>
#include <boa/io/source_io.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace boa::io;
namespace fs = std::filesystem;

namespace {

class SourceIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("boa_source_io_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string path_of(const std::string& name) const {
        return (dir_ / name).string();
    }

    fs::path dir_;
};

}  // namespace

TEST(SourceIoStdioTest, EmptyOrDashSelectsStandardStreams) {
    EXPECT_TRUE(is_stdio_path(""));
    EXPECT_TRUE(is_stdio_path("-"));
    EXPECT_FALSE(is_stdio_path("a.boa"));
    EXPECT_FALSE(is_stdio_path("--"));
}

TEST_F(SourceIoTest, ReadsWholeFile) {
    {
        std::ofstream file(path_of("in.boa"), std::ios::binary);
        file << "body\r\n  color: red\n";
    }
    std::string text;
    std::string err;
    ASSERT_TRUE(read_source(path_of("in.boa"), text, err)) << err;
    EXPECT_EQ(text, "body\r\n  color: red\n");
    EXPECT_TRUE(err.empty());
}

TEST_F(SourceIoTest, ReadsEmptyFile) {
    { std::ofstream file(path_of("empty.boa")); }
    std::string text = "stale";
    std::string err;
    ASSERT_TRUE(read_source(path_of("empty.boa"), text, err)) << err;
    EXPECT_TRUE(text.empty());
}

TEST_F(SourceIoTest, MissingFileIsReported) {
    std::string text;
    std::string err;
    EXPECT_FALSE(read_source(path_of("missing.boa"), text, err));
    EXPECT_EQ(err, "Input file not found: " + path_of("missing.boa"));
}

TEST_F(SourceIoTest, DirectoryIsNotAnInputFile) {
    std::string text;
    std::string err;
    EXPECT_FALSE(read_source(dir_.string(), text, err));
    EXPECT_EQ(err.rfind("Input file not found", 0), 0u);
}

TEST_F(SourceIoTest, WriteReplacesFileContents) {
    std::string err;
    ASSERT_TRUE(write_output("a {\n  color: red;\n}\n", path_of("out.css"), err)) << err;
    ASSERT_TRUE(write_output("b{}", path_of("out.css"), err)) << err;

    std::string text;
    ASSERT_TRUE(read_source(path_of("out.css"), text, err)) << err;
    EXPECT_EQ(text, "b{}");
}

TEST_F(SourceIoTest, WriteIntoMissingDirectoryFails) {
    std::string err;
    EXPECT_FALSE(write_output("x", path_of("no/such/dir/out.css"), err));
    EXPECT_EQ(err, "Unable to open output file: " + path_of("no/such/dir/out.css"));
}
