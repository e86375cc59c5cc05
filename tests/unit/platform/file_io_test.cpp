// ShaderGen Platform Tests
// file_io_test.cpp - File I/O unit tests

#include <gtest/gtest.h>
#include <shadergen/core/error.hpp>
#include <shadergen/platform/file_io.hpp>

#include <memory>

using namespace shadergen::platform;

class FileIOTest : public ::testing::Test {
protected:
    std::unique_ptr<ScopedTempDirectory> scratch_;
    fs::path test_dir_;
    fs::path test_file_;

    void SetUp() override {
        scratch_ = std::make_unique<ScopedTempDirectory>("shadergen-test");
        test_dir_ = scratch_->path();
        test_file_ = test_dir_ / "test_file.txt";
    }

    void TearDown() override {
        scratch_.reset();
    }
};

TEST_F(FileIOTest, GetTempDirectory) {
    auto dir = FileSystem::get_temp_directory();
    EXPECT_FALSE(dir.empty());
}

TEST_F(FileIOTest, CreateDirectories) {
    auto nested = test_dir_ / "a" / "b" / "c";
    EXPECT_TRUE(FileSystem::create_directories(nested));
    EXPECT_TRUE(FileSystem::exists(nested));
    EXPECT_TRUE(FileSystem::exists(nested));
}

TEST_F(FileIOTest, WriteAndReadText) {
    std::string content = "#version 100\r\nprecision mediump float;\n";

    EXPECT_TRUE(FileSystem::write_text(test_file_, content));
    EXPECT_TRUE(FileSystem::exists(test_file_));

    // Binary mode keeps CRLF intact
    auto result = FileSystem::read_text(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, content);
}

TEST_F(FileIOTest, ReadBinary) {
    std::vector<uint8_t> data = {0x44, 0x58, 0x42, 0x43, 0x00, 0xFF};

    EXPECT_TRUE(FileSystem::write_text(test_file_, std::string(data.begin(), data.end())));

    auto result = FileSystem::read_binary(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, data);
}

TEST_F(FileIOTest, WriteCreatesParentDirectories) {
    auto nested = test_dir_ / "out" / "gen" / "shaders.hpp";
    EXPECT_TRUE(FileSystem::write_text(nested, "x"));
    EXPECT_TRUE(FileSystem::exists(nested));
}

TEST_F(FileIOTest, WriteTruncates) {
    ASSERT_TRUE(FileSystem::write_text(test_file_, "a much longer first version"));
    ASSERT_TRUE(FileSystem::write_text(test_file_, "short"));
    EXPECT_EQ(FileSystem::read_text(test_file_).value_or(""), "short");
}

TEST_F(FileIOTest, ReadNonExistent) {
    EXPECT_FALSE(FileSystem::read_text(test_dir_ / "missing.txt").has_value());
    EXPECT_FALSE(FileSystem::read_binary(test_dir_ / "missing.bin").has_value());
}

TEST_F(FileIOTest, Remove) {
    FileSystem::write_text(test_file_, "test");
    EXPECT_TRUE(FileSystem::exists(test_file_));

    EXPECT_TRUE(FileSystem::remove(test_file_));
    EXPECT_FALSE(FileSystem::exists(test_file_));
}

TEST_F(FileIOTest, ListFilesSorted) {
    FileSystem::write_text(test_dir_ / "stencil.vert", "");
    FileSystem::write_text(test_dir_ / "blit.frag", "");
    FileSystem::write_text(test_dir_ / "blit.vert", "");
    FileSystem::create_directories(test_dir_ / "include");

    auto files = FileSystem::list_files(test_dir_);
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 3u);
    EXPECT_EQ((*files)[0].filename().string(), "blit.frag");
    EXPECT_EQ((*files)[1].filename().string(), "blit.vert");
    EXPECT_EQ((*files)[2].filename().string(), "stencil.vert");
}

TEST_F(FileIOTest, ListFilesMissingDirectory) {
    EXPECT_FALSE(FileSystem::list_files(test_dir_ / "nope").has_value());
}

// ============================================================================
// Scoped helpers
// ============================================================================

TEST_F(FileIOTest, ScopedTempDirectoryRemovesContents) {
    fs::path path;
    {
        ScopedTempDirectory dir("shadergen-scoped");
        path = dir.path();
        EXPECT_TRUE(FileSystem::exists(path));
        EXPECT_NE(path.filename().string().find("shadergen-scoped-"), std::string::npos);
        FileSystem::write_text(path / "nested" / "file.txt", "x");
    }
    EXPECT_FALSE(FileSystem::exists(path));
}

TEST_F(FileIOTest, ScopedTempDirectoriesAreUnique) {
    ScopedTempDirectory a("shadergen-unique");
    ScopedTempDirectory b("shadergen-unique");
    EXPECT_NE(a.path().string(), b.path().string());
}

TEST_F(FileIOTest, ScopedFileRemovesOnExit) {
    {
        ScopedFile file(test_file_);
        FileSystem::write_text(file.path(), "scratch");
        EXPECT_TRUE(FileSystem::exists(test_file_));
    }
    EXPECT_FALSE(FileSystem::exists(test_file_));
}

TEST_F(FileIOTest, ScopedFileToleratesMissingFile) {
    {
        ScopedFile file(test_dir_ / "never_written");
    }
    SUCCEED();
}
