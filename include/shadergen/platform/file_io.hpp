// ShaderGen Platform Layer
// file_io.hpp - File system operations and scratch directories

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shadergen::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations
class FileSystem {
public:
    static fs::path get_temp_directory();

    // Synchronous file operations
    static std::optional<std::vector<uint8_t>> read_binary(const fs::path& path);
    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    // Directory operations
    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool remove(const fs::path& path);
    static bool remove_all(const fs::path& path);

    // Regular files only, sorted by path. Returns nullopt if the directory
    // cannot be read.
    static std::optional<std::vector<fs::path>> list_files(const fs::path& path);

private:
    FileSystem() = delete;  // Static class, no instances
};

// Uniquely named directory under the system temp directory.
// The directory and everything in it is removed on destruction.
class ScopedTempDirectory {
public:
    // Throws Error(IoError) if the directory cannot be created
    explicit ScopedTempDirectory(std::string_view prefix);
    ~ScopedTempDirectory();

    ScopedTempDirectory(const ScopedTempDirectory&) = delete;
    ScopedTempDirectory& operator=(const ScopedTempDirectory&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// Removes a single scratch file when it goes out of scope
class ScopedFile {
public:
    explicit ScopedFile(fs::path path) : path_(std::move(path)) {}
    ~ScopedFile();

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

}  // namespace shadergen::platform
