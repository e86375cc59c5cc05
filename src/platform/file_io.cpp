// ShaderGen Platform Layer
// file_io.cpp - File system implementation

#include <shadergen/core/error.hpp>
#include <shadergen/platform/file_io.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <random>

namespace shadergen::platform {

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path();
}

std::optional<std::vector<uint8_t>> FileSystem::read_binary(const fs::path& path) {
    try {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            spdlog::debug("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        auto size = file.tellg();
        if (size < 0) {
            return std::nullopt;
        }

        std::vector<uint8_t> data(static_cast<size_t>(size));
        file.seekg(0, std::ios::beg);
        file.read(reinterpret_cast<char*>(data.data()), size);

        if (!file) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return data;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        // Binary mode keeps the bytes exactly as written
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            spdlog::debug("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

        if (!file && !file.eof()) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return content;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    try {
        if (path.has_parent_path()) {
            create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for writing: {}", path.string());
            return false;
        }

        file << content;

        if (!file) {
            spdlog::warn("Error writing file: {}", path.string());
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::create_directories(const fs::path& path) {
    try {
        return fs::create_directories(path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create directories '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::exists(const fs::path& path) {
    try {
        return fs::exists(path);
    } catch (const std::exception& e) {
        spdlog::warn("Error checking existence of '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::remove(const fs::path& path) {
    try {
        return fs::remove(path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::remove_all(const fs::path& path) {
    try {
        fs::remove_all(path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove all '{}': {}", path.string(), e.what());
        return false;
    }
}

std::optional<std::vector<fs::path>> FileSystem::list_files(const fs::path& path) {
    std::vector<fs::path> result;
    try {
        if (!fs::is_directory(path)) {
            return std::nullopt;
        }

        for (const auto& entry : fs::directory_iterator(path)) {
            if (entry.is_regular_file()) {
                result.push_back(entry.path());
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Error listing files in '{}': {}", path.string(), e.what());
        return std::nullopt;
    }

    // directory_iterator order is unspecified
    std::sort(result.begin(), result.end());
    return result;
}

// ScopedTempDirectory implementation
ScopedTempDirectory::ScopedTempDirectory(std::string_view prefix) {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::uniform_int_distribution<uint64_t> distribution;

    fs::path base = FileSystem::get_temp_directory();
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = base / fmt::format("{}-{:016x}", prefix, distribution(engine));
        std::error_code ec;
        if (fs::create_directory(candidate, ec)) {
            path_ = std::move(candidate);
            return;
        }
        if (ec && ec != std::errc::file_exists) {
            throw core::Error(core::ErrorCode::IoError,
                              fmt::format("failed to create temp directory {}: {}", candidate.string(), ec.message()));
        }
    }
    throw core::Error(core::ErrorCode::IoError, "failed to create a unique temp directory under " + base.string());
}

ScopedTempDirectory::~ScopedTempDirectory() {
    if (!path_.empty()) {
        FileSystem::remove_all(path_);
    }
}

ScopedFile::~ScopedFile() {
    std::error_code ec;
    fs::remove(path_, ec);
}

}  // namespace shadergen::platform
