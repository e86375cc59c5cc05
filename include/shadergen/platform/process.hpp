// ShaderGen Platform Layer
// process.hpp - External tool lookup and blocking subprocess execution

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shadergen::platform {

struct ProcessResult {
    bool launched = false;  // False if the program could not be started
    int exit_code = -1;     // -1 when killed by a signal or not launched
    std::string output;     // Combined stdout and stderr

    [[nodiscard]] bool succeeded() const { return launched && exit_code == 0; }
};

// Locate an executable. Names containing a directory separator are checked
// directly, bare names are searched in PATH.
[[nodiscard]] std::optional<std::filesystem::path> find_executable(std::string_view name);

// Run a program to completion and capture its output. Blocks with no timeout.
[[nodiscard]] ProcessResult run_process(const std::filesystem::path& program, const std::vector<std::string>& args);

}  // namespace shadergen::platform
