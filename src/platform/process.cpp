// ShaderGen Platform Layer
// process.cpp - POSIX subprocess implementation

#include <shadergen/core/logger.hpp>
#include <shadergen/platform/process.hpp>

#include <spdlog/fmt/ranges.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#if defined(SHADERGEN_PLATFORM_LINUX) || defined(SHADERGEN_PLATFORM_MACOS)
#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#else
#error "shadergen subprocess support requires a POSIX platform"
#endif

extern char** environ;

namespace shadergen::platform {

namespace {

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

// Closes a pipe end on scope exit
struct FdGuard {
    int fd = -1;
    ~FdGuard() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
    void reset() {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

}  // namespace

std::optional<std::filesystem::path> find_executable(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path candidate(name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }

    std::string_view search_path(path_env);
    while (!search_path.empty()) {
        auto separator = search_path.find(':');
        std::string_view directory = search_path.substr(0, separator);
        // Empty PATH element means the current directory
        std::filesystem::path candidate = directory.empty() ? std::filesystem::path(".") : std::filesystem::path(directory);
        candidate /= std::string(name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
        if (separator == std::string_view::npos) {
            break;
        }
        search_path.remove_prefix(separator + 1);
    }
    return std::nullopt;
}

ProcessResult run_process(const std::filesystem::path& program, const std::vector<std::string>& args) {
    ProcessResult result;

    int pipe_fds[2];
    if (::pipe(pipe_fds) != 0) {
        result.output = fmt::format("pipe() failed: {}", std::strerror(errno));
        return result;
    }
    FdGuard read_end{pipe_fds[0]};
    FdGuard write_end{pipe_fds[1]};
    ::fcntl(read_end.fd, F_SETFD, FD_CLOEXEC);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, write_end.fd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, write_end.fd, STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, write_end.fd);

    std::string program_str = program.string();
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(program_str.data());
    std::vector<std::string> arg_storage(args);
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    SHADERGEN_LOG_TRACE(core::log_category::PLATFORM, "spawn: {} {}", program_str, fmt::join(args, " "));

    pid_t pid = 0;
    int spawn_status = ::posix_spawn(&pid, program_str.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (spawn_status != 0) {
        result.output = fmt::format("failed to launch {}: {}", program_str, std::strerror(spawn_status));
        return result;
    }
    result.launched = true;

    // Parent keeps only the read end so EOF arrives when the child exits
    write_end.reset();

    char buffer[4096];
    for (;;) {
        ssize_t count = ::read(read_end.fd, buffer, sizeof(buffer));
        if (count > 0) {
            result.output.append(buffer, static_cast<size_t>(count));
        } else if (count == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.output += fmt::format("\nwaitpid() failed: {}", std::strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

}  // namespace shadergen::platform
