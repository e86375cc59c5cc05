// ShaderGen Platform Layer
// signals.cpp - POSIX interrupt handling

#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/signals.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>

#if defined(SHADERGEN_PLATFORM_LINUX) || defined(SHADERGEN_PLATFORM_MACOS)
#include <signal.h>
#else
#error "shadergen interrupt handling requires a POSIX platform"
#endif

namespace shadergen::platform {

namespace {

volatile std::sig_atomic_t g_received_signal = 0;

void record_signal(int signal_number) {
    g_received_signal = signal_number;
}

const char* signal_name(int signal_number) {
    switch (signal_number) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "signal";
    }
}

}  // namespace

void install_interrupt_handlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = record_signal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: blocking reads and waits return EINTR and are retried
    // by their callers, which then reach the next interrupt check
    action.sa_flags = 0;

    for (int signal_number : {SIGINT, SIGTERM}) {
        if (::sigaction(signal_number, &action, nullptr) != 0) {
            SHADERGEN_LOG_WARN(core::log_category::PLATFORM, "Failed to install {} handler: {}",
                               signal_name(signal_number), std::strerror(errno));
        }
    }
}

bool interrupt_requested() {
    return g_received_signal != 0;
}

void throw_if_interrupted() {
    int signal_number = g_received_signal;
    if (signal_number != 0) {
        throw core::Error(core::ErrorCode::Interrupted, fmt::format("interrupted by {}", signal_name(signal_number)));
    }
}

}  // namespace shadergen::platform
