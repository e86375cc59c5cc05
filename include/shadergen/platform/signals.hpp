// ShaderGen Platform Layer
// signals.hpp - SIGINT/SIGTERM turned into a cooperative abort

#pragma once

namespace shadergen::platform {

// Replace the default SIGINT and SIGTERM actions with handlers that only
// record the signal. The run then aborts through a normal exception so
// scope-owned scratch state is released. Call once, early in main.
void install_interrupt_handlers();

[[nodiscard]] bool interrupt_requested();

// Throws Error(Interrupted) once a signal has been recorded
void throw_if_interrupted();

}  // namespace shadergen::platform
