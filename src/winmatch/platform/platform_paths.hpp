#pragma once

#include <string>

namespace platform {

// Directory holding config.json, or empty if neither $XDG_CONFIG_HOME nor $HOME is set.
std::string config_dir();

// Compositor IPC socket from the environment, or empty when not running under one.
std::string compositor_socket();

} // namespace platform
