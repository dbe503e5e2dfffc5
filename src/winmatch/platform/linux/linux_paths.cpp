#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/winmatch";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/winmatch";
}

std::string compositor_socket() {
    const char* sway = std::getenv("SWAYSOCK");
    if (sway) return sway;
    const char* i3 = std::getenv("I3SOCK");
    if (i3) return i3;
    return {};
}

} // namespace platform
