#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/procscope";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/procscope";
}

} // namespace platform
