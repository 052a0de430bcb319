#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/procscope or ~/.config/procscope; empty if neither is known.
std::string config_dir();

} // namespace platform
