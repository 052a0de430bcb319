#pragma once

#include "wm/window_info.hpp"

#include <optional>
#include <string>
#include <vector>

class WindowQuery {
public:
    virtual ~WindowQuery() = default;

    // Name shown in the report, e.g. "sway".
    virtual std::string name() const = 0;

    // All open top-level windows, or nullopt when the window manager
    // cannot be queried from this environment.
    virtual std::optional<std::vector<WindowInfo>> list_windows() = 0;
};
