#pragma once

#include <string>

struct WindowInfo {
    std::string id;            // X11 window id or sway con id
    std::string app_id;        // Wayland app_id (e.g. "firefox")
    std::string window_class;  // X11 class (e.g. "Navigator.firefox")
    std::string title;         // window title
    int pid = 0;               // window process PID

    bool empty() const { return app_id.empty() && window_class.empty() && title.empty() && pid == 0; }
};
