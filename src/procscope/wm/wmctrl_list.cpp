#include "wmctrl_list.hpp"

#include <sstream>
#include <string>

std::vector<WindowInfo> parse_wmctrl_list(std::string_view output) {
    std::vector<WindowInfo> windows;

    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string id, desktop, wm_class, host;
        if (!(fields >> id >> desktop >> wm_class >> host)) continue;

        WindowInfo info;
        info.id = id;
        info.window_class = wm_class;
        std::getline(fields >> std::ws, info.title);
        windows.push_back(std::move(info));
    }
    return windows;
}
