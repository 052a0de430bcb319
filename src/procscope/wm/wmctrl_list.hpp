#pragma once

#include "window_info.hpp"

#include <string_view>
#include <vector>

// Parse `wmctrl -lx` output: one window per line,
//   <id> <desktop> <instance.class> <host> <title...>
// Lines with fewer than four fields are skipped.
std::vector<WindowInfo> parse_wmctrl_list(std::string_view output);
