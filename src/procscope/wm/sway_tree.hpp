#pragma once

#include "window_info.hpp"

#include <nlohmann/json.hpp>
#include <vector>

// Collect every leaf window of a sway/i3 GET_TREE reply, tiled, floating
// and scratchpad alike, in tree order.
std::vector<WindowInfo> collect_windows(const nlohmann::json& tree);
