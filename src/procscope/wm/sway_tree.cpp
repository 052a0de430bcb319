#include "sway_tree.hpp"

#include <cstdint>
#include <string>

namespace {

// Sway sends null for app_id on Xwayland windows, so value() can't be used.
std::string string_field(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool has_children(const nlohmann::json& node) {
    for (const char* key : {"nodes", "floating_nodes"}) {
        auto it = node.find(key);
        if (it != node.end() && it->is_array() && !it->empty()) return true;
    }
    return false;
}

bool is_window(const nlohmann::json& node) {
    auto type = string_field(node, "type");
    if (type != "con" && type != "floating_con") return false;
    if (has_children(node)) return false;

    // Wayland clients carry an app_id, X11 clients (i3, Xwayland) a window id.
    auto app_id = node.find("app_id");
    if (app_id != node.end() && app_id->is_string()) return true;
    auto window = node.find("window");
    return window != node.end() && window->is_number_integer();
}

void walk(const nlohmann::json& node, std::vector<WindowInfo>& out) {
    if (is_window(node)) {
        WindowInfo info;
        if (auto id = node.find("id"); id != node.end() && id->is_number_integer())
            info.id = std::to_string(id->get<int64_t>());
        info.app_id = string_field(node, "app_id");
        info.title = string_field(node, "name");
        if (auto props = node.find("window_properties"); props != node.end() && props->is_object())
            info.window_class = string_field(*props, "class");
        if (auto pid = node.find("pid"); pid != node.end() && pid->is_number_integer())
            info.pid = pid->get<int>();
        if (!info.empty()) out.push_back(std::move(info));
        return;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        auto it = node.find(key);
        if (it == node.end() || !it->is_array()) continue;
        for (const auto& child : *it) walk(child, out);
    }
}

} // namespace

std::vector<WindowInfo> collect_windows(const nlohmann::json& tree) {
    std::vector<WindowInfo> windows;
    walk(tree, windows);
    return windows;
}
