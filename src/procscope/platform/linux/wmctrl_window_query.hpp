#pragma once

#include "platform/window_query.hpp"

#include <expected>
#include <string>

// X11 fallback: runs `wmctrl -lx` and parses its listing.
class WmctrlWindowQuery : public WindowQuery {
public:
    explicit WmctrlWindowQuery(std::string program = "wmctrl");

    std::string name() const override { return "wmctrl"; }
    std::optional<std::vector<WindowInfo>> list_windows() override;

private:
    // Resolve program against $PATH; empty if not installed.
    std::string find_program() const;
    std::expected<std::string, std::string> run(const std::string& path) const;

    std::string program_;
};
