#pragma once

#include "platform/window_query.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

class SwayWindowQuery : public WindowQuery {
public:
    // Empty socket path means $SWAYSOCK, then $I3SOCK.
    explicit SwayWindowQuery(std::string socket_path = {});
    ~SwayWindowQuery() override;

    SwayWindowQuery(const SwayWindowQuery&) = delete;
    SwayWindowQuery& operator=(const SwayWindowQuery&) = delete;

    std::string name() const override { return "sway"; }
    std::optional<std::vector<WindowInfo>> list_windows() override;

private:
    // i3-ipc binary protocol
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_GET_TREE = 4;

    static constexpr size_t HEADER_SIZE = 14; // magic + length + type

    bool connect();
    void disconnect();

    // One round trip on the connected socket. Returns the reply payload if
    // the reply carries the same message type, nullopt otherwise.
    std::optional<std::string> request(uint32_t type, const std::string& payload = "");

    bool write_all(const char* data, size_t len);
    bool read_exact(char* data, size_t len);

    std::string socket_path_;
    int fd_ = -1;
};
