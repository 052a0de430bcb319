#include "platform/linux/sway_window_query.hpp"

#include "wm/sway_tree.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <nlohmann/json.hpp>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayWindowQuery::SwayWindowQuery(std::string socket_path)
    : socket_path_(std::move(socket_path)) {
    if (socket_path_.empty()) {
        if (const char* sock = std::getenv("SWAYSOCK")) {
            socket_path_ = sock;
        } else if (const char* sock = std::getenv("I3SOCK")) {
            socket_path_ = sock;
        }
    }
}

SwayWindowQuery::~SwayWindowQuery() {
    disconnect();
}

std::optional<std::vector<WindowInfo>> SwayWindowQuery::list_windows() {
    if (socket_path_.empty()) return std::nullopt;
    if (!connect()) return std::nullopt;

    auto payload = request(MSG_GET_TREE);
    disconnect();

    if (!payload) {
        std::println(stderr, "sway: no GET_TREE reply");
        return std::nullopt;
    }

    try {
        return collect_windows(nlohmann::json::parse(*payload));
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "sway: bad tree: {}", e.what());
        return std::nullopt;
    }
}

bool SwayWindowQuery::connect() {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return false;
    }
    fd_ = fd;
    return true;
}

void SwayWindowQuery::disconnect() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

std::optional<std::string> SwayWindowQuery::request(uint32_t type, const std::string& payload) {
    char header[HEADER_SIZE];
    uint32_t len = static_cast<uint32_t>(payload.size());
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (!write_all(header, HEADER_SIZE) || !write_all(payload.data(), payload.size()))
        return std::nullopt;

    if (!read_exact(header, HEADER_SIZE)) return std::nullopt;
    if (std::memcmp(header, MAGIC, 6) != 0) return std::nullopt;

    uint32_t reply_type;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&reply_type, header + 10, 4);
    if (reply_type != type) return std::nullopt;

    std::string reply(len, '\0');
    if (!read_exact(reply.data(), len)) return std::nullopt;
    return reply;
}

bool SwayWindowQuery::write_all(const char* data, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::send(fd_, data + done, len - done, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        done += static_cast<size_t>(n);
    }
    return true;
}

bool SwayWindowQuery::read_exact(char* data, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::recv(fd_, data + done, len - done, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        done += static_cast<size_t>(n);
    }
    return true;
}
