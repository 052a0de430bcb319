#include "platform/linux/wmctrl_window_query.hpp"

#include "wm/wmctrl_list.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

WmctrlWindowQuery::WmctrlWindowQuery(std::string program)
    : program_(std::move(program)) {}

std::optional<std::vector<WindowInfo>> WmctrlWindowQuery::list_windows() {
    auto path = find_program();
    if (path.empty()) return std::nullopt;

    auto output = run(path);
    if (!output) {
        std::println(stderr, "wmctrl: {}", output.error());
        return std::nullopt;
    }
    return parse_wmctrl_list(*output);
}

std::string WmctrlWindowQuery::find_program() const {
    if (program_.find('/') != std::string::npos) {
        return ::access(program_.c_str(), X_OK) == 0 ? program_ : std::string{};
    }

    const char* path = std::getenv("PATH");
    if (!path) return {};

    std::string_view dirs(path);
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        if (!dir.empty()) {
            std::string candidate = std::string(dir) + "/" + program_;
            if (::access(candidate.c_str(), X_OK) == 0) return candidate;
        }
        if (sep == std::string_view::npos) break;
        dirs.remove_prefix(sep + 1);
    }
    return {};
}

std::expected<std::string, std::string> WmctrlWindowQuery::run(const std::string& path) const {
    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout to pipe, stderr silenced ("Cannot open display.")
        ::dup2(pipefd[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
        ::execl(path.c_str(), program_.c_str(), "-lx", nullptr);
        ::_exit(127);
    }

    // Parent: drain the listing
    ::close(pipefd[1]);
    std::string output;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(pipefd[0]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(std::string("read() failed: ") + std::strerror(errno));
        }
        if (n == 0) break;
        output.append(buf, static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (!WIFEXITED(status)) {
        return std::unexpected(std::string("terminated by signal"));
    }
    if (WEXITSTATUS(status) != 0) {
        return std::unexpected("exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    return output;
}
