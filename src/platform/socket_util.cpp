#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <core/constants.hpp>
#include <fmt/format.h>

namespace platform {

int connect_unix(const std::string& path) {
    struct sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        errno = ENAMETOOLONG;
        return -1;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    int rc;
    do {
        rc = connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        int err = errno;
        close(fd);
        errno = err;
        return -1;
    }
    return fd;
}

bool write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(w);
    }
    return true;
}

Result<std::string> read_line(int fd, size_t max_bytes) {
    std::string line;
    char buf[CONTROL_READ_BUF_SIZE];

    while (line.size() < max_bytes) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<std::string>::Err(fmt::format("read failed: {}", std::strerror(errno)));
        }
        if (n == 0) {
            if (line.empty()) return Result<std::string>::Err("connection closed before a response");
            return Result<std::string>::Ok(line);
        }
        line.append(buf, static_cast<size_t>(n));
        auto nl = line.find('\n');
        if (nl != std::string::npos) {
            line.resize(nl);
            return Result<std::string>::Ok(line);
        }
    }
    return Result<std::string>::Err(fmt::format("response exceeds {} bytes", max_bytes));
}

void close_socket(int fd) {
    if (fd >= 0) close(fd);
}

} // namespace platform
