#include "net/port_allocator.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace taskwarden::net {

using core::errors::ErrorCategory;
using core::errors::TaskError;

namespace {

TaskError port_error(const std::string& what) {
    return TaskError{ErrorCategory::Startup,
                     "Failed to allocate server port: " + what + " (" +
                         std::strerror(errno) + ")",
                     "port_allocation_failed"};
}

}  // namespace

LoopbackPortAllocator::LoopbackPortAllocator(std::string host)
    : host_(std::move(host)) {}

core::errors::Result<std::uint16_t> LoopbackPortAllocator::allocate() {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        return TaskError{ErrorCategory::Input, "Invalid loopback host: " + host_,
                         "port_allocation_failed"};
    }

    const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return port_error("socket");
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        listen(fd, 1) != 0) {
        const auto err = port_error("bind/listen");
        static_cast<void>(close(fd));
        return err;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        const auto err = port_error("getsockname");
        static_cast<void>(close(fd));
        return err;
    }

    const std::uint16_t port = ntohs(bound.sin_port);
    if (close(fd) != 0) {
        return port_error("close");
    }
    if (port == 0) {
        return TaskError{ErrorCategory::Startup,
                         "Failed to allocate server port: kernel returned port 0",
                         "port_allocation_failed"};
    }
    return port;
}

}  // namespace taskwarden::net
