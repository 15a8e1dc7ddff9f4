#include "server/socket.hpp"
#include "core/utils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rsproxy {

namespace {

timeval to_timeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

bool is_timeout_errno(int err) {
    return err == EAGAIN || err == EWOULDBLOCK;
}

} // namespace

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

Result<Socket> Socket::connect_tcp(const std::string& address, std::chrono::milliseconds timeout) {
    const auto host_port = utils::split_host_port(address);
    if (!host_port) {
        return Result<Socket>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Invalid backend address '{}'", address));
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const auto port_str = std::to_string(host_port->second);
    const int gai = ::getaddrinfo(host_port->first.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<Socket>::error(ErrorCategory::BACKEND_UNREACHABLE,
            std::format("Cannot resolve {}: {}", address, ::gai_strerror(gai)));
    }

    std::string last_error = "no addresses";
    for (const addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock.is_open()) {
            last_error = std::strerror(errno);
            continue;
        }

        // Non-blocking connect so the timeout is ours, then back to blocking
        const int flags = ::fcntl(sock.fd_, F_GETFL, 0);
        ::fcntl(sock.fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(sock.fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno == EINPROGRESS) {
            pollfd pfd{sock.fd_, POLLOUT, 0};
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (rc == 0) {
                last_error = "connect timed out";
                continue;
            }
            if (rc > 0) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                ::getsockopt(sock.fd_, SOL_SOCKET, SO_ERROR, &so_error, &len);
                if (so_error != 0) {
                    last_error = std::strerror(so_error);
                    continue;
                }
                rc = 0;
            } else {
                last_error = std::strerror(errno);
                continue;
            }
        } else if (rc < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        ::fcntl(sock.fd_, F_SETFL, flags);
        sock.set_nodelay();
        ::freeaddrinfo(res);
        return Result<Socket>::ok(std::move(sock));
    }

    ::freeaddrinfo(res);
    return Result<Socket>::error(ErrorCategory::BACKEND_UNREACHABLE,
        std::format("Cannot connect to {}: {}", address, last_error));
}

Result<Socket> Socket::listen_tcp(const std::string& host, uint16_t port, int backlog) {
    // Accept "[::1]" as well as "::1"
    std::string bind_host = host;
    if (bind_host.size() > 2 && bind_host.front() == '[' && bind_host.back() == ']') {
        bind_host = bind_host.substr(1, bind_host.size() - 2);
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    const auto port_str = std::to_string(port);
    const int gai = ::getaddrinfo(bind_host.empty() ? nullptr : bind_host.c_str(),
                                  port_str.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<Socket>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Invalid listen address {}: {}", host, ::gai_strerror(gai)));
    }

    std::string last_error = "no addresses";
    for (const addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock.is_open()) {
            last_error = std::format("socket() failed: {}", std::strerror(errno));
            continue;
        }

        int opt = 1;
        ::setsockopt(sock.fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        if (::bind(sock.fd_, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = std::format("bind() to {}:{} failed: {}", host, port, std::strerror(errno));
            continue;
        }
        if (::listen(sock.fd_, backlog) < 0) {
            ::freeaddrinfo(res);
            return Result<Socket>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("listen() failed: {}", std::strerror(errno)));
        }

        ::freeaddrinfo(res);
        return Result<Socket>::ok(std::move(sock));
    }

    ::freeaddrinfo(res);
    return Result<Socket>::error(ErrorCategory::CONFIGURATION_ERROR, last_error);
}

std::pair<Socket, Socket> Socket::pair() {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        return {Socket(), Socket()};
    }
    return {Socket(fds[0]), Socket(fds[1])};
}

Socket Socket::accept(std::string& remote_addr) const {
    sockaddr_storage client_addr{};
    socklen_t addr_len = sizeof(client_addr);
    const int client_fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&client_addr),
                                    &addr_len, SOCK_CLOEXEC);
    if (client_fd < 0) {
        return Socket();
    }

    char ip_str[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (client_addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&client_addr);
        ::inet_ntop(AF_INET, &in->sin_addr, ip_str, sizeof(ip_str));
        port = ntohs(in->sin_port);
    } else if (client_addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&client_addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, ip_str, sizeof(ip_str));
        port = ntohs(in6->sin6_port);
    }
    remote_addr = std::format("{}:{}", ip_str, port);

    Socket client(client_fd);
    client.set_nodelay();
    return client;
}

IoOutcome Socket::read_exact(void* buf, size_t len) {
    auto* ptr = static_cast<uint8_t*>(buf);
    size_t total = 0;
    while (total < len) {
        const ssize_t n = ::recv(fd_, ptr + total, len - total, 0);
        if (n > 0) {
            total += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            return {IoStatus::CLOSED, total};
        }
        if (errno == EINTR) continue;
        return {is_timeout_errno(errno) ? IoStatus::TIMED_OUT : IoStatus::FAILED, total};
    }
    return {IoStatus::OK, total};
}

IoOutcome Socket::write_all(const void* buf, size_t len) {
    const auto* ptr = static_cast<const uint8_t*>(buf);
    size_t total = 0;
    while (total < len) {
        const ssize_t n = ::send(fd_, ptr + total, len - total, MSG_NOSIGNAL);
        if (n > 0) {
            total += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && is_timeout_errno(errno)) {
            return {IoStatus::TIMED_OUT, total};
        }
        return {IoStatus::FAILED, total};
    }
    return {IoStatus::OK, total};
}

void Socket::set_receive_timeout(std::chrono::milliseconds timeout) {
    const auto tv = to_timeval(timeout);
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void Socket::set_send_timeout(std::chrono::milliseconds timeout) {
    const auto tv = to_timeval(timeout);
    ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void Socket::set_nodelay() {
    int opt = 1;
    // Fails harmlessly on AF_UNIX
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
}

bool Socket::has_pending_input() const {
    if (fd_ < 0) return true;
    pollfd pfd{fd_, POLLIN | POLLRDHUP, 0};
    const int rc = ::poll(&pfd, 1, 0);
    if (rc < 0) return true;
    return rc > 0 && (pfd.revents & (POLLIN | POLLRDHUP | POLLHUP | POLLERR)) != 0;
}

void Socket::shutdown() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void Socket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

uint16_t Socket::local_port() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

} // namespace rsproxy
