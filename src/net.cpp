#include "net.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <netdb.h>

static constexpr int LISTEN_BACKLOG = 16;

bool local_port(int fd, uint16_t& port) {
    sockaddr_in sin{};
    socklen_t len = sizeof(sin);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&sin), &len) != 0) {
        return false;
    }
    port = ntohs(sin.sin_port);
    return true;
}

std::string format_ipv4(const sockaddr_in& sin) {
    char buf[INET_ADDRSTRLEN] = { 0 };
    if (!inet_ntop(AF_INET, &sin.sin_addr, buf, sizeof(buf))) {
        return "unknown";
    }
    return std::string(buf);
}

SyncError bind_tcp_listener(uint16_t port, SocketGuard& out, uint16_t& bound_port) {
    SocketGuard sock(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        audit_log_level(LogLevel::ERROR,
            "TCP socket creation failed: " + errno_str(errno),
            "net",
            "failure");
        return SyncError::Io;
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        audit_log_level(LogLevel::DEBUG,
            "setsockopt(SO_REUSEADDR) failed: " + errno_str(errno),
            "net",
            "failure");
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_ANY);
    address.sin_port = htons(port);

    if (bind(sock.get(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        audit_log_level(LogLevel::DEBUG,
            "TCP bind on port " + std::to_string(port) + " failed: " + errno_str(errno),
            "net",
            "failure");
        return SyncError::Io;
    }
    if (listen(sock.get(), LISTEN_BACKLOG) < 0) {
        audit_log_level(LogLevel::ERROR,
            "listen failed: " + errno_str(errno),
            "net",
            "failure");
        return SyncError::Io;
    }
    if (!local_port(sock.get(), bound_port)) {
        return SyncError::Io;
    }

    out = std::move(sock);
    return SyncError::None;
}

SyncError bind_udp_socket(uint16_t port, bool broadcast, SocketGuard& out, uint16_t& bound_port) {
    SocketGuard sock(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        audit_log_level(LogLevel::ERROR,
            "UDP socket creation failed: " + errno_str(errno),
            "net",
            "failure");
        return SyncError::Io;
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        audit_log_level(LogLevel::DEBUG,
            "setsockopt(SO_REUSEADDR) failed: " + errno_str(errno),
            "net",
            "failure");
    }
    if (broadcast &&
        setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt)) != 0) {
        audit_log_level(LogLevel::ERROR,
            "setsockopt(SO_BROADCAST) failed: " + errno_str(errno),
            "net",
            "failure");
        return SyncError::Io;
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_ANY);
    address.sin_port = htons(port);

    if (bind(sock.get(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        audit_log_level(LogLevel::DEBUG,
            "UDP bind on port " + std::to_string(port) + " failed: " + errno_str(errno),
            "net",
            "failure");
        return SyncError::Io;
    }
    if (!local_port(sock.get(), bound_port)) {
        return SyncError::Io;
    }

    out = std::move(sock);
    return SyncError::None;
}

SyncError accept_connection(int listen_fd, SocketGuard& out, std::string& peer_ip, int* accept_errno) {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    int fd = accept4(listen_fd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (accept_errno) *accept_errno = err;
        audit_log_level(LogLevel::DEBUG,
            "accept failed: " + errno_str(err),
            "net",
            "failure");
        return SyncError::Io;
    }
    out.reset(fd);
    peer_ip = format_ipv4(peer);
    return SyncError::None;
}

int accept_backoff_ms(int accept_errno) {
    switch (accept_errno) {
    case EMFILE:
    case ENFILE:
    case ENOBUFS:
    case ENOMEM:
        return ACCEPT_BACKOFF_MS;
    default:
        return 0;
    }
}

SyncError connect_tcp(const std::string& host, uint16_t port, SocketGuard& out) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        audit_log_level(LogLevel::ERROR,
            "Cannot resolve " + host + ": " + gai_strerror(rc),
            "net",
            "failure");
        return SyncError::Io;
    }

    int last_errno = 0;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        SocketGuard sock(socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock.valid()) {
            last_errno = errno;
            continue;
        }
        if (connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
            freeaddrinfo(res);
            out = std::move(sock);
            return SyncError::None;
        }
        last_errno = errno;
    }
    freeaddrinfo(res);

    audit_log_level(LogLevel::ERROR,
        "Cannot connect to " + host + ":" + std::to_string(port) + ": " + errno_str(last_errno),
        "net",
        "failure");
    return SyncError::Io;
}

bool split_host_port(const std::string& addr, std::string& host, uint16_t& port) {
    std::string h;
    std::string p;
    if (!addr.empty() && addr[0] == '[') {
        size_t close = addr.find(']');
        if (close == std::string::npos || close + 1 >= addr.size() || addr[close + 1] != ':') {
            return false;
        }
        h = addr.substr(1, close - 1);
        p = addr.substr(close + 2);
    }
    else {
        size_t colon = addr.rfind(':');
        if (colon == std::string::npos) return false;
        h = addr.substr(0, colon);
        p = addr.substr(colon + 1);
        if (h.find(':') != std::string::npos) return false; // bare v6 needs brackets
    }
    if (h.empty() || !parse_port(p, port) || port == 0) return false;
    host = h;
    return true;
}
