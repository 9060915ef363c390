#pragma once
#include "clipshare_common.hpp"
#include "socket_guard.hpp"

// -------- TCP / UDP setup --------

// Binds 0.0.0.0:port (0 = OS-chosen) and listens
SyncError bind_tcp_listener(uint16_t port, SocketGuard& out, uint16_t& bound_port);

SyncError bind_udp_socket(uint16_t port, bool broadcast, SocketGuard& out, uint16_t& bound_port);

// EINTR and aborted handshakes come back as Io; the caller keeps accepting
SyncError accept_connection(int listen_fd, SocketGuard& out, std::string& peer_ip,
    int* accept_errno = nullptr);

// Pause before the next accept; non-zero only when out of fds or memory
int accept_backoff_ms(int accept_errno);

SyncError connect_tcp(const std::string& host, uint16_t port, SocketGuard& out);

// "host:port", "[v6addr]:port"
bool split_host_port(const std::string& addr, std::string& host, uint16_t& port);

bool local_port(int fd, uint16_t& port);

std::string format_ipv4(const sockaddr_in& sin);
