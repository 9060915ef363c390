#include "stream.hpp"
#include "logging.hpp"
#include "util.hpp"


// ---------------- SocketReader ----------------
SyncError SocketReader::read_exact(byte* buf, size_t len) {
    size_t got = 0;
    while (got < len) {
        ssize_t r = recv(stream_.fd(), buf + got, len - got, 0);
        if (r > 0) {
            got += static_cast<size_t>(r);
            continue;
        }
        if (r == 0) {
            return got == 0 ? SyncError::ConnectionClosed : SyncError::Truncated;
        }
        if (errno == EINTR) continue;
        audit_log_level(LogLevel::DEBUG,
            "recv failed: " + errno_str(errno),
            "stream",
            "failure");
        return SyncError::Io;
    }
    return SyncError::None;
}


// ---------------- SocketWriter ----------------
SyncError SocketWriter::write_all(const byte* buf, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w = send(stream_.fd(), buf + sent, len - sent, MSG_NOSIGNAL);
        if (w > 0) {
            sent += static_cast<size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) continue;
        audit_log_level(LogLevel::DEBUG,
            "send failed: " + errno_str(errno),
            "stream",
            "failure");
        return SyncError::Io;
    }
    return SyncError::None;
}


// ---------------- SocketStream ----------------
SocketStream::SocketStream(SocketGuard sock)
    : sock_(std::move(sock)),
      reader_(*this),
      writer_(*this)
{
}

void SocketStream::shutdown_write() {
    shutdown(sock_.get(), SHUT_WR);
}

void SocketStream::shutdown_both() {
    shutdown(sock_.get(), SHUT_RDWR);
}

std::string SocketStream::peer_ip() const {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (getpeername(sock_.get(), reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
        return "unknown";
    }
    char buf[INET6_ADDRSTRLEN] = { 0 };
    if (ss.ss_family == AF_INET) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    }
    else if (ss.ss_family == AF_INET6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
    }
    else {
        return "unknown";
    }
    return std::string(buf);
}
