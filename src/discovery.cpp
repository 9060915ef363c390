#include "discovery.hpp"
#include "net.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <poll.h>

// an OS-chosen UDP port may already be taken on the TCP side
static constexpr int MAX_BIND_ATTEMPTS = 8;

SyncError bind_advertised_port(uint16_t requested,
    SocketGuard& udp,
    SocketGuard& tcp,
    uint16_t& port)
{
    int attempts = (requested == 0) ? MAX_BIND_ATTEMPTS : 1;
    for (int i = 0; i < attempts; ++i) {
        SocketGuard u;
        uint16_t udp_port = 0;
        SyncError err = bind_udp_socket(requested, true, u, udp_port);
        if (err != SyncError::None) return err;

        SocketGuard t;
        uint16_t tcp_port = 0;
        err = bind_tcp_listener(udp_port, t, tcp_port);
        if (err == SyncError::None) {
            udp = std::move(u);
            tcp = std::move(t);
            port = udp_port;
            return SyncError::None;
        }
        audit_log_level(LogLevel::DEBUG,
            "TCP port " + std::to_string(udp_port) + " busy, retrying",
            "discovery",
            "failure");
    }

    audit_log_level(LogLevel::ERROR,
        "Could not bind UDP and TCP on a common port",
        "discovery",
        "failure");
    return SyncError::Io;
}


// ---------------- Broadcaster ----------------
BeaconBroadcaster::~BeaconBroadcaster() {
    stop();
}

void BeaconBroadcaster::start(SocketGuard udp, uint16_t target_port, uint32_t dest_addr, int interval_ms) {
    stop();
    sock_ = std::move(udp);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    LogContext ctx = g_log_ctx;
    thread_ = std::thread([this, ctx, target_port, dest_addr, interval_ms] {
        g_log_ctx = ctx;
        g_log_ctx.role = "beacon";
        run(target_port, dest_addr, interval_ms);
        });
}

void BeaconBroadcaster::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void BeaconBroadcaster::run(uint16_t target_port, uint32_t dest_addr, int interval_ms) {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(target_port);
    dest.sin_addr.s_addr = htonl(dest_addr);

    audit_log_level(LogLevel::DEBUG,
        "Beacon started on port " + std::to_string(target_port),
        "discovery",
        "notify");

    for (;;) {
        ssize_t n = sendto(sock_.get(), BEACON_MAGIC, BEACON_MAGIC_LEN, 0,
            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
        if (n <= 0) {
            audit_log_level(LogLevel::DEBUG,
                n == 0 ? std::string("Beacon send wrote nothing")
                       : "Beacon send failed: " + errno_str(errno),
                "discovery",
                "failure");
            break;
        }
        ++sent_;
        audit_log_level(LogLevel::TRACE, "Beacon sent", "discovery", "success");

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, std::chrono::milliseconds(interval_ms),
            [this] { return stop_requested_; })) {
            break;
        }
    }

    running_ = false;
}


// ---------------- Receiver ----------------
SyncError discover_server(uint16_t port, int timeout_ms, std::string& server_ip) {
    SocketGuard sock;
    uint16_t bound = 0;
    SyncError err = bind_udp_socket(port, false, sock, bound);
    if (err != SyncError::None) return err;

    audit_log_level(LogLevel::DEBUG,
        "Waiting for beacon on port " + std::to_string(port),
        "discovery",
        "notify");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return SyncError::Timeout;

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int pr = poll(&pfd, 1, static_cast<int>(left));
        if (pr < 0) {
            if (errno == EINTR) continue;
            audit_log_level(LogLevel::ERROR,
                "poll failed: " + errno_str(errno),
                "discovery",
                "failure");
            return SyncError::Io;
        }
        if (pr == 0) return SyncError::Timeout;

        char buf[64];
        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        ssize_t r = recvfrom(sock.get(), buf, sizeof(buf), 0,
            reinterpret_cast<sockaddr*>(&from), &from_len);
        if (r < 0) {
            if (errno == EINTR) continue;
            audit_log_level(LogLevel::ERROR,
                "recvfrom failed: " + errno_str(errno),
                "discovery",
                "failure");
            return SyncError::Io;
        }

        std::string sender = format_ipv4(from);
        if (static_cast<size_t>(r) != BEACON_MAGIC_LEN ||
            std::memcmp(buf, BEACON_MAGIC, BEACON_MAGIC_LEN) != 0) {
            audit_log_level(LogLevel::WARN,
                "Unexpected datagram from " + sender,
                "discovery",
                "failure");
            return SyncError::BadBeacon;
        }

        server_ip = sender;
        audit_log_level(LogLevel::DEBUG,
            "Beacon received from " + sender,
            "discovery",
            "success");
        return SyncError::None;
    }
}
