#pragma once
#include "clipshare_common.hpp"
#include "socket_guard.hpp"

#include <condition_variable>

// -------- LAN discovery beacon --------

// Binds UDP (broadcast-enabled) and TCP on one port. With requested == 0
// the UDP side picks the port and TCP follows it.
SyncError bind_advertised_port(uint16_t requested,
    SocketGuard& udp,
    SocketGuard& tcp,
    uint16_t& port);

// Sends the magic datagram every interval until a send fails or stop()
class BeaconBroadcaster {
public:
    BeaconBroadcaster() = default;
    ~BeaconBroadcaster();

    BeaconBroadcaster(const BeaconBroadcaster&) = delete;
    BeaconBroadcaster& operator=(const BeaconBroadcaster&) = delete;

    // dest_addr in host byte order; INADDR_BROADCAST on a real LAN
    void start(SocketGuard udp,
        uint16_t target_port,
        uint32_t dest_addr = INADDR_BROADCAST,
        int interval_ms = BEACON_INTERVAL_MS);
    void stop();

    bool running() const { return running_.load(); }
    uint64_t sent() const { return sent_.load(); }

private:
    void run(uint16_t target_port, uint32_t dest_addr, int interval_ms);

    SocketGuard sock_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{ false };
    std::atomic<uint64_t> sent_{ 0 };
};

// Waits on 0.0.0.0:port for one beacon and reports its sender
SyncError discover_server(uint16_t port, int timeout_ms, std::string& server_ip);
