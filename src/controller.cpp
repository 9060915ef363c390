#include "controller.hpp"
#include "discovery.hpp"
#include "handshake.hpp"
#include "logging.hpp"
#include "net.hpp"
#include "util.hpp"

#include <system_error>

PumpResult serve_connection(SocketStream& stream,
    const std::shared_ptr<ClipboardAdapter>& adapter,
    const SecureBuffer* key)
{
    if (key) {
        SyncError err = accept_handshake(stream, *key);
        if (err != SyncError::None) {
            PumpResult r;
            r.error = err;
            r.ended_by = "handshake";
            stream.shutdown_both();
            return r;
        }
    }
    std::fprintf(stderr, "Clipboards connected\n");
    return run_pump(stream, adapter);
}

PumpResult client_connection(SocketStream& stream,
    const std::shared_ptr<ClipboardAdapter>& adapter,
    const SecureBuffer* key)
{
    if (key) {
        SyncError err = send_handshake(stream.writer(), *key);
        if (err != SyncError::None) {
            PumpResult r;
            r.error = err;
            r.ended_by = "handshake";
            stream.shutdown_both();
            return r;
        }
        audit_log_level(LogLevel::TRACE, "Key sent", "handshake", "notify");
    }
    return run_pump(stream, adapter);
}

bool looks_rejected(const PumpResult& r, std::chrono::milliseconds elapsed) {
    if (r.frames_received > 0) return false;
    if (r.error != SyncError::ConnectionClosed && r.error != SyncError::Io) return false;
    return elapsed.count() < HANDSHAKE_TIMEOUT_MS;
}


// ---------------- Server ----------------
static void server_session(SocketGuard sock,
    std::string peer_ip,
    std::shared_ptr<ClipboardAdapter> adapter,
    std::shared_ptr<const SecureBuffer> key,
    LogContext parent)
{
    g_log_ctx = parent;
    g_log_ctx.ip = peer_ip;
    g_log_ctx.sessionId = generate_session_id();

    audit_log_level(LogLevel::INFO,
        "Connection from " + peer_ip,
        "session",
        "notify");

    SocketStream stream(std::move(sock));
    PumpResult r = serve_connection(stream, adapter, key.get());

    if (std::string(r.ended_by) == "handshake") {
        audit_log_level(r.error == SyncError::AuthFailed ? LogLevel::WARN : LogLevel::DEBUG,
            std::string("Rejected ") + peer_ip + ": " + sync_error_str(r.error),
            "session",
            "failure");
        return;
    }

    audit_log_level(LogLevel::DEBUG,
        std::string("Server error: ") + sync_error_str(r.error),
        "session",
        "notify");
    audit_log_level(LogLevel::INFO,
        "Finishing server connection",
        "session",
        "success");
    std::fprintf(stderr, "Clipboard closed\n");
}

int run_server(const Config& cfg,
    std::shared_ptr<ClipboardAdapter> adapter,
    std::shared_ptr<const SecureBuffer> key)
{
    SocketGuard listener;
    uint16_t port = 0;
    BeaconBroadcaster beacon;

    if (cfg.beacon) {
        SocketGuard udp;
        if (bind_advertised_port(cfg.port, udp, listener, port) != SyncError::None) {
            std::fprintf(stderr, "Cannot listen on port %u\n", static_cast<unsigned>(cfg.port));
            return 1;
        }
        beacon.start(std::move(udp), port);
        std::fprintf(stderr, "Run `clipshare %u` on another machine of your network\n",
            static_cast<unsigned>(port));
    }
    else {
        if (bind_tcp_listener(cfg.port, listener, port) != SyncError::None) {
            std::fprintf(stderr, "Cannot listen on port %u\n", static_cast<unsigned>(cfg.port));
            return 1;
        }
        std::fprintf(stderr, "Run `clipshare ip:%u` on another machine of your network\n",
            static_cast<unsigned>(port));
    }

    audit_log_level(LogLevel::INFO,
        "Listening on port " + std::to_string(port) +
        (cfg.auth ? "" : " without authentication"),
        "server",
        "notify");

    std::shared_ptr<const SecureBuffer> session_key = cfg.auth ? key : nullptr;
    for (;;) {
        SocketGuard conn;
        std::string peer_ip;
        int accept_errno = 0;
        if (accept_connection(listener.get(), conn, peer_ip, &accept_errno) != SyncError::None) {
            int wait_ms = accept_backoff_ms(accept_errno);
            if (wait_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
            }
            continue; // logged at debug
        }
        audit_log_level(LogLevel::TRACE, "New connection arrived", "server", "notify");

        try {
            std::thread(server_session, std::move(conn), peer_ip, adapter, session_key, g_log_ctx).detach();
        }
        catch (const std::system_error& e) {
            audit_log_level(LogLevel::ERROR,
                std::string("Cannot start session thread: ") + e.what(),
                "server",
                "failure");
        }
    }
}


// ---------------- Client ----------------
int run_client(const Config& cfg,
    std::shared_ptr<ClipboardAdapter> adapter,
    const SecureBuffer& key)
{
    audit_log_level(LogLevel::INFO, "starting client", "client", "notify");

    std::string host;
    uint16_t port = 0;
    if (cfg.discovery) {
        port = cfg.discovery_port;
        SyncError err = discover_server(port, DISCOVERY_TIMEOUT_MS, host);
        if (err == SyncError::Timeout) {
            std::fprintf(stderr, "Clipboard %u not found\n", static_cast<unsigned>(port));
            return 1;
        }
        if (err != SyncError::None) {
            std::fprintf(stderr, "Clipboard %u: %s\n", static_cast<unsigned>(port), sync_error_str(err));
            return 1;
        }
    }
    else if (!split_host_port(cfg.url, host, port)) {
        std::fprintf(stderr, "Invalid address %s\n", cfg.url.c_str());
        return 2;
    }

    audit_log_level(LogLevel::TRACE,
        "Begin client connection to " + host + ":" + std::to_string(port),
        "client",
        "notify");

    SocketGuard sock;
    if (connect_tcp(host, port, sock) != SyncError::None) {
        std::fprintf(stderr, "Cannot connect to %s:%u\n", host.c_str(), static_cast<unsigned>(port));
        return 1;
    }

    SocketStream stream(std::move(sock));
    g_log_ctx.ip = stream.peer_ip();
    std::fprintf(stderr, "Clipboards connected\n");

    auto started = std::chrono::steady_clock::now();
    PumpResult r = client_connection(stream, adapter, cfg.auth ? &key : nullptr);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    audit_log_level(LogLevel::DEBUG,
        std::string("Client error: ") + sync_error_str(r.error),
        "client",
        "notify");
    audit_log_level(LogLevel::TRACE, "Finish client connection", "client", "notify");
    std::fprintf(stderr, "Clipboard closed\n");

    if (std::string(r.ended_by) == "handshake") {
        return 1;
    }
    if (cfg.auth && looks_rejected(r, elapsed)) {
        std::fprintf(stderr, "Connection rejected by server (wrong key?)\n");
        return 1;
    }
    return 0;
}
