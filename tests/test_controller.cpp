#include <catch2/catch.hpp>

#include "controller.hpp"
#include "net.hpp"
#include "test_support.hpp"

#include <future>

static constexpr int FAST_POLL_MS = 10;

// Points fd 2 at a temp file for the lifetime of the object
class StderrCapture {
public:
    StderrCapture() {
        std::fflush(stderr);
        file_ = std::tmpfile();
        REQUIRE(file_ != nullptr);
        saved_ = dup(STDERR_FILENO);
        REQUIRE(saved_ >= 0);
        REQUIRE(dup2(fileno(file_), STDERR_FILENO) >= 0);
    }

    ~StderrCapture() {
        restore();
        if (file_) std::fclose(file_);
    }

    std::string text() {
        restore();
        std::string out;
        std::rewind(file_);
        char buf[512];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) {
            out.append(buf, n);
        }
        return out;
    }

private:
    void restore() {
        if (saved_ < 0) return;
        std::fflush(stderr);
        dup2(saved_, STDERR_FILENO);
        close(saved_);
        saved_ = -1;
    }

    FILE* file_ = nullptr;
    int saved_ = -1;
};

static std::shared_ptr<ClipboardAdapter> cleared_adapter(std::shared_ptr<MemoryClipboard>& clip) {
    clip = std::make_shared<MemoryClipboard>();
    return ClipboardAdapter::cleared(clip, FAST_POLL_MS);
}

// a TCP port nobody listens on
static uint16_t closed_tcp_port() {
    SocketGuard s;
    uint16_t port = 0;
    REQUIRE(bind_tcp_listener(0, s, port) == SyncError::None);
    return port;
}

static Config client_config(const std::string& url) {
    Config cfg;
    cfg.url = url;
    return cfg;
}

TEST_CASE("Client exits 1 when discovery finds nothing", "[controller]") {
    SocketGuard udp;
    uint16_t port = 0;
    REQUIRE(bind_udp_socket(0, false, udp, port) == SyncError::None);
    udp.reset();

    Config cfg;
    cfg.discovery = true;
    cfg.discovery_port = port;

    std::shared_ptr<MemoryClipboard> clip;
    auto adapter = cleared_adapter(clip);
    SecureBuffer key = SecureBuffer::from_string(DEFAULT_KEY);

    StderrCapture err;
    auto start = std::chrono::steady_clock::now();
    int rc = run_client(cfg, adapter, key);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(rc == 1);
    REQUIRE(elapsed >= std::chrono::milliseconds(DISCOVERY_TIMEOUT_MS - 100));
    REQUIRE(elapsed < std::chrono::milliseconds(DISCOVERY_TIMEOUT_MS + 2000));
    REQUIRE(err.text().find("Clipboard " + std::to_string(port) + " not found") != std::string::npos);
}

TEST_CASE("Client exits 1 when the connection is refused", "[controller]") {
    uint16_t port = closed_tcp_port();

    std::shared_ptr<MemoryClipboard> clip;
    auto adapter = cleared_adapter(clip);
    SecureBuffer key = SecureBuffer::from_string(DEFAULT_KEY);

    StderrCapture err;
    REQUIRE(run_client(client_config("127.0.0.1:" + std::to_string(port)), adapter, key) == 1);
    REQUIRE(err.text().find("Cannot connect") != std::string::npos);
}

TEST_CASE("Client exits 1 when the server rejects its key", "[controller]") {
    SocketGuard listener;
    uint16_t port = 0;
    REQUIRE(bind_tcp_listener(0, listener, port) == SyncError::None);

    std::shared_ptr<MemoryClipboard> server_clip, client_clip;
    auto server_adapter = cleared_adapter(server_clip);
    auto client_adapter = cleared_adapter(client_clip);
    SecureBuffer server_key = SecureBuffer::from_string("s3cret");
    SecureBuffer client_key = SecureBuffer::from_string("wrong");

    auto server_run = std::async(std::launch::async, [&] {
        SocketGuard conn;
        std::string peer_ip;
        if (accept_connection(listener.get(), conn, peer_ip) != SyncError::None) {
            PumpResult failed;
            failed.error = SyncError::Io;
            return failed;
        }
        SocketStream stream(std::move(conn));
        return serve_connection(stream, server_adapter, &server_key);
        });

    StderrCapture err;
    int rc = run_client(client_config("127.0.0.1:" + std::to_string(port)), client_adapter, client_key);
    std::string out = err.text();

    PumpResult sr = server_run.get();
    REQUIRE(sr.error == SyncError::AuthFailed);
    REQUIRE(rc == 1);
    REQUIRE(out.find("Clipboard closed") != std::string::npos);
    REQUIRE(client_clip->text().empty());
}

TEST_CASE("Client exits 0 after a session that carried a frame", "[controller]") {
    SocketGuard listener;
    uint16_t port = 0;
    REQUIRE(bind_tcp_listener(0, listener, port) == SyncError::None);

    std::shared_ptr<MemoryClipboard> server_clip, client_clip;
    auto server_adapter = cleared_adapter(server_clip);
    auto client_adapter = cleared_adapter(client_clip);
    SecureBuffer key = SecureBuffer::from_string("s3cret");

    auto client_run = std::async(std::launch::async, [&] {
        return run_client(client_config("127.0.0.1:" + std::to_string(port)), client_adapter, key);
        });

    SocketGuard conn;
    std::string peer_ip;
    REQUIRE(accept_connection(listener.get(), conn, peer_ip) == SyncError::None);
    SocketStream stream(std::move(conn));
    auto server_run = std::async(std::launch::async, [&] {
        return serve_connection(stream, server_adapter, &key);
        });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    server_clip->set_text("hi");
    REQUIRE(wait_until([&] { return client_clip->text() == "hi"; }, 2000));

    stream.shutdown_both();
    REQUIRE(client_run.get() == 0);
    REQUIRE(server_run.get().frames_sent == 1);
}
