#include "handshake.hpp"
#include "frame.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <poll.h>

SyncError send_handshake(ByteSink& sink, const SecureBuffer& key) {
    if (key.size() > MAX_KEY_LEN) {
        audit_log_level(LogLevel::ERROR,
            "send_handshake: key longer than " + std::to_string(MAX_KEY_LEN) + " bytes",
            "handshake",
            "failure");
        return SyncError::ConfigError;
    }

    std::vector<byte> buf = encode_frame(HANDSHAKE_TAG, key.data(), key.size());
    SyncError err = sink.write_all(buf.data(), buf.size());
    sodium_memzero(buf.data(), buf.size());
    if (err != SyncError::None) return err;
    return sink.flush();
}

SyncError verify_handshake(ByteSource& source, const SecureBuffer& key) {
    byte kind = 0xFF;
    SyncError err = source.read_exact(&kind, 1);
    if (err == SyncError::ConnectionClosed) return SyncError::Truncated;
    if (err != SyncError::None) return err;

    audit_log_level(LogLevel::TRACE,
        "Read handshake kind " + std::to_string(static_cast<int>(kind)),
        "handshake",
        "notify");
    if (kind != HANDSHAKE_TAG) {
        audit_log_level(LogLevel::WARN,
            "Handshake rejected: first byte is not a key frame",
            "handshake",
            "failure");
        return SyncError::BadHandshake;
    }

    byte lenbuf[8];
    err = source.read_exact(lenbuf, sizeof(lenbuf));
    if (err == SyncError::ConnectionClosed) return SyncError::Truncated;
    if (err != SyncError::None) return err;

    uint64_t len = get_u64_be(lenbuf);
    if (len > MAX_KEY_LEN) {
        audit_log_level(LogLevel::WARN,
            "Handshake rejected: key length " + std::to_string(len) + " over limit",
            "handshake",
            "failure");
        return SyncError::BadHandshake;
    }

    SecureBuffer client_key(static_cast<size_t>(len));
    if (len > 0) {
        err = source.read_exact(client_key.data(), client_key.size());
        if (err == SyncError::ConnectionClosed) return SyncError::Truncated;
        if (err != SyncError::None) return err;
    }

    if (!is_valid_utf8(client_key.data(), client_key.size())) {
        audit_log_level(LogLevel::WARN,
            "Handshake rejected: key is not UTF-8",
            "handshake",
            "failure");
        return SyncError::BadHandshake;
    }

    if (!key.equals(client_key.data(), client_key.size())) {
        audit_log_level(LogLevel::WARN,
            "Key mismatch",
            "handshake",
            "failure");
        return SyncError::AuthFailed;
    }

    audit_log_level(LogLevel::DEBUG,
        "Client key accepted",
        "handshake",
        "success");
    return SyncError::None;
}

// Reads from the socket but gives up once the deadline passes, however
// slowly the peer trickles bytes in.
class DeadlineReader : public ByteSource {
public:
    DeadlineReader(SocketStream& stream, int timeout_ms)
        : stream_(stream),
          deadline_(std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms))
    {
    }

    SyncError read_exact(byte* buf, size_t len) override {
        size_t got = 0;
        while (got < len) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline_ - std::chrono::steady_clock::now()).count();
            if (left <= 0) return SyncError::Timeout;

            pollfd pfd{};
            pfd.fd = stream_.fd();
            pfd.events = POLLIN;
            int pr = poll(&pfd, 1, static_cast<int>(left));
            if (pr < 0) {
                if (errno == EINTR) continue;
                return SyncError::Io;
            }
            if (pr == 0) return SyncError::Timeout;

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
                "recv failed during handshake: " + errno_str(errno),
                "handshake",
                "failure");
            return SyncError::Io;
        }
        return SyncError::None;
    }

private:
    SocketStream& stream_;
    std::chrono::steady_clock::time_point deadline_;
};

SyncError accept_handshake(SocketStream& stream, const SecureBuffer& key, int timeout_ms) {
    DeadlineReader reader(stream, timeout_ms);
    SyncError err = verify_handshake(reader, key);
    if (err == SyncError::Timeout) {
        audit_log_level(LogLevel::WARN,
            "Handshake not completed within " + std::to_string(timeout_ms) + " ms",
            "handshake",
            "failure");
    }
    if (err != SyncError::None) {
        stream.shutdown_write();
    }
    return err;
}
