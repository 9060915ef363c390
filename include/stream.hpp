#pragma once
#include "clipshare_common.hpp"
#include "socket_guard.hpp"

// -------- Abstract byte stream --------

// read_exact reports ConnectionClosed when the stream ended before the
// first byte, Truncated when it ended part way.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual SyncError read_exact(byte* buf, size_t len) = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual SyncError write_all(const byte* buf, size_t len) = 0;
    virtual SyncError flush() { return SyncError::None; }
};


// -------- TCP stream split into halves --------
class SocketStream;

class SocketReader : public ByteSource {
public:
    explicit SocketReader(SocketStream& s) : stream_(s) {}
    SyncError read_exact(byte* buf, size_t len) override;
private:
    SocketStream& stream_;
};

class SocketWriter : public ByteSink {
public:
    explicit SocketWriter(SocketStream& s) : stream_(s) {}
    SyncError write_all(const byte* buf, size_t len) override;
private:
    SocketStream& stream_;
};

class SocketStream {
public:
    explicit SocketStream(SocketGuard sock);

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    int fd() const { return sock_.get(); }

    SocketReader& reader() { return reader_; }
    SocketWriter& writer() { return writer_; }

    void shutdown_write();
    // Releases any thread blocked on either half
    void shutdown_both();

    std::string peer_ip() const;

private:
    SocketGuard sock_;
    SocketReader reader_;
    SocketWriter writer_;
};
