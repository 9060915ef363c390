#pragma once
#include "clipshare_common.hpp"
#include "stream.hpp"
#include "secure_buffer.hpp"

// -------- Shared-secret handshake --------
// handshake := 0x00 len:u64be secret[len], client -> server, once.

// Client side: writes the handshake frame and flushes
SyncError send_handshake(ByteSink& sink, const SecureBuffer& key);

// Server side, stream-agnostic: checks the first byte before reading
// anything else. Returns BadHandshake or AuthFailed on rejection.
SyncError verify_handshake(ByteSource& source, const SecureBuffer& key);

// Server side over a socket: runs verify_handshake under the handshake
// deadline and shuts the write half down when the peer is rejected.
SyncError accept_handshake(SocketStream& stream, const SecureBuffer& key,
    int timeout_ms = HANDSHAKE_TIMEOUT_MS);
