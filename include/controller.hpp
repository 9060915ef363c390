#pragma once
#include "clipshare_common.hpp"
#include "clipboard_adapter.hpp"
#include "config.hpp"
#include "secure_buffer.hpp"
#include "session.hpp"
#include "stream.hpp"

// Server side of one connection: handshake (skipped when key is null),
// then the pump. A rejected handshake is reported with ended_by "handshake".
PumpResult serve_connection(SocketStream& stream,
    const std::shared_ptr<ClipboardAdapter>& adapter,
    const SecureBuffer* key);

// Client side of one connection: sends the key (unless null), then the pump.
PumpResult client_connection(SocketStream& stream,
    const std::shared_ptr<ClipboardAdapter>& adapter,
    const SecureBuffer* key);

// The server gives no explicit verdict; a peer that hangs up before any
// frame arrives within the handshake window is treated as a rejection.
bool looks_rejected(const PumpResult& r, std::chrono::milliseconds elapsed);

// Listens forever; returns only on setup failure.
int run_server(const Config& cfg,
    std::shared_ptr<ClipboardAdapter> adapter,
    std::shared_ptr<const SecureBuffer> key);

// One session, then returns the process exit status.
int run_client(const Config& cfg,
    std::shared_ptr<ClipboardAdapter> adapter,
    const SecureBuffer& key);
