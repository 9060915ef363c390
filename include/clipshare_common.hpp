#pragma once

#include <sodium.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <string>
#include <vector>
#include <iostream>
#include <sstream>
#include <ctime>
#include <limits>
#include <algorithm>
#include <thread>
#include <chrono>
#include <atomic>
#include <mutex>
#include <memory>

// -------- Protocol constants --------
inline constexpr uint8_t HANDSHAKE_TAG = 0;
inline constexpr size_t FRAME_HEADER_LEN = 1 + sizeof(uint64_t);
inline constexpr uint64_t MAX_FRAME_LEN = 256ull * 1024 * 1024; // 256 MiB
inline constexpr uint64_t MAX_KEY_LEN = 4096;

inline constexpr const char* BEACON_MAGIC = "clipshare";
inline constexpr size_t BEACON_MAGIC_LEN = 9;

// -------- Timing --------
inline constexpr int HANDSHAKE_TIMEOUT_MS = 5000;
inline constexpr int DISCOVERY_TIMEOUT_MS = 5000;
inline constexpr int ACCEPT_BACKOFF_MS = 100;
inline constexpr int BEACON_INTERVAL_MS = 3000;
inline constexpr int POLL_INTERVAL_MS = 200;

// -------- Defaults --------
inline constexpr const char* DEFAULT_KEY = "clipshare";
inline constexpr const char* KEY_ENV = "CLIPSHARE_KEY";
inline constexpr const char* LOG_ENV = "CLIPSHARE_LOG";
inline constexpr size_t MAX_CLIPBOARD_READ = MAX_FRAME_LEN;

using byte = unsigned char;

// Wire tags double as the kind discriminant.
enum class ClipboardKind : uint8_t {
    Text = 1,
    Image = 2, // PNG bytes
};

struct ClipboardObject {
    ClipboardKind kind = ClipboardKind::Text;
    std::string data;

    static ClipboardObject text(std::string s) {
        return ClipboardObject{ ClipboardKind::Text, std::move(s) };
    }
    static ClipboardObject image(std::string png) {
        return ClipboardObject{ ClipboardKind::Image, std::move(png) };
    }

    bool operator==(const ClipboardObject& o) const {
        return kind == o.kind && data == o.data;
    }
    bool operator!=(const ClipboardObject& o) const { return !(*this == o); }
};

// -------- Errors --------
enum class SyncError {
    None,
    ClipboardUnavailable,
    BadHandshake,       // protocol
    UnknownTag,         // protocol
    OversizedFrame,     // protocol
    Truncated,          // protocol
    AuthFailed,
    Io,
    Timeout,
    BadBeacon,          // discovery datagram with the wrong payload
    ConfigError,
    ConnectionClosed,   // orderly end of stream at a frame boundary
    Cancelled,
};

inline bool is_protocol_error(SyncError e) {
    return e == SyncError::BadHandshake || e == SyncError::UnknownTag ||
        e == SyncError::OversizedFrame || e == SyncError::Truncated;
}

const char* sync_error_str(SyncError e);
