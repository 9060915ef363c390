#include "util.hpp"
#include "logging.hpp"

#include <array>
#include <cctype>


// ---------- SessionID ----------
std::string generate_session_id() {
    std::array<byte, 16> buf{};
    randombytes_buf(buf.data(), buf.size());

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(32);

    for (size_t i = 0; i < buf.size(); ++i) {
        out[2 * i] = hex[(buf[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[buf[i] & 0x0F];
    }
    return out;
}


// ---------- Helpers: input validation ----------
bool is_valid_utf8(const byte* p, size_t len) {
    size_t i = 0;
    while (i < len) {
        byte c = p[i];
        size_t n = 0;
        uint32_t cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07; }
        else return false;

        if (len - i <= n) return false;
        for (size_t k = 1; k <= n; ++k) {
            byte cc = p[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;
        i += n + 1;
    }
    return true;
}

bool is_valid_utf8(const std::string& s) {
    return is_valid_utf8(reinterpret_cast<const byte*>(s.data()), s.size());
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool parse_port(const std::string& s, uint16_t& out) {
    if (!is_all_digits(s) || s.size() > 5) return false;
    unsigned long v = std::strtoul(s.c_str(), nullptr, 10);
    if (v > 65535) return false;
    out = static_cast<uint16_t>(v);
    return true;
}


// ---------- Big-endian length field ----------
void put_u64_be(uint64_t v, byte out[8]) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<byte>(v & 0xFF);
        v >>= 8;
    }
}

uint64_t get_u64_be(const byte in[8]) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | in[i];
    }
    return v;
}


// ---------- Misc ----------
std::string errno_str(int err) {
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf
    const char* msg = strerror_r(err, buf, sizeof(buf));
    return std::string(msg ? msg : "unknown error");
}

const char* sync_error_str(SyncError e) {
    switch (e) {
    case SyncError::None:                 return "ok";
    case SyncError::ClipboardUnavailable: return "clipboard unavailable";
    case SyncError::BadHandshake:         return "protocol error: bad handshake";
    case SyncError::UnknownTag:           return "protocol error: unknown tag";
    case SyncError::OversizedFrame:       return "protocol error: oversized frame";
    case SyncError::Truncated:            return "protocol error: truncated frame";
    case SyncError::AuthFailed:           return "authentication failed";
    case SyncError::Io:                   return "i/o error";
    case SyncError::Timeout:              return "timed out";
    case SyncError::BadBeacon:            return "unexpected discovery payload";
    case SyncError::ConfigError:          return "configuration error";
    case SyncError::ConnectionClosed:     return "connection closed";
    case SyncError::Cancelled:            return "cancelled";
    default:                              return "unknown error";
    }
}
