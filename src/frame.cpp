#include "frame.hpp"
#include "logging.hpp"
#include "util.hpp"

std::vector<byte> encode_frame(uint8_t tag, const byte* payload, size_t len) {
    std::vector<byte> buf(FRAME_HEADER_LEN + len);
    buf[0] = tag;
    put_u64_be(static_cast<uint64_t>(len), &buf[1]);
    if (len > 0) {
        std::memcpy(buf.data() + FRAME_HEADER_LEN, payload, len);
    }
    return buf;
}

bool is_clipboard_tag(uint8_t tag) {
    return tag == static_cast<uint8_t>(ClipboardKind::Text) ||
        tag == static_cast<uint8_t>(ClipboardKind::Image);
}

SyncError write_frame(const ClipboardObject& obj, ByteSink& sink) {
    if (obj.data.size() > MAX_FRAME_LEN) {
        audit_log_level(LogLevel::WARN,
            "write_frame: payload of " + std::to_string(obj.data.size()) + " bytes exceeds frame limit",
            "frame_codec",
            "failure");
        return SyncError::OversizedFrame;
    }

    std::vector<byte> buf = encode_frame(static_cast<uint8_t>(obj.kind),
        reinterpret_cast<const byte*>(obj.data.data()),
        obj.data.size());

    SyncError err = sink.write_all(buf.data(), buf.size());
    if (err != SyncError::None) return err;
    err = sink.flush();
    if (err != SyncError::None) return err;

    audit_log_level(LogLevel::TRACE,
        "Sent frame tag=" + std::to_string(static_cast<int>(obj.kind)) +
        " len=" + std::to_string(obj.data.size()),
        "frame_codec",
        "success");
    return SyncError::None;
}

SyncError read_frame(ByteSource& source, ClipboardObject& out) {
    byte tag = 0;
    SyncError err = source.read_exact(&tag, 1);
    if (err != SyncError::None) return err;

    if (!is_clipboard_tag(tag)) {
        audit_log_level(LogLevel::DEBUG,
            "read_frame: unknown tag " + std::to_string(static_cast<int>(tag)),
            "frame_codec",
            "failure");
        return SyncError::UnknownTag;
    }

    byte lenbuf[8];
    err = source.read_exact(lenbuf, sizeof(lenbuf));
    if (err == SyncError::ConnectionClosed) return SyncError::Truncated;
    if (err != SyncError::None) return err;

    uint64_t len = get_u64_be(lenbuf);
    if (len > MAX_FRAME_LEN) {
        audit_log_level(LogLevel::DEBUG,
            "read_frame: declared length " + std::to_string(len) + " exceeds limit",
            "frame_codec",
            "failure");
        return SyncError::OversizedFrame;
    }

    std::string payload(static_cast<size_t>(len), '\0');
    if (len > 0) {
        err = source.read_exact(reinterpret_cast<byte*>(&payload[0]), payload.size());
        if (err == SyncError::ConnectionClosed) return SyncError::Truncated;
        if (err != SyncError::None) return err;
    }

    out.kind = static_cast<ClipboardKind>(tag);
    out.data = std::move(payload);

    audit_log_level(LogLevel::TRACE,
        "Received frame tag=" + std::to_string(static_cast<int>(tag)) +
        " len=" + std::to_string(len),
        "frame_codec",
        "success");
    return SyncError::None;
}
