#pragma once
#include "clipshare_common.hpp"
#include "stream.hpp"

// -------- Frame codec --------
// frame := tag:u8 len:u64be payload[len]

// Header plus payload in one buffer, so a frame goes out as a single burst
std::vector<byte> encode_frame(uint8_t tag, const byte* payload, size_t len);

bool is_clipboard_tag(uint8_t tag);

// Writes one frame and flushes
SyncError write_frame(const ClipboardObject& obj, ByteSink& sink);

// Reads exactly one frame. Unknown tags are rejected right after the tag
// byte; oversized lengths right after the 9 header bytes.
SyncError read_frame(ByteSource& source, ClipboardObject& out);
