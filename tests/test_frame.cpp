#include <catch2/catch.hpp>

#include "frame.hpp"
#include "test_support.hpp"

TEST_CASE("Text frame is tag, big-endian length, payload in one flushed write", "[frame]") {
    MemorySink sink;
    REQUIRE(write_frame(ClipboardObject::text("hello"), sink) == SyncError::None);

    std::string expected("\x01\x00\x00\x00\x00\x00\x00\x00\x05hello", 14);
    REQUIRE(sink.data == expected);
    REQUIRE(sink.writes == 1);
    REQUIRE(sink.flushes == 1);
}

TEST_CASE("Frames decode back to the object that was written", "[frame]") {
    const std::string utf8 = u8"Hello, мир 🌟";
    std::string png("\x89PNG\r\n\x1a\n\x00\x00\x00\x0dIHDR", 16);

    MemorySink sink;
    REQUIRE(write_frame(ClipboardObject::text(utf8), sink) == SyncError::None);
    REQUIRE(write_frame(ClipboardObject::image(png), sink) == SyncError::None);
    REQUIRE(write_frame(ClipboardObject::text(""), sink) == SyncError::None);

    MemorySource src(sink.data);
    ClipboardObject a, b, c;
    REQUIRE(read_frame(src, a) == SyncError::None);
    REQUIRE(read_frame(src, b) == SyncError::None);
    REQUIRE(read_frame(src, c) == SyncError::None);

    REQUIRE(a == ClipboardObject::text(utf8));
    REQUIRE(b == ClipboardObject::image(png));
    REQUIRE(b.kind == ClipboardKind::Image);
    REQUIRE(c == ClipboardObject::text(""));

    ClipboardObject d;
    REQUIRE(read_frame(src, d) == SyncError::ConnectionClosed);
}

TEST_CASE("A frame consumes exactly its declared payload", "[frame]") {
    std::string wire = raw_frame(1, "abc") + raw_frame(1, "defgh");
    MemorySource src(wire);

    ClipboardObject obj;
    REQUIRE(read_frame(src, obj) == SyncError::None);
    REQUIRE(obj.data == "abc");
    REQUIRE(src.consumed() == FRAME_HEADER_LEN + 3);

    REQUIRE(read_frame(src, obj) == SyncError::None);
    REQUIRE(obj.data == "defgh");
    REQUIRE(src.consumed() == wire.size());
}

TEST_CASE("Unknown tags are rejected right after the tag byte", "[frame]") {
    SECTION("reserved tag") {
        MemorySource src(raw_frame(7, "zzz"));
        ClipboardObject obj;
        REQUIRE(read_frame(src, obj) == SyncError::UnknownTag);
        REQUIRE(src.consumed() == 1);
    }
    SECTION("handshake tag inside the data stream") {
        MemorySource src(raw_frame(0, "key"));
        ClipboardObject obj;
        REQUIRE(read_frame(src, obj) == SyncError::UnknownTag);
        REQUIRE(is_protocol_error(SyncError::UnknownTag));
    }
}

TEST_CASE("Oversized length stops after the 9 header bytes", "[frame]") {
    std::string wire = std::string("\x01", 1) + be64(1ull << 40) + std::string(64, 'x');
    MemorySource src(wire);

    ClipboardObject obj;
    REQUIRE(read_frame(src, obj) == SyncError::OversizedFrame);
    REQUIRE(src.consumed() == 9);
}

TEST_CASE("Short reads are reported as truncation", "[frame]") {
    ClipboardObject obj;

    SECTION("nothing at all is an orderly close") {
        MemorySource src("");
        REQUIRE(read_frame(src, obj) == SyncError::ConnectionClosed);
    }
    SECTION("tag without length") {
        MemorySource src(std::string("\x01", 1));
        REQUIRE(read_frame(src, obj) == SyncError::Truncated);
    }
    SECTION("partial length") {
        MemorySource src(std::string("\x01\x00\x00", 3));
        REQUIRE(read_frame(src, obj) == SyncError::Truncated);
    }
    SECTION("partial payload") {
        std::string wire = raw_frame(1, "hello");
        wire.resize(wire.size() - 2);
        MemorySource src(wire);
        REQUIRE(read_frame(src, obj) == SyncError::Truncated);
    }
}

TEST_CASE("encode_frame uses a 64-bit length regardless of platform", "[frame]") {
    const byte payload[] = { 'k', 'e', 'y' };
    std::vector<byte> buf = encode_frame(HANDSHAKE_TAG, payload, sizeof(payload));

    REQUIRE(buf.size() == 12);
    REQUIRE(buf[0] == 0);
    for (int i = 1; i < 8; ++i) REQUIRE(buf[i] == 0);
    REQUIRE(buf[8] == 3);
    REQUIRE(buf[9] == 'k');
}
