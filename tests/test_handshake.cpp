#include <catch2/catch.hpp>

#include "handshake.hpp"
#include "test_support.hpp"

TEST_CASE("Client handshake is a zero-tagged key frame", "[handshake]") {
    SecureBuffer key = SecureBuffer::from_string("s3cret");
    MemorySink sink;

    REQUIRE(send_handshake(sink, key) == SyncError::None);
    REQUIRE(sink.data == raw_frame(0, "s3cret"));
    REQUIRE(sink.flushes == 1);
}

TEST_CASE("Server accepts the matching key", "[handshake]") {
    SecureBuffer key = SecureBuffer::from_string("s3cret");
    MemorySource src(raw_frame(0, "s3cret") + raw_frame(1, "next"));

    REQUIRE(verify_handshake(src, key) == SyncError::None);
    REQUIRE(src.consumed() == FRAME_HEADER_LEN + 6);
}

TEST_CASE("Server rejects bad handshakes", "[handshake]") {
    SecureBuffer key = SecureBuffer::from_string("s3cret");

    SECTION("wrong key") {
        MemorySource src(raw_frame(0, "wrong"));
        REQUIRE(verify_handshake(src, key) == SyncError::AuthFailed);
    }
    SECTION("key that is a prefix of the real one") {
        MemorySource src(raw_frame(0, "s3c"));
        REQUIRE(verify_handshake(src, key) == SyncError::AuthFailed);
    }
    SECTION("first byte not zero, nothing else read") {
        MemorySource src(raw_frame(1, "s3cret"));
        REQUIRE(verify_handshake(src, key) == SyncError::BadHandshake);
        REQUIRE(src.consumed() == 1);
    }
    SECTION("key longer than 4 KiB") {
        MemorySource src(std::string(1, '\0') + be64(MAX_KEY_LEN + 1) + std::string(MAX_KEY_LEN + 1, 'a'));
        REQUIRE(verify_handshake(src, key) == SyncError::BadHandshake);
        REQUIRE(src.consumed() == 9);
    }
    SECTION("key that is not UTF-8") {
        MemorySource src(raw_frame(0, std::string("\xff\xfe", 2)));
        REQUIRE(verify_handshake(src, key) == SyncError::BadHandshake);
    }
    SECTION("stream ends inside the key") {
        std::string wire = raw_frame(0, "s3cret");
        wire.resize(wire.size() - 1);
        MemorySource src(wire);
        REQUIRE(verify_handshake(src, key) == SyncError::Truncated);
    }
}

TEST_CASE("Empty keys compare equal only to empty keys", "[handshake]") {
    SecureBuffer empty = SecureBuffer::from_string("");
    MemorySource ok(raw_frame(0, ""));
    REQUIRE(verify_handshake(ok, empty) == SyncError::None);

    MemorySource bad(raw_frame(0, "x"));
    REQUIRE(verify_handshake(bad, empty) == SyncError::AuthFailed);
}

TEST_CASE("Rejected peer sees its connection shut down", "[handshake]") {
    SocketGuard server_end, client_end;
    make_socket_pair(server_end, client_end);
    SecureBuffer key = SecureBuffer::from_string("s3cret");

    send_raw(client_end.get(), raw_frame(0, "wrong"));

    SocketStream stream(std::move(server_end));
    REQUIRE(accept_handshake(stream, key) == SyncError::AuthFailed);

    // write half is closed: the client reads EOF and no frame
    REQUIRE(drain(client_end.get()).empty());
}

TEST_CASE("Handshake gives up after its deadline", "[handshake]") {
    SocketGuard server_end, client_end;
    make_socket_pair(server_end, client_end);
    SecureBuffer key = SecureBuffer::from_string("s3cret");

    // a peer that sends part of the frame and then stalls
    send_raw(client_end.get(), std::string("\x00\x00\x00", 3));

    SocketStream stream(std::move(server_end));
    auto start = std::chrono::steady_clock::now();
    REQUIRE(accept_handshake(stream, key, 150) == SyncError::Timeout);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed >= std::chrono::milliseconds(140));
    REQUIRE(elapsed < std::chrono::seconds(2));
}
