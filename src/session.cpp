#include "session.hpp"
#include "frame.hpp"
#include "logging.hpp"

#include <condition_variable>
#include <system_error>

struct PumpState {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    PumpResult result;

    std::atomic<bool> cancel{ false };
    std::atomic<uint64_t> sent{ 0 };
    std::atomic<uint64_t> received{ 0 };

    // first caller wins; later outcomes are discarded
    void finish(SyncError err, const char* which) {
        std::lock_guard<std::mutex> lock(mutex);
        if (done) return;
        done = true;
        result.error = err;
        result.ended_by = which;
        done_cv.notify_all();
    }
};

static void send_loop(SocketStream& stream, ClipboardAdapter& adapter, PumpState& st) {
    uint64_t cursor = 0;
    SyncError err = SyncError::None;
    for (;;) {
        ClipboardObject obj;
        err = adapter.paste(cursor, obj, st.cancel);
        if (err != SyncError::None) break;

        err = write_frame(obj, stream.writer());
        if (err != SyncError::None) break;
        ++st.sent;
    }
    st.finish(err, "send");
}

static void recv_loop(SocketStream& stream, ClipboardAdapter& adapter, PumpState& st) {
    SyncError err = SyncError::None;
    for (;;) {
        ClipboardObject obj;
        err = read_frame(stream.reader(), obj);
        if (err != SyncError::None) break;
        ++st.received;

        err = adapter.copy(obj);
        if (err != SyncError::None) break;
    }
    st.finish(err, "recv");
}

std::thread spawn_thread(std::function<void()> fn) {
    return std::thread(std::move(fn));
}

PumpResult run_pump(SocketStream& stream, const std::shared_ptr<ClipboardAdapter>& adapter,
    ThreadSpawner spawn)
{
    PumpState st;
    LogContext ctx = g_log_ctx;

    std::thread sender;
    std::thread receiver;
    try {
        sender = spawn([&] {
            g_log_ctx = ctx;
            send_loop(stream, *adapter, st);
            });
        receiver = spawn([&] {
            g_log_ctx = ctx;
            recv_loop(stream, *adapter, st);
            });
    }
    catch (const std::system_error& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Cannot start session thread: ") + e.what(),
            "session",
            "failure");
        st.cancel = true;
        adapter->interrupt();
        stream.shutdown_both();
        if (sender.joinable()) sender.join();

        PumpResult failed;
        failed.error = SyncError::Io;
        failed.ended_by = "start";
        return failed;
    }

    {
        std::unique_lock<std::mutex> lock(st.mutex);
        st.done_cv.wait(lock, [&st] { return st.done; });
    }

    // release the loser: pending paste via the flag, pending I/O via shutdown
    st.cancel = true;
    adapter->interrupt();
    stream.shutdown_both();

    sender.join();
    receiver.join();

    PumpResult result;
    {
        std::lock_guard<std::mutex> lock(st.mutex);
        result = st.result;
    }
    result.frames_sent = st.sent.load();
    result.frames_received = st.received.load();

    audit_log_level(LogLevel::DEBUG,
        std::string("Pump ended by ") + result.ended_by + " loop: " + sync_error_str(result.error) +
        " (sent " + std::to_string(result.frames_sent) +
        ", received " + std::to_string(result.frames_received) + ")",
        "session",
        result.error == SyncError::ConnectionClosed ? "success" : "failure");
    return result;
}
