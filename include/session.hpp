#pragma once
#include "clipshare_common.hpp"
#include "clipboard_adapter.hpp"
#include "stream.hpp"

#include <functional>

struct PumpResult {
    SyncError error = SyncError::None; // outcome of whichever loop ended first
    const char* ended_by = "";         // "send", "recv" or "start"
    uint64_t frames_sent = 0;
    uint64_t frames_received = 0;
};

using ThreadSpawner = std::thread (*)(std::function<void()>);

// std::thread, may throw std::system_error
std::thread spawn_thread(std::function<void()> fn);

// Runs the send loop (clipboard -> socket) and the recv loop (socket ->
// clipboard) until either ends, then cancels the other and returns the
// first outcome. The stream is shut down on return. If a loop thread
// can't be started the result is Io, ended by "start".
PumpResult run_pump(SocketStream& stream, const std::shared_ptr<ClipboardAdapter>& adapter,
    ThreadSpawner spawn = spawn_thread);
