#pragma once
#include "clipshare_common.hpp"
#include "clipboard.hpp"

#include <condition_variable>

// Turns a polled OS clipboard into a stream of changes shared by every
// session. Each caller of paste() keeps its own generation cursor, so
// concurrent sessions all see each change.
class ClipboardAdapter {
public:
    // Does not touch the OS clipboard; current contents count as generation 1.
    static std::shared_ptr<ClipboardAdapter> create(
        std::shared_ptr<ClipboardBackend> backend,
        int poll_interval_ms = POLL_INTERVAL_MS);

    // Empties the OS clipboard first. Throws std::runtime_error if it can't.
    static std::shared_ptr<ClipboardAdapter> cleared(
        std::shared_ptr<ClipboardBackend> backend,
        int poll_interval_ms = POLL_INTERVAL_MS);

    ~ClipboardAdapter();

    ClipboardAdapter(const ClipboardAdapter&) = delete;
    ClipboardAdapter& operator=(const ClipboardAdapter&) = delete;

    uint64_t generation() const;

    // Blocks until a change newer than 'cursor' that this adapter did not
    // write itself. Advances 'cursor'. Returns Cancelled once 'cancel' is
    // set and interrupt() is called (or the next poll tick passes).
    SyncError paste(uint64_t& cursor, ClipboardObject& out, const std::atomic<bool>& cancel);

    // Writes obj to the OS clipboard without it surfacing from paste().
    SyncError copy(const ClipboardObject& obj);

    // Wakes blocked paste() callers so they re-check their cancel flags.
    void interrupt();

private:
    ClipboardAdapter(std::shared_ptr<ClipboardBackend> backend, int poll_interval_ms);

    void start();
    void poll_loop();
    void poll_once();

    std::shared_ptr<ClipboardBackend> backend_;
    const int poll_interval_ms_;

    std::mutex io_mutex_; // serializes backend reads and writes; taken before mutex_

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::condition_variable stop_cv_;
    ClipboardObject fingerprint_;
    bool has_fingerprint_ = false;
    uint64_t generation_ = 0;
    bool self_written_ = false; // latest generation came from copy()
    bool unavailable_ = false;
    bool stopping_ = false;

    std::thread poller_;
};
