#include "clipboard_adapter.hpp"
#include "logging.hpp"

#include <stdexcept>

ClipboardAdapter::ClipboardAdapter(std::shared_ptr<ClipboardBackend> backend, int poll_interval_ms)
    : backend_(std::move(backend)),
      poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : POLL_INTERVAL_MS)
{
}

std::shared_ptr<ClipboardAdapter> ClipboardAdapter::create(
    std::shared_ptr<ClipboardBackend> backend,
    int poll_interval_ms)
{
    std::shared_ptr<ClipboardAdapter> a(new ClipboardAdapter(std::move(backend), poll_interval_ms));

    ClipboardObject current;
    bool has_content = false;
    if (a->backend_->read(current, has_content) != SyncError::None) {
        audit_log_level(LogLevel::WARN,
            "Initial clipboard read failed",
            "clipboard_adapter",
            "failure");
    }
    else if (has_content) {
        // pre-existing contents are the first change
        a->fingerprint_ = std::move(current);
        a->has_fingerprint_ = true;
        a->generation_ = 1;
    }

    a->start();
    return a;
}

std::shared_ptr<ClipboardAdapter> ClipboardAdapter::cleared(
    std::shared_ptr<ClipboardBackend> backend,
    int poll_interval_ms)
{
    std::shared_ptr<ClipboardAdapter> a(new ClipboardAdapter(std::move(backend), poll_interval_ms));

    ClipboardObject empty = ClipboardObject::text("");
    if (a->backend_->write(empty) != SyncError::None) {
        audit_log_level(LogLevel::ERROR,
            "Could not clear the clipboard",
            "clipboard_adapter",
            "failure");
        throw std::runtime_error("clipboard unavailable");
    }
    a->fingerprint_ = std::move(empty);
    a->has_fingerprint_ = true;

    a->start();
    return a;
}

ClipboardAdapter::~ClipboardAdapter() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    changed_.notify_all();
    if (poller_.joinable()) {
        poller_.join();
    }
}

void ClipboardAdapter::start() {
    poller_ = std::thread(&ClipboardAdapter::poll_loop, this);
}

uint64_t ClipboardAdapter::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}


// ---------------- Change detection ----------------
void ClipboardAdapter::poll_loop() {
    for (;;) {
        poll_once();

        std::unique_lock<std::mutex> lock(mutex_);
        stop_cv_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_),
            [this] { return stopping_; });
        if (stopping_) break;
    }
}

void ClipboardAdapter::poll_once() {
    std::lock_guard<std::mutex> io(io_mutex_);

    ClipboardObject current;
    bool has_content = false;
    SyncError err = backend_->read(current, has_content);

    std::lock_guard<std::mutex> lock(mutex_);
    if (err != SyncError::None) {
        if (!unavailable_) {
            audit_log_level(LogLevel::WARN,
                std::string("Clipboard poll failed: ") + sync_error_str(err),
                "clipboard_adapter",
                "failure");
        }
        unavailable_ = true;
        changed_.notify_all();
        return;
    }
    unavailable_ = false;

    if (!has_content) return;

    // copy() stores its value here before writing, so our own writes match
    if (has_fingerprint_ && current == fingerprint_) return;

    fingerprint_ = std::move(current);
    has_fingerprint_ = true;
    ++generation_;
    self_written_ = false;

    audit_log_level(LogLevel::TRACE,
        "Clipboard changed (" + std::to_string(fingerprint_.data.size()) + " bytes)",
        "clipboard_adapter",
        "notify");
    changed_.notify_all();
}


// ---------------- paste / copy ----------------
SyncError ClipboardAdapter::paste(uint64_t& cursor, ClipboardObject& out, const std::atomic<bool>& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (cancel.load() || stopping_) return SyncError::Cancelled;
        if (unavailable_) return SyncError::ClipboardUnavailable;

        if (generation_ > cursor) {
            cursor = generation_;
            if (!self_written_) {
                out = fingerprint_;
                return SyncError::None;
            }
        }

        // bounded so a missed interrupt() costs at most one tick
        changed_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_));
    }
}

SyncError ClipboardAdapter::copy(const ClipboardObject& obj) {
    std::lock_guard<std::mutex> io(io_mutex_);
    {
        // fingerprint first, so the poller can't mistake the write for a change
        std::lock_guard<std::mutex> lock(mutex_);
        if (has_fingerprint_ && obj == fingerprint_) {
            return SyncError::None;
        }
        fingerprint_ = obj;
        has_fingerprint_ = true;
        ++generation_;
        self_written_ = true;
    }

    SyncError err = backend_->write(obj);
    if (err != SyncError::None) {
        return err;
    }

    audit_log_level(LogLevel::TRACE,
        "Clipboard set (" + std::to_string(obj.data.size()) + " bytes)",
        "clipboard_adapter",
        "notify");
    return SyncError::None;
}

void ClipboardAdapter::interrupt() {
    // a paster that already checked its flag is waiting by the time we get the lock
    { std::lock_guard<std::mutex> lock(mutex_); }
    changed_.notify_all();
}
