#include "clipboard.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <unistd.h>
#include <sys/wait.h>

// exit status the child reports when the tool could not be started
static constexpr int EXEC_FAILED = 127;

// ---------------- Cross-platform clipboard helpers ----------------
static pid_t spawn_with_pipe(const std::vector<const char*>& argv,
    int child_fd,
    int pipefd[2])
{
    // built before fork: the child of a threaded process must not allocate
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto p : argv) args.push_back(const_cast<char*>(p));
    args.push_back(nullptr);

    if (pipe2(pipefd, O_CLOEXEC) != 0) return -1;

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return -1;
    }

    if (pid == 0) {
        // child: stdin <- read end, or stdout -> write end
        int end = (child_fd == STDIN_FILENO) ? pipefd[0] : pipefd[1];
        dup2(end, child_fd);
        execvp(args[0], args.data());
        _exit(EXEC_FAILED);
    }
    return pid;
}

static int wait_exit_status(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (!WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
}

static int run_writer_with_stdin(const std::vector<const char*>& argv,
    const std::string& input)
{
    int pipefd[2];
    pid_t pid = spawn_with_pipe(argv, STDIN_FILENO, pipefd);
    if (pid < 0) return -1;

    // parent: write input
    close(pipefd[0]);
    size_t remaining = input.size();
    const char* ptr = input.data();

    while (remaining > 0) {
        ssize_t w = write(pipefd[1], ptr, remaining);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) break;
        ptr += w;
        remaining -= static_cast<size_t>(w);
    }
    close(pipefd[1]);

    return wait_exit_status(pid);
}

static int run_reader_to_string(const std::vector<const char*>& argv,
    std::string& out,
    bool& overflow)
{
    overflow = false;
    int pipefd[2];
    pid_t pid = spawn_with_pipe(argv, STDOUT_FILENO, pipefd);
    if (pid < 0) return -1;

    // parent: read from pipe
    close(pipefd[1]);
    std::string s;
    char buf[4096];
    ssize_t r;

    for (;;) {
        r = read(pipefd[0], buf, sizeof(buf));
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) break;
        if (s.size() + static_cast<size_t>(r) > MAX_CLIPBOARD_READ) {
            // cannot be framed anyway; drain and report
            overflow = true;
            continue;
        }
        s.append(buf, buf + r);
    }
    close(pipefd[0]);

    int status = wait_exit_status(pid);
    if (status == 0 && !overflow) {
        out = std::move(s);
    }
    return status;
}


// ---------------- SystemClipboard ----------------
SystemClipboard::SystemClipboard() {
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    wayland_ = (wayland && *wayland);
}

SyncError SystemClipboard::list_types(std::vector<std::string>& types) {
    std::vector<const char*> cmd;
    if (wayland_) {
        cmd = { "wl-paste", "--list-types" };
    }
    else {
        cmd = { "xclip", "-selection", "clipboard", "-t", "TARGETS", "-o" };
    }

    std::string listing;
    bool overflow = false;
    int status = run_reader_to_string(cmd, listing, overflow);
    if (status < 0 || status == EXEC_FAILED) {
        return SyncError::ClipboardUnavailable;
    }
    types.clear();
    if (status != 0) {
        return SyncError::None; // nothing copied
    }

    std::istringstream iss(listing);
    std::string line;
    while (std::getline(iss, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (!line.empty()) types.push_back(line);
    }
    return SyncError::None;
}

SyncError SystemClipboard::read(ClipboardObject& out, bool& has_content) {
    has_content = false;

    std::vector<std::string> types;
    SyncError err = list_types(types);
    if (err != SyncError::None) {
        audit_log_level(LogLevel::WARN,
            "clipboard read: external tool failed to start",
            "clipboard_module",
            "failure");
        return err;
    }
    if (types.empty()) {
        return SyncError::None;
    }

    auto offers = [&types](const char* t) {
        return std::find(types.begin(), types.end(), t) != types.end();
        };
    bool text = offers("UTF8_STRING") || offers("STRING") || offers("TEXT") ||
        offers("text/plain") || offers("text/plain;charset=utf-8");
    bool image = !text && offers("image/png");

    std::vector<const char*> cmd;
    if (wayland_) {
        if (image) cmd = { "wl-paste", "--no-newline", "--type", "image/png" };
        else       cmd = { "wl-paste", "--no-newline" };
    }
    else {
        if (image) cmd = { "xclip", "-selection", "clipboard", "-t", "image/png", "-o" };
        else       cmd = { "xclip", "-selection", "clipboard", "-o" };
    }

    std::string data;
    bool overflow = false;
    int status = run_reader_to_string(cmd, data, overflow);
    if (status < 0 || status == EXEC_FAILED) {
        audit_log_level(LogLevel::WARN,
            "clipboard read: external tool failed",
            "clipboard_module",
            "failure");
        return SyncError::ClipboardUnavailable;
    }
    if (overflow) {
        audit_log_level(LogLevel::WARN,
            "clipboard read: contents exceed frame limit, ignored",
            "clipboard_module",
            "failure");
        return SyncError::None;
    }
    if (status != 0) {
        // owner vanished between the two calls
        return SyncError::None;
    }

    out = image ? ClipboardObject::image(std::move(data))
        : ClipboardObject::text(std::move(data));
    has_content = true;
    return SyncError::None;
}

SyncError SystemClipboard::write(const ClipboardObject& obj) {
    bool image = (obj.kind == ClipboardKind::Image);
    std::vector<const char*> cmd;
    if (wayland_) {
        if (image) cmd = { "wl-copy", "--type", "image/png" };
        else       cmd = { "wl-copy" };
    }
    else {
        if (image) cmd = { "xclip", "-selection", "clipboard", "-t", "image/png" };
        else       cmd = { "xclip", "-selection", "clipboard" };
    }

    int status = run_writer_with_stdin(cmd, obj.data);
    if (status != 0) {
        audit_log_level(LogLevel::WARN,
            "clipboard write: external tool failed",
            "clipboard_module",
            "failure");
        return SyncError::ClipboardUnavailable;
    }
    return SyncError::None;
}

std::shared_ptr<ClipboardBackend> make_system_clipboard() {
    return std::make_shared<SystemClipboard>();
}

