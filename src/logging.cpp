#include "logging.hpp"
#include "util.hpp"

#include <sys/stat.h>

thread_local LogContext g_log_ctx;

static std::mutex g_log_mutex;
static std::string g_log_path; // guarded by g_log_mutex
static std::atomic<int> g_log_threshold{ static_cast<int>(LogLevel::INFO) };


// ---------------- Global logging configuration ----------------
void init_log_context(const std::string& role) {
    g_log_ctx.role = role;
    g_log_ctx.sessionId = generate_session_id();
    g_log_ctx.ip = "-";
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
}

void set_log_threshold(LogLevel lvl) {
    g_log_threshold.store(static_cast<int>(lvl));
}

bool log_enabled(LogLevel lvl) {
    return static_cast<int>(lvl) >= g_log_threshold.load();
}


// ---------------- Logging (levels) ----------------
const char* log_level_str(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::TRACE: return "TRACE";
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}

void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    if (!log_enabled(lvl)) return;

    // timestamp
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char tbuf[64];
    if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        std::strncpy(tbuf, "0000-00-00 00:00:00", sizeof(tbuf));
        tbuf[sizeof(tbuf) - 1] = '\0';
    }

    // sanitize message fields to avoid newlines in log entries
    auto sanitize = [](const std::string& s) {
        std::string r = s;
        for (char& c : r) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        return r;
        };

    std::string s_entry = sanitize(entry);
    std::string s_event = sanitize(event);
    std::string s_outcome = sanitize(outcome);

    const char* role = g_log_ctx.role.empty() ? "-" : g_log_ctx.role.c_str();
    const char* ip = g_log_ctx.ip.empty() ? "-" : g_log_ctx.ip.c_str();
    const char* session = g_log_ctx.sessionId.empty() ? "-" : g_log_ctx.sessionId.c_str();

    std::lock_guard<std::mutex> lock(g_log_mutex);

    FILE* f = stderr;
    bool own_file = false;
    if (!g_log_path.empty()) {
        f = std::fopen(g_log_path.c_str(), "a");
        if (!f) {
            std::fprintf(stderr, "[log-fail] %s: %s\n",
                log_level_str(lvl),
                s_entry.c_str());
            return;
        }
        own_file = true;
        fchmod(fileno(f), S_IRUSR | S_IWUSR);
    }

    // timestamp | level | role | ip | session | event | outcome | message
    std::fprintf(
        f,
        "%s | %s | role=%s | ip=%s | session=%s | event=%s | outcome=%s | %s\n",
        tbuf,
        log_level_str(lvl),
        role,
        ip,
        session,
        s_event.c_str(),
        s_outcome.c_str(),
        s_entry.c_str()
    );

    std::fflush(f);
    if (own_file) {
        std::fclose(f);
    }
}
