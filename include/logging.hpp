#pragma once
#include "clipshare_common.hpp"

// -------- Logging (levels) --------
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR }; // levels

struct LogContext {
    std::string role;
    std::string sessionId;
    std::string ip;
};

// Each thread carries its own context; session threads copy their
// parent's and fill in the peer ip.
extern thread_local LogContext g_log_ctx;

// Initialize the calling thread's logging context
void init_log_context(const std::string& role);

// Empty path logs to stderr
void set_log_path(const std::string& path);
void set_log_threshold(LogLevel lvl);
bool log_enabled(LogLevel lvl);

const char* log_level_str(LogLevel lvl);

// Log with level, message, optional event + outcome
// audit_log_level(LogLevel::INFO, "Client connected", "session", "success");
void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);
